// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file rpc_client.hpp
/// @brief Abstract interface for connections to a downstream event collector
///
/// RpcClient decouples the sink from the wire protocol. An instance represents
/// one open connection; it is created by an RpcClientFactory and owned by
/// exactly one holder, which is responsible for closing it.
///
/// Implementations:
/// - GrpcRpcClient: relay.rpc.EventCollector over gRPC

#include "relay/event.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace relay {

/// Statistics for an RPC client
struct RpcClientStats {
    uint64_t batches_sent = 0;
    uint64_t events_sent = 0;
    uint64_t bytes_sent = 0;
    uint64_t failures = 0;
    int64_t last_send_timestamp_ns = 0;
};

/// Open connection to a downstream collector
class RpcClient {
public:
    virtual ~RpcClient() = default;

    /// Check whether the connection is believed usable
    virtual bool is_active() const = 0;

    /// Deliver all events, in order. Either every event is accepted
    /// downstream, or RpcError is thrown.
    /// @throws RpcError on any delivery failure
    virtual void append_batch(const std::vector<Event>& events) = 0;

    /// Close the connection. Idempotent.
    /// @throws RpcError if the underlying close fails (callers log it)
    virtual void close() = 0;

    /// Maximum events per wire call
    virtual size_t batch_size() const = 0;

    /// Get statistics
    virtual RpcClientStats stats() const = 0;

    /// Get client description for logging
    virtual std::string name() const = 0;
};

/// Creates RpcClient connections
class RpcClientFactory {
public:
    virtual ~RpcClientFactory() = default;

    /// Open a connection to hostname:port
    /// @param batch_size Capacity hint: largest batch the caller will send
    /// @throws ConnectionError if the connection cannot be established
    virtual std::unique_ptr<RpcClient> connect(const std::string& hostname,
                                               int port,
                                               size_t batch_size) = 0;
};

}  // namespace relay
