// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file connection_manager.hpp
/// @brief Owns the single downstream connection of a sink
///
/// The manager holds at most one RpcClient. It is created lazily, checked for
/// liveness right before use, and closed and dropped when it fails or the
/// sink shuts down. The next use after a teardown reconnects transparently.
///
/// Not thread-safe: callers serialize access (RpcSink does so with its mutex).

#include "relay/rpc_client.hpp"

#include <memory>
#include <string>

namespace relay {

class ConnectionManager {
public:
    /// @throws ConfigError if factory is null
    ConnectionManager(std::shared_ptr<RpcClientFactory> factory,
                      const std::string& hostname,
                      int port,
                      size_t batch_size);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// Create a connection if none is held. No-op when one exists, healthy or not.
    /// @throws ConnectionError if the factory cannot connect; the slot stays empty
    void ensure_connected();

    /// Ensure a connection exists and reports itself active. An inactive
    /// connection is closed and replaced.
    /// @throws ConnectionError if a new connection cannot be opened
    void verify_connected();

    /// Close and drop the held connection, if any. Never throws.
    void teardown();

    /// Check whether a connection is held
    bool connected() const { return client_ != nullptr; }

    /// Held connection, or nullptr
    RpcClient* client() const { return client_.get(); }

    const std::string& hostname() const { return hostname_; }
    int port() const { return port_; }
    size_t batch_size() const { return batch_size_; }

private:
    std::shared_ptr<RpcClientFactory> factory_;
    std::string hostname_;
    int port_;
    size_t batch_size_;
    std::unique_ptr<RpcClient> client_;
};

}  // namespace relay
