// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file rpc_sink.hpp
/// @brief Sink forwarding channel events to a collector over an RPC connection
///
/// Each process() call moves up to batch_size events in one channel
/// transaction:
///
///   begin -> verify connection -> take up to batch_size events
///         -> append_batch (skipped when nothing was taken) -> commit
///
/// Failures:
/// - ChannelError: rollback, return Backoff. The connection is kept.
/// - anything else (connect, send, ...): rollback, tear the connection down
///   and throw DeliveryError. The next call reconnects.
///
/// The transaction is closed on every path. Delivery is at-least-once: a send
/// that failed after the collector accepted the batch is repeated later.
///
/// Batches may be smaller than batch_size: when the channel runs dry the
/// events taken so far are sent immediately ("underflow"). Empty batches do
/// not cause an RPC round trip.
///
/// Counters: batch.success, batch.empty, batch.underflow.

#include "relay/channel.hpp"
#include "relay/connection_manager.hpp"
#include "relay/counter_group.hpp"
#include "relay/sink.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace relay {

/// Configuration for RpcSink
struct RpcSinkConfig {
    std::string name = "rpc-sink";
    std::string hostname;
    int port = 0;
    size_t batch_size = 100;
};

class RpcSink : public Sink {
public:
    static constexpr const char* kBatchSuccess = "batch.success";
    static constexpr const char* kBatchEmpty = "batch.empty";
    static constexpr const char* kBatchUnderflow = "batch.underflow";

    /// @param counters Recorder for batch counters; a private CounterGroup is
    ///                 created when null
    /// @throws ConfigError if channel or factory is null
    RpcSink(const RpcSinkConfig& config,
            std::shared_ptr<Channel> channel,
            std::shared_ptr<RpcClientFactory> factory,
            std::shared_ptr<CounterRecorder> counters = nullptr);
    ~RpcSink() override = default;

    RpcSink(const RpcSink&) = delete;
    RpcSink& operator=(const RpcSink&) = delete;

    /// Connect eagerly. A failure is logged; process() retries lazily.
    void start() override;

    /// Tear down the connection
    void stop() override;

    Status process() override;

    std::string name() const override { return config_.name; }

    /// Check whether a connection is currently held
    bool connected() const;

    const std::shared_ptr<CounterRecorder>& counters() const { return counters_; }

    /// "RpcSink <name> { host: <hostname>, port: <port> }"
    std::string to_string() const;

private:
    void rollback(Transaction& transaction);

    RpcSinkConfig config_;
    std::shared_ptr<Channel> channel_;
    std::shared_ptr<CounterRecorder> counters_;
    ConnectionManager connection_;

    mutable std::mutex mutex_;
};

}  // namespace relay
