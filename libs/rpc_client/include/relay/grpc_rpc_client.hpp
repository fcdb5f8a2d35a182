// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file grpc_rpc_client.hpp
/// @brief RpcClient over gRPC (relay.rpc.EventCollector)
///
/// The connection is established in the constructor: the client creates an
/// insecure channel and waits up to connect_timeout for it to become READY.
/// append_batch() splits its input into wire batches of batch_size events and
/// issues one AppendBatch call per wire batch, each with request_timeout as
/// deadline. The first failed call marks the client inactive.

#include "relay/batch_builder.hpp"
#include "relay/rpc_client.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include "relay/collector.grpc.pb.h"

namespace relay {

/// Configuration for the gRPC client
struct GrpcRpcClientConfig {
    std::string hostname = "localhost";
    int port = 41414;
    size_t batch_size = 100;
    std::chrono::milliseconds connect_timeout{20000};
    std::chrono::milliseconds request_timeout{20000};
    std::string source_id = "relay";
};

/// Build a gRPC target string ("host:port", "[v6addr]:port")
std::string make_grpc_target(const std::string& hostname, int port);

/// gRPC connection to an EventCollector
class GrpcRpcClient : public RpcClient {
public:
    /// Connect to config.hostname:config.port
    /// @throws ConnectionError if the channel is not READY within connect_timeout
    explicit GrpcRpcClient(const GrpcRpcClientConfig& config);
    ~GrpcRpcClient() override;

    GrpcRpcClient(const GrpcRpcClient&) = delete;
    GrpcRpcClient& operator=(const GrpcRpcClient&) = delete;

    bool is_active() const override;
    void append_batch(const std::vector<Event>& events) override;
    void close() override;
    size_t batch_size() const override { return config_.batch_size; }
    RpcClientStats stats() const override;
    std::string name() const override { return "grpc://" + target_; }

private:
    void send(const relay::rpc::EventBatch& batch);

    GrpcRpcClientConfig config_;
    std::string target_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<relay::rpc::EventCollector::Stub> stub_;
    EventBatchBuilder builder_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> failed_{false};

    mutable std::mutex stats_mutex_;
    RpcClientStats stats_;
};

/// Factory producing GrpcRpcClient connections
///
/// Timeouts and source_id come from the defaults given at construction;
/// hostname, port and batch_size from each connect() call.
class GrpcRpcClientFactory : public RpcClientFactory {
public:
    explicit GrpcRpcClientFactory(const GrpcRpcClientConfig& defaults = {});

    std::unique_ptr<RpcClient> connect(const std::string& hostname,
                                       int port,
                                       size_t batch_size) override;

private:
    GrpcRpcClientConfig defaults_;
};

}  // namespace relay
