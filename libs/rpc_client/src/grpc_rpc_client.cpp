// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "relay/grpc_rpc_client.hpp"
#include "relay/errors.hpp"

#include <glog/logging.h>

namespace relay {

namespace {

int64_t now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

std::string make_grpc_target(const std::string& hostname, int port) {
    // Bare IPv6 literals need brackets before the port
    if (hostname.find(':') != std::string::npos && hostname.front() != '[') {
        return "[" + hostname + "]:" + std::to_string(port);
    }
    return hostname + ":" + std::to_string(port);
}

// ============================================================================
// GrpcRpcClient
// ============================================================================

GrpcRpcClient::GrpcRpcClient(const GrpcRpcClientConfig& config)
    : config_(config)
    , target_(make_grpc_target(config.hostname, config.port))
    , builder_(config.source_id, config.batch_size) {
    if (config_.batch_size == 0) {
        throw ConnectionError("Invalid batch size 0 for " + target_);
    }

    channel_ = grpc::CreateChannel(target_, grpc::InsecureChannelCredentials());
    if (!channel_) {
        throw ConnectionError("Failed to create gRPC channel to " + target_);
    }

    auto deadline = std::chrono::system_clock::now() + config_.connect_timeout;
    if (!channel_->WaitForConnected(deadline)) {
        channel_.reset();
        throw ConnectionError("Failed to connect to " + target_ + " within " +
                              std::to_string(config_.connect_timeout.count()) + "ms");
    }

    stub_ = relay::rpc::EventCollector::NewStub(channel_);
    VLOG(1) << "GrpcRpcClient connected to " << target_
            << " (batch_size=" << config_.batch_size << ")";
}

GrpcRpcClient::~GrpcRpcClient() {
    close();
}

bool GrpcRpcClient::is_active() const {
    if (closed_ || failed_ || !channel_) {
        return false;
    }
    auto state = channel_->GetState(false);  // false = don't try to connect
    return state != GRPC_CHANNEL_TRANSIENT_FAILURE && state != GRPC_CHANNEL_SHUTDOWN;
}

void GrpcRpcClient::append_batch(const std::vector<Event>& events) {
    if (closed_) {
        throw RpcError("Attempt to append to closed client " + target_);
    }

    try {
        for (const auto& event : events) {
            builder_.add(event);
            if (builder_.full()) {
                send(builder_.build());
            }
        }
        if (builder_.ready()) {
            send(builder_.build());
        }
    } catch (const RpcError&) {
        builder_.reset();
        failed_ = true;
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.failures++;
        throw;
    }
}

void GrpcRpcClient::send(const relay::rpc::EventBatch& batch) {
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + config_.request_timeout);

    relay::rpc::AppendResponse response;
    grpc::Status status = stub_->AppendBatch(&context, batch, &response);

    if (!status.ok()) {
        throw RpcError("AppendBatch to " + target_ + " failed: " + status.error_message() +
                       " (code " + std::to_string(static_cast<int>(status.error_code())) + ")");
    }
    if (response.status() != relay::rpc::APPEND_STATUS_OK) {
        throw RpcError("Collector at " + target_ + " did not accept batch " +
                       std::to_string(batch.sequence()) + ": " +
                       relay::rpc::AppendStatus_Name(response.status()) +
                       (response.message().empty() ? "" : " (" + response.message() + ")"));
    }

    size_t bytes = batch.ByteSizeLong();
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.batches_sent++;
        stats_.events_sent += static_cast<uint64_t>(batch.events_size());
        stats_.bytes_sent += bytes;
        stats_.last_send_timestamp_ns = now_ns();
    }

    VLOG(2) << "Sent batch " << batch.sequence() << " to " << target_
            << " (" << batch.events_size() << " events, " << bytes << " bytes)";
}

void GrpcRpcClient::close() {
    if (closed_.exchange(true)) {
        return;
    }

    stub_.reset();
    channel_.reset();

    auto totals = stats();
    VLOG(1) << "GrpcRpcClient closed " << target_
            << " (batches=" << totals.batches_sent
            << ", events=" << totals.events_sent
            << ", failures=" << totals.failures << ")";
}

RpcClientStats GrpcRpcClient::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

// ============================================================================
// GrpcRpcClientFactory
// ============================================================================

GrpcRpcClientFactory::GrpcRpcClientFactory(const GrpcRpcClientConfig& defaults)
    : defaults_(defaults) {
}

std::unique_ptr<RpcClient> GrpcRpcClientFactory::connect(const std::string& hostname,
                                                         int port,
                                                         size_t batch_size) {
    GrpcRpcClientConfig config = defaults_;
    config.hostname = hostname;
    config.port = port;
    config.batch_size = batch_size;
    return std::make_unique<GrpcRpcClient>(config);
}

}  // namespace relay
