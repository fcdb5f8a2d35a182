// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "relay/rpc_sink.hpp"
#include "relay/errors.hpp"

#include <glog/logging.h>

#include <utility>
#include <vector>

namespace relay {

namespace {

/// Closes a transaction when leaving scope, whatever the exit path.
/// Close failures are logged so they never replace the primary error.
class TransactionCloser {
public:
    TransactionCloser(Transaction& transaction, const std::string& sink_name)
        : transaction_(transaction), sink_name_(sink_name) {}

    ~TransactionCloser() {
        try {
            transaction_.close();
        } catch (const std::exception& e) {
            LOG(ERROR) << "RpcSink " << sink_name_ << ": failed to close transaction: "
                       << e.what();
        }
    }

    TransactionCloser(const TransactionCloser&) = delete;
    TransactionCloser& operator=(const TransactionCloser&) = delete;

private:
    Transaction& transaction_;
    const std::string& sink_name_;
};

}  // namespace

const char* to_string(Status status) {
    switch (status) {
        case Status::Ready: return "READY";
        case Status::Backoff: return "BACKOFF";
    }
    return "UNKNOWN";
}

RpcSink::RpcSink(const RpcSinkConfig& config,
                 std::shared_ptr<Channel> channel,
                 std::shared_ptr<RpcClientFactory> factory,
                 std::shared_ptr<CounterRecorder> counters)
    : config_(config)
    , channel_(std::move(channel))
    , counters_(counters ? std::move(counters) : std::make_shared<CounterGroup>(config.name))
    , connection_(std::move(factory), config.hostname, config.port, config.batch_size) {
    if (!channel_) {
        throw ConfigError("RpcSink " + config_.name + ": no channel given");
    }
}

void RpcSink::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG(INFO) << "Starting " << to_string() << "...";

    try {
        connection_.ensure_connected();
    } catch (const std::exception& e) {
        LOG(WARNING) << "Unable to create RPC client using hostname: " << config_.hostname
                     << ", port: " << config_.port << ", batch_size: " << config_.batch_size
                     << ": " << e.what();
        connection_.teardown();
    }

    LOG(INFO) << "RpcSink " << config_.name << " started.";
}

void RpcSink::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG(INFO) << "RpcSink " << config_.name << " stopping...";
    connection_.teardown();
    if (auto group = std::dynamic_pointer_cast<CounterGroup>(counters_)) {
        LOG(INFO) << "RpcSink " << config_.name << " stopped. Metrics: " << *group;
    } else {
        LOG(INFO) << "RpcSink " << config_.name << " stopped.";
    }
}

bool RpcSink::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_.connected();
}

std::string RpcSink::to_string() const {
    return "RpcSink " + config_.name + " { host: " + config_.hostname +
           ", port: " + std::to_string(config_.port) + " }";
}

Status RpcSink::process() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::unique_ptr<Transaction> transaction;
    try {
        transaction = channel_->transaction();
    } catch (const ChannelError& e) {
        LOG(ERROR) << "RpcSink " << config_.name << ": Unable to open transaction on channel "
                   << channel_->name() << ": " << e.what();
        return Status::Backoff;
    }
    if (!transaction) {
        LOG(ERROR) << "RpcSink " << config_.name << ": channel " << channel_->name()
                   << " returned no transaction";
        return Status::Backoff;
    }

    TransactionCloser closer(*transaction, config_.name);
    Status status = Status::Ready;

    try {
        transaction->begin();

        connection_.verify_connected();

        std::vector<Event> batch;
        for (size_t i = 0; i < config_.batch_size; ++i) {
            TakeResult result = transaction->take();
            Event* event = std::get_if<Event>(&result);
            if (!event) {
                counters_->increment_and_get(kBatchUnderflow);
                break;
            }
            batch.push_back(std::move(*event));
        }

        if (batch.empty()) {
            counters_->increment_and_get(kBatchEmpty);
            status = Status::Backoff;
        } else {
            VLOG(2) << "RpcSink " << config_.name << ": sending " << batch.size()
                    << " events to " << connection_.client()->name();
            connection_.client()->append_batch(batch);
        }

        transaction->commit();
        counters_->increment_and_get(kBatchSuccess);

    } catch (const ChannelError& e) {
        rollback(*transaction);
        LOG(ERROR) << "RpcSink " << config_.name << ": Unable to get event from channel "
                   << channel_->name() << ": " << e.what();
        status = Status::Backoff;

    } catch (const std::exception& e) {
        rollback(*transaction);
        connection_.teardown();
        throw DeliveryError("Failed to send events", e.what());

    } catch (...) {
        rollback(*transaction);
        connection_.teardown();
        throw DeliveryError("Failed to send events", "unknown error");
    }

    return status;
}

void RpcSink::rollback(Transaction& transaction) {
    try {
        transaction.rollback();
    } catch (const std::exception& e) {
        LOG(ERROR) << "RpcSink " << config_.name << ": transaction rollback failed: "
                   << e.what();
    }
}

}  // namespace relay
