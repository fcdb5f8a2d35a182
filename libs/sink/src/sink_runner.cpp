// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "relay/sink_runner.hpp"
#include "relay/errors.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace relay {

SinkRunner::SinkRunner(std::shared_ptr<Sink> sink,
                       const SinkRunnerConfig& config,
                       std::shared_ptr<CounterRecorder> counters)
    : sink_(std::move(sink))
    , config_(config)
    , counters_(counters ? std::move(counters) : std::make_shared<CounterGroup>("runner")) {
    if (!sink_) {
        throw ConfigError("SinkRunner: no sink given");
    }
}

SinkRunner::~SinkRunner() {
    stop();
}

void SinkRunner::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
        return;
    }

    sink_->start();

    running_ = true;
    consecutive_backoffs_ = 0;
    thread_ = std::thread(&SinkRunner::run_loop, this);

    LOG(INFO) << "SinkRunner started for " << sink_->name()
              << " (backoff_increment=" << config_.backoff_increment.count() << "ms"
              << ", max_backoff=" << config_.max_backoff.count() << "ms)";
}

void SinkRunner::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    sink_->stop();

    LOG(INFO) << "SinkRunner stopped for " << sink_->name();
}

std::chrono::milliseconds SinkRunner::backoff_delay(uint64_t consecutive) const {
    // Saturate instead of overflowing on very long outages
    uint64_t steps = std::min<uint64_t>(
        consecutive,
        static_cast<uint64_t>(config_.max_backoff.count() /
                              std::max<int64_t>(config_.backoff_increment.count(), 1)) + 1);
    return std::min(config_.backoff_increment * static_cast<int64_t>(steps), config_.max_backoff);
}

void SinkRunner::run_loop() {
    while (running_) {
        try {
            if (sink_->process() == Status::Backoff) {
                counters_->increment_and_get(kBackoffs);
                pause(backoff_delay(++consecutive_backoffs_));
            } else {
                consecutive_backoffs_ = 0;
            }
        } catch (const DeliveryError& e) {
            LOG(ERROR) << "Unable to deliver event. Exception follows: " << e.what();
            counters_->increment_and_get(kDeliveryErrors);
            pause(config_.max_backoff);
        } catch (const std::exception& e) {
            LOG(ERROR) << "Unhandled exception in " << sink_->name()
                       << ", logging and sleeping for " << config_.max_backoff.count()
                       << "ms: " << e.what();
            pause(config_.max_backoff);
        }
    }
}

void SinkRunner::pause(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [this] { return !running_; });
}

}  // namespace relay
