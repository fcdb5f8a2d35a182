// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file sink_runner.hpp
/// @brief Drives a Sink from a dedicated polling thread
///
/// The runner calls Sink::process() in a loop:
/// - Ready:         call again immediately
/// - Backoff:       sleep min(consecutive_backoffs * backoff_increment, max_backoff)
/// - DeliveryError: log it and sleep max_backoff
///
/// Sleeps end early when stop() is called.
///
/// Counters: runner.backoffs, runner.deliveryErrors.

#include "relay/counter_group.hpp"
#include "relay/sink.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace relay {

/// Configuration for SinkRunner
struct SinkRunnerConfig {
    std::chrono::milliseconds backoff_increment{1000};
    std::chrono::milliseconds max_backoff{5000};
};

class SinkRunner {
public:
    static constexpr const char* kBackoffs = "runner.backoffs";
    static constexpr const char* kDeliveryErrors = "runner.deliveryErrors";

    /// @param counters Recorder for runner counters; a private CounterGroup is
    ///                 created when null
    SinkRunner(std::shared_ptr<Sink> sink,
               const SinkRunnerConfig& config = {},
               std::shared_ptr<CounterRecorder> counters = nullptr);
    ~SinkRunner();

    SinkRunner(const SinkRunner&) = delete;
    SinkRunner& operator=(const SinkRunner&) = delete;

    /// Start the sink and the polling thread. Concurrent calls start once.
    void start();

    /// Stop the polling thread (waits for the current process() call), then
    /// stop the sink. Concurrent calls stop once.
    void stop();

    bool running() const { return running_; }

    /// Backoffs since the last Ready outcome
    uint64_t consecutive_backoffs() const { return consecutive_backoffs_; }

    /// Sleep the loop applies after the given number of consecutive backoffs
    std::chrono::milliseconds backoff_delay(uint64_t consecutive) const;

private:
    void run_loop();
    void pause(std::chrono::milliseconds duration);

    std::shared_ptr<Sink> sink_;
    SinkRunnerConfig config_;
    std::shared_ptr<CounterRecorder> counters_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> consecutive_backoffs_{0};

    std::mutex lifecycle_mutex_;  // serializes start() and stop()
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace relay
