// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file memory_channel.hpp
/// @brief Bounded in-memory transactional channel
///
/// Events live in a FIFO queue. Taken events keep occupying a slot until the
/// taking transaction commits; a rollback puts them back at the head of the
/// queue in their original order. Puts are staged per transaction and become
/// visible atomically on commit.
///
/// Not durable: queued events are lost when the process exits.

#include "relay/channel.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace relay {

/// Configuration for MemoryChannel
struct MemoryChannelConfig {
    std::string name = "memory-channel";

    /// Maximum number of events held (queued + taken but uncommitted)
    size_t capacity = 100;

    /// Maximum number of puts or takes in a single transaction
    size_t transaction_capacity = 100;

    /// How long take() waits for an event and commit() waits for space
    std::chrono::milliseconds keep_alive{3000};
};

class MemoryTransaction;

/// Bounded in-memory channel. Thread-safe; transactions may be used from
/// different threads concurrently, each transaction from one thread at a time.
class MemoryChannel : public Channel {
public:
    /// @throws ConfigError if capacities are zero or inconsistent
    explicit MemoryChannel(const MemoryChannelConfig& config = {});
    ~MemoryChannel() override = default;

    MemoryChannel(const MemoryChannel&) = delete;
    MemoryChannel& operator=(const MemoryChannel&) = delete;

    std::unique_ptr<Transaction> transaction() override;
    std::string name() const override { return config_.name; }

    /// Number of committed events waiting to be taken
    size_t size() const;

    /// Free slots (capacity minus queued and in-flight taken events)
    size_t remaining() const;

    const MemoryChannelConfig& config() const { return config_; }

private:
    friend class MemoryTransaction;

    std::optional<Event> poll();
    void commit(std::vector<Event>& puts, size_t take_count);
    void restore(std::vector<Event>& takes);

    MemoryChannelConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    size_t in_flight_ = 0;
};

}  // namespace relay
