// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "relay/memory_channel.hpp"

#include <glog/logging.h>

namespace relay {

// ============================================================================
// MemoryTransaction
// ============================================================================

class MemoryTransaction : public Transaction {
public:
    explicit MemoryTransaction(MemoryChannel& channel)
        : channel_(channel) {
    }

    ~MemoryTransaction() override {
        if (state_ == State::Open) {
            // Abandoned without commit/rollback/close: hand takes back.
            channel_.restore(takes_);
        }
    }

    void begin() override {
        if (state_ != State::New) {
            throw ChannelError("begin() called on a transaction that is " + state_name());
        }
        state_ = State::Open;
    }

    void put(Event event) override {
        require_open("put");
        if (puts_.size() >= channel_.config_.transaction_capacity) {
            throw ChannelError("Put queue for MemoryTransaction of capacity " +
                               std::to_string(channel_.config_.transaction_capacity) +
                               " full, consider committing more frequently or "
                               "increasing transaction capacity");
        }
        puts_.push_back(std::move(event));
    }

    TakeResult take() override {
        require_open("take");
        if (takes_.size() >= channel_.config_.transaction_capacity) {
            throw ChannelError("Take list for MemoryTransaction of capacity " +
                               std::to_string(channel_.config_.transaction_capacity) +
                               " full, consider committing more frequently or "
                               "increasing transaction capacity");
        }

        auto event = channel_.poll();
        if (!event) {
            return ChannelEmpty{};
        }
        takes_.push_back(*event);
        return std::move(*event);
    }

    void commit() override {
        require_open("commit");
        // Throws on capacity timeout; the transaction stays open for rollback.
        channel_.commit(puts_, takes_.size());
        puts_.clear();
        takes_.clear();
        state_ = State::Completed;
    }

    void rollback() override {
        require_open("rollback");
        channel_.restore(takes_);
        puts_.clear();
        takes_.clear();
        state_ = State::Completed;
    }

    void close() override {
        if (state_ == State::Closed) {
            return;
        }
        if (state_ == State::Open) {
            VLOG(1) << channel_.name() << ": closing open transaction, rolling back "
                    << takes_.size() << " takes and " << puts_.size() << " puts";
            rollback();
        }
        state_ = State::Closed;
    }

private:
    enum class State { New, Open, Completed, Closed };

    void require_open(const char* op) const {
        if (state_ != State::Open) {
            throw ChannelError(std::string(op) + "() called on a transaction that is " +
                               state_name());
        }
    }

    std::string state_name() const {
        switch (state_) {
            case State::New: return "new";
            case State::Open: return "open";
            case State::Completed: return "completed";
            case State::Closed: return "closed";
        }
        return "unknown";
    }

    MemoryChannel& channel_;
    State state_ = State::New;
    std::vector<Event> puts_;
    std::vector<Event> takes_;
};

// ============================================================================
// MemoryChannel
// ============================================================================

MemoryChannel::MemoryChannel(const MemoryChannelConfig& config)
    : config_(config) {
    if (config_.capacity == 0) {
        throw ConfigError("Memory channel capacity must be greater than 0");
    }
    if (config_.transaction_capacity == 0) {
        throw ConfigError("Memory channel transaction capacity must be greater than 0");
    }
    if (config_.transaction_capacity > config_.capacity) {
        throw ConfigError("Transaction capacity (" +
                          std::to_string(config_.transaction_capacity) +
                          ") must not exceed channel capacity (" +
                          std::to_string(config_.capacity) + ")");
    }

    LOG(INFO) << "MemoryChannel " << config_.name << " created"
              << " (capacity=" << config_.capacity
              << ", transaction_capacity=" << config_.transaction_capacity
              << ", keep_alive=" << config_.keep_alive.count() << "ms)";
}

std::unique_ptr<Transaction> MemoryChannel::transaction() {
    return std::make_unique<MemoryTransaction>(*this);
}

size_t MemoryChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t MemoryChannel::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.capacity - queue_.size() - in_flight_;
}

std::optional<Event> MemoryChannel::poll() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, config_.keep_alive, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }

    Event event = std::move(queue_.front());
    queue_.pop_front();
    in_flight_++;
    return event;
}

void MemoryChannel::commit(std::vector<Event>& puts, size_t take_count) {
    std::unique_lock<std::mutex> lock(mutex_);

    // Slots held by our own takes are released by this commit.
    auto fits = [&] {
        return queue_.size() + in_flight_ - take_count + puts.size() <= config_.capacity;
    };
    if (!cv_.wait_for(lock, config_.keep_alive, fits)) {
        throw ChannelError("Space for commit to " + config_.name +
                           " couldn't be acquired. Sinks are likely not keeping up "
                           "with sources, or the buffer size is too tight");
    }

    in_flight_ -= take_count;
    for (auto& event : puts) {
        queue_.push_back(std::move(event));
    }
    lock.unlock();
    cv_.notify_all();
}

void MemoryChannel::restore(std::vector<Event>& takes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = takes.rbegin(); it != takes.rend(); ++it) {
            queue_.push_front(std::move(*it));
        }
        in_flight_ -= takes.size();
    }
    takes.clear();
    cv_.notify_all();
}

}  // namespace relay
