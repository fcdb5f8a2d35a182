// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file counter_group.hpp
/// @brief Named monotonic counters
///
/// Components record observations through the CounterRecorder interface; the
/// process wires in a CounterGroup (or a test double) at construction time.

#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>

namespace relay {

/// Sink for counter increments
class CounterRecorder {
public:
    virtual ~CounterRecorder() = default;

    /// Increment counter `name` by one and return the new value
    virtual uint64_t increment_and_get(const std::string& name) = 0;

    /// Increment counter `name` by `delta` and return the new value
    virtual uint64_t add_and_get(const std::string& name, uint64_t delta) = 0;
};

/// Thread-safe set of named counters
class CounterGroup : public CounterRecorder {
public:
    explicit CounterGroup(const std::string& name = "") : name_(name) {}

    uint64_t increment_and_get(const std::string& name) override;
    uint64_t add_and_get(const std::string& name, uint64_t delta) override;

    /// Current value, 0 for counters never incremented
    uint64_t get(const std::string& name) const;

    /// Copy of all counters, ordered by name
    std::map<std::string, uint64_t> snapshot() const;

    const std::string& name() const { return name_; }
    void set_name(const std::string& name) { name_ = name; }

    /// "{ name:<name> counters:{a=1, b=2} }"
    std::string to_string() const;

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> counters_;
};

std::ostream& operator<<(std::ostream& os, const CounterGroup& group);

}  // namespace relay
