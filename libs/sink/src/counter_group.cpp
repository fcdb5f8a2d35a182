// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "relay/counter_group.hpp"

#include <sstream>

namespace relay {

uint64_t CounterGroup::increment_and_get(const std::string& name) {
    return add_and_get(name, 1);
}

uint64_t CounterGroup::add_and_get(const std::string& name, uint64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_[name] += delta;
}

uint64_t CounterGroup::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

std::map<std::string, uint64_t> CounterGroup::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

std::string CounterGroup::to_string() const {
    std::ostringstream out;
    out << "{ name:" << name_ << " counters:{";
    bool first = true;
    for (const auto& [counter, value] : snapshot()) {
        if (!first) {
            out << ", ";
        }
        out << counter << "=" << value;
        first = false;
    }
    out << "} }";
    return out.str();
}

std::ostream& operator<<(std::ostream& os, const CounterGroup& group) {
    return os << group.to_string();
}

}  // namespace relay
