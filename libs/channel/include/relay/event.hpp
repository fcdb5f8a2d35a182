// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file event.hpp
/// @brief Event record moved from channels to the downstream collector
///
/// An event is an opaque body plus a set of string headers. The relay never
/// interprets the body; headers carry routing and provenance metadata
/// (timestamp, host, ...).

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace relay {

/// Single event record
struct Event {
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    Event() = default;

    Event(std::map<std::string, std::string> h, std::vector<uint8_t> b)
        : headers(std::move(h)), body(std::move(b)) {}

    /// Build an event whose body is the bytes of `text`
    static Event from_string(const std::string& text,
                             std::map<std::string, std::string> h = {}) {
        return Event(std::move(h), std::vector<uint8_t>(text.begin(), text.end()));
    }

    /// Body interpreted as text (for logging and tests)
    std::string body_string() const { return std::string(body.begin(), body.end()); }

    bool operator==(const Event& other) const {
        return headers == other.headers && body == other.body;
    }
    bool operator!=(const Event& other) const { return !(*this == other); }
};

}  // namespace relay
