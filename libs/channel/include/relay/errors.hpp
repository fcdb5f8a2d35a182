// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file errors.hpp
/// @brief Exception types shared by channels, RPC clients and sinks
///
/// - ChannelError:    local store failure (begin/take/put/commit). Transient.
/// - ConnectionError: an RPC connection could not be opened.
/// - RpcError:        a call on an open connection failed (send or close).
/// - DeliveryError:   raised by a sink when a batch could not be delivered.
/// - ConfigError:     invalid or missing configuration value.

#include <stdexcept>
#include <string>

namespace relay {

class ChannelError : public std::runtime_error {
public:
    explicit ChannelError(const std::string& what) : std::runtime_error(what) {}
};

class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& what) : std::runtime_error(what) {}
};

class RpcError : public std::runtime_error {
public:
    explicit RpcError(const std::string& what) : std::runtime_error(what) {}
};

/// Delivery failure surfaced to the sink's driver. Carries the message of the
/// error that caused it.
class DeliveryError : public std::runtime_error {
public:
    DeliveryError(const std::string& what, const std::string& cause)
        : std::runtime_error(what + ": " + cause)
        , cause_(cause) {}

    const std::string& cause() const { return cause_; }

private:
    std::string cause_;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace relay
