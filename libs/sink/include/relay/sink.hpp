// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file sink.hpp
/// @brief Abstract interface for sinks driven by a SinkRunner
///
/// A sink drains events from a channel. Its driver calls process() in a loop
/// and uses the returned Status to decide whether to call again right away
/// or to back off first.

#include <string>

namespace relay {

/// Outcome of one process() call
enum class Status {
    Ready,    ///< Work was done; call again immediately
    Backoff   ///< Nothing to do or transient failure; delay next call
};

/// Convert Status to string ("READY" / "BACKOFF")
const char* to_string(Status status);

class Sink {
public:
    virtual ~Sink() = default;

    /// Prepare the sink (e.g. eager connect). Must not throw.
    virtual void start() = 0;

    /// Release resources. Idempotent, must not throw.
    virtual void stop() = 0;

    /// Attempt to move one batch of events downstream
    /// @throws DeliveryError if events could not be delivered
    virtual Status process() = 0;

    /// Get sink name for logging
    virtual std::string name() const = 0;
};

}  // namespace relay
