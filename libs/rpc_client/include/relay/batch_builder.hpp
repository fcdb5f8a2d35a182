// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file batch_builder.hpp
/// @brief Builds relay.rpc.EventBatch messages for wire transfer
///
/// Events are copied into protobuf form as they are added and kept in
/// arrival order. build() hands out the batch with the next sequence number
/// and leaves the builder empty.
///
/// Example:
/// @code
///   EventBatchBuilder builder("relay-sink", 100);
///   for (const auto& event : events) {
///       builder.add(event);
///       if (builder.full()) send(builder.build());
///   }
///   if (builder.ready()) send(builder.build());
/// @endcode

#include "relay/event.hpp"
#include "relay/collector.pb.h"

#include <cstdint>
#include <string>

namespace relay {

/// Convert an event to its wire form
void to_proto(const Event& event, relay::rpc::Event* out);

/// Convert a wire event back to an Event
Event from_proto(const relay::rpc::Event& in);

/// Accumulates events into a single EventBatch
class EventBatchBuilder {
public:
    /// Create builder with source ID and max events per batch
    explicit EventBatchBuilder(const std::string& source_id = "relay",
                               size_t max_items = 100);

    /// Append an event (copied)
    void add(const Event& event);

    /// Check if batch has any events
    bool ready() const { return batch_.events_size() > 0; }

    /// Get current event count
    size_t size() const { return static_cast<size_t>(batch_.events_size()); }

    /// Check if batch is at capacity
    bool full() const { return size() >= max_items_; }

    /// Approximate payload size in bytes (bodies and headers)
    size_t estimated_size() const { return estimated_bytes_; }

    /// Take the assembled batch; assigns the next sequence number
    relay::rpc::EventBatch build();

    /// Discard pending events (sequence is not advanced)
    void reset();

    /// Sequence number the next build() will use
    uint64_t next_sequence() const { return sequence_; }

private:
    std::string source_id_;
    size_t max_items_;
    uint64_t sequence_ = 0;
    relay::rpc::EventBatch batch_;
    size_t estimated_bytes_ = 0;
};

}  // namespace relay
