// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "relay/batch_builder.hpp"

#include <string>

namespace relay {

void to_proto(const Event& event, relay::rpc::Event* out) {
    auto* headers = out->mutable_headers();
    for (const auto& [key, value] : event.headers) {
        (*headers)[key] = value;
    }
    out->set_body(std::string(event.body.begin(), event.body.end()));
}

Event from_proto(const relay::rpc::Event& in) {
    Event event;
    for (const auto& [key, value] : in.headers()) {
        event.headers.emplace(key, value);
    }
    event.body.assign(in.body().begin(), in.body().end());
    return event;
}

// ============================================================================
// EventBatchBuilder
// ============================================================================

EventBatchBuilder::EventBatchBuilder(const std::string& source_id, size_t max_items)
    : source_id_(source_id)
    , max_items_(max_items) {
}

void EventBatchBuilder::add(const Event& event) {
    to_proto(event, batch_.add_events());

    estimated_bytes_ += event.body.size();
    for (const auto& [key, value] : event.headers) {
        estimated_bytes_ += key.size() + value.size();
    }
}

relay::rpc::EventBatch EventBatchBuilder::build() {
    relay::rpc::EventBatch out;
    out.Swap(&batch_);
    out.set_sequence(sequence_++);
    out.set_source_id(source_id_);
    estimated_bytes_ = 0;
    return out;
}

void EventBatchBuilder::reset() {
    batch_.Clear();
    estimated_bytes_ = 0;
}

}  // namespace relay
