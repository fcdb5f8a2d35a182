// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "relay/batch_builder.hpp"
#include "relay/collector.pb.h"

#include <gtest/gtest.h>

namespace relay::test {

// Helper to create an event with a timestamp header
Event create_test_event(const std::string& body, int64_t timestamp_ms) {
    return Event::from_string(body, {{"timestamp", std::to_string(timestamp_ms)},
                                     {"host", "test-host"}});
}

// =============================================================================
// EventBatchBuilder Tests
// =============================================================================

class EventBatchBuilderTest : public ::testing::Test {
protected:
    EventBatchBuilder builder_{"test_source", 3};
};

TEST_F(EventBatchBuilderTest, InitiallyEmpty) {
    EXPECT_FALSE(builder_.ready());
    EXPECT_EQ(builder_.size(), 0u);
    EXPECT_FALSE(builder_.full());
    EXPECT_EQ(builder_.estimated_size(), 0u);
}

TEST_F(EventBatchBuilderTest, AddTracksSizeAndCapacity) {
    builder_.add(create_test_event("a", 1000));
    builder_.add(create_test_event("b", 1001));
    EXPECT_TRUE(builder_.ready());
    EXPECT_EQ(builder_.size(), 2u);
    EXPECT_FALSE(builder_.full());

    builder_.add(create_test_event("c", 1002));
    EXPECT_TRUE(builder_.full());
}

TEST_F(EventBatchBuilderTest, BuildProducesValidProtobuf) {
    builder_.add(create_test_event("first", 1000));
    builder_.add(create_test_event("second", 1001));

    relay::rpc::EventBatch batch = builder_.build();

    std::string wire;
    ASSERT_TRUE(batch.SerializeToString(&wire));
    relay::rpc::EventBatch parsed;
    ASSERT_TRUE(parsed.ParseFromString(wire));

    EXPECT_EQ(parsed.source_id(), "test_source");
    ASSERT_EQ(parsed.events_size(), 2);
    EXPECT_EQ(parsed.events(0).body(), "first");
    EXPECT_EQ(parsed.events(1).body(), "second");
    EXPECT_EQ(parsed.events(0).headers().at("timestamp"), "1000");
    EXPECT_EQ(parsed.events(1).headers().at("host"), "test-host");
}

TEST_F(EventBatchBuilderTest, BuildClearsBatch) {
    builder_.add(create_test_event("a", 1000));
    auto batch = builder_.build();

    EXPECT_FALSE(builder_.ready());
    EXPECT_EQ(builder_.size(), 0u);
    EXPECT_EQ(builder_.estimated_size(), 0u);
}

TEST_F(EventBatchBuilderTest, ResetDiscardsWithoutAdvancingSequence) {
    builder_.add(create_test_event("a", 1000));
    builder_.reset();

    EXPECT_FALSE(builder_.ready());
    EXPECT_EQ(builder_.next_sequence(), 0u);
}

TEST_F(EventBatchBuilderTest, SequenceNumberIncrementsAcrossBatches) {
    builder_.add(create_test_event("a", 1000));
    auto batch1 = builder_.build();
    builder_.add(create_test_event("b", 1001));
    auto batch2 = builder_.build();

    EXPECT_EQ(batch1.sequence(), 0u);
    EXPECT_EQ(batch2.sequence(), 1u);
    EXPECT_EQ(batch2.events_size(), 1);
}

TEST_F(EventBatchBuilderTest, EstimatedSizeCountsBodiesAndHeaders) {
    builder_.add(Event::from_string("12345", {{"k", "vv"}}));
    EXPECT_EQ(builder_.estimated_size(), 5u + 1u + 2u);
}

TEST(EventConversionTest, BinaryBodyIsPreserved) {
    Event event;
    event.body = {0x00, 0xff, 0x10, 0x00};
    event.headers["type"] = "binary";

    relay::rpc::Event wire;
    to_proto(event, &wire);
    EXPECT_EQ(wire.body().size(), 4u);

    Event back = from_proto(wire);
    EXPECT_EQ(back, event);
}

}  // namespace relay::test
