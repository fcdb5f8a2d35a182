// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "relay/rpc_sink.hpp"
#include "relay/memory_channel.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace relay::test {

using Bodies = std::vector<std::string>;

class RpcSinkTest : public ::testing::Test {
protected:
    std::unique_ptr<RpcSink> make_sink(size_t batch_size) {
        RpcSinkConfig config;
        config.name = "test-sink";
        config.hostname = "collector.local";
        config.port = 41414;
        config.batch_size = batch_size;
        return std::make_unique<RpcSink>(config, channel_, factory_, counters_);
    }

    std::shared_ptr<FakeChannel> channel_ = std::make_shared<FakeChannel>();
    std::shared_ptr<FakeCollector> collector_ = std::make_shared<FakeCollector>();
    std::shared_ptr<FakeRpcClientFactory> factory_ =
        std::make_shared<FakeRpcClientFactory>(collector_);
    std::shared_ptr<CounterGroup> counters_ = std::make_shared<CounterGroup>("test-sink");
};

// =============================================================================
// Construction / lifecycle
// =============================================================================

TEST_F(RpcSinkTest, NullChannelRejected) {
    RpcSinkConfig config;
    config.hostname = "h";
    config.port = 1;
    EXPECT_THROW(RpcSink(config, nullptr, factory_), ConfigError);
}

TEST_F(RpcSinkTest, NullFactoryRejected) {
    RpcSinkConfig config;
    config.hostname = "h";
    config.port = 1;
    EXPECT_THROW(RpcSink(config, channel_, nullptr), ConfigError);
}

TEST_F(RpcSinkTest, ToString) {
    auto sink = make_sink(10);
    EXPECT_EQ(sink->to_string(), "RpcSink test-sink { host: collector.local, port: 41414 }");
    EXPECT_EQ(sink->name(), "test-sink");
}

TEST_F(RpcSinkTest, StartConnectsEagerly) {
    auto sink = make_sink(10);
    sink->start();

    EXPECT_TRUE(sink->connected());
    ASSERT_EQ(collector_->connects, 1);
    EXPECT_EQ(collector_->hostnames[0], "collector.local");
    EXPECT_EQ(collector_->ports[0], 41414);
    EXPECT_EQ(collector_->batch_sizes[0], 10u);
}

TEST_F(RpcSinkTest, StartToleratesConnectFailure) {
    collector_->fail_connect = true;
    auto sink = make_sink(10);

    EXPECT_NO_THROW(sink->start());
    EXPECT_FALSE(sink->connected());
}

TEST_F(RpcSinkTest, StopClosesConnection) {
    auto sink = make_sink(10);
    sink->start();
    sink->stop();

    EXPECT_FALSE(sink->connected());
    EXPECT_EQ(collector_->closes, 1);
}

TEST_F(RpcSinkTest, StopIsIdempotent) {
    auto sink = make_sink(10);
    sink->start();
    sink->stop();
    sink->stop();

    EXPECT_EQ(collector_->closes, 1);
}

TEST_F(RpcSinkTest, StopSwallowsCloseFailure) {
    collector_->fail_close = true;
    auto sink = make_sink(10);
    sink->start();

    EXPECT_NO_THROW(sink->stop());
    EXPECT_FALSE(sink->connected());
}

TEST_F(RpcSinkTest, StatusNames) {
    EXPECT_STREQ(to_string(Status::Ready), "READY");
    EXPECT_STREQ(to_string(Status::Backoff), "BACKOFF");
}

// =============================================================================
// process(): batching
// =============================================================================

TEST_F(RpcSinkTest, FullBatchSentAndCommitted) {
    channel_->add({"A", "B", "C"});
    auto sink = make_sink(3);
    sink->start();

    EXPECT_EQ(sink->process(), Status::Ready);

    ASSERT_EQ(collector_->batches.size(), 1u);
    EXPECT_EQ(collector_->batches[0], (Bodies{"A", "B", "C"}));
    EXPECT_TRUE(channel_->bodies().empty());
    EXPECT_EQ(counters_->get(RpcSink::kBatchSuccess), 1u);
    EXPECT_EQ(counters_->get(RpcSink::kBatchUnderflow), 0u);
    EXPECT_EQ(counters_->get(RpcSink::kBatchEmpty), 0u);
}

TEST_F(RpcSinkTest, TakesAtMostBatchSize) {
    channel_->add({"A", "B", "C", "D", "E"});
    auto sink = make_sink(2);

    EXPECT_EQ(sink->process(), Status::Ready);
    EXPECT_EQ(sink->process(), Status::Ready);

    ASSERT_EQ(collector_->batches.size(), 2u);
    EXPECT_EQ(collector_->batches[0], (Bodies{"A", "B"}));
    EXPECT_EQ(collector_->batches[1], (Bodies{"C", "D"}));
    EXPECT_EQ(channel_->bodies(), (Bodies{"E"}));
}

TEST_F(RpcSinkTest, UnderflowSendsPartialBatch) {
    channel_->add({"A"});
    auto sink = make_sink(5);
    sink->start();

    EXPECT_EQ(sink->process(), Status::Ready);

    ASSERT_EQ(collector_->batches.size(), 1u);
    EXPECT_EQ(collector_->batches[0], (Bodies{"A"}));
    EXPECT_EQ(counters_->get(RpcSink::kBatchUnderflow), 1u);
    EXPECT_EQ(counters_->get(RpcSink::kBatchSuccess), 1u);
    // One successful take, one empty take
    EXPECT_EQ(channel_->count("take"), 2u);
}

TEST_F(RpcSinkTest, EmptyChannelBacksOffWithoutSending) {
    auto sink = make_sink(5);
    sink->start();

    EXPECT_EQ(sink->process(), Status::Backoff);

    EXPECT_TRUE(collector_->batches.empty());
    EXPECT_EQ(counters_->get(RpcSink::kBatchEmpty), 1u);
    EXPECT_EQ(counters_->get(RpcSink::kBatchUnderflow), 1u);
    // The empty transaction is still committed
    EXPECT_EQ(counters_->get(RpcSink::kBatchSuccess), 1u);
    EXPECT_EQ(channel_->count("commit"), 1u);
    EXPECT_EQ(channel_->count("close"), 1u);
}

TEST_F(RpcSinkTest, TransactionSequence) {
    channel_->add({"A"});
    auto sink = make_sink(2);

    sink->process();

    EXPECT_EQ(channel_->calls(), (Bodies{"begin", "take", "take", "commit", "close"}));
}

TEST_F(RpcSinkTest, ConnectsLazilyOnProcess) {
    channel_->add({"A"});
    auto sink = make_sink(2);
    EXPECT_FALSE(sink->connected());

    EXPECT_EQ(sink->process(), Status::Ready);
    EXPECT_TRUE(sink->connected());
    EXPECT_EQ(collector_->connects, 1);
}

TEST_F(RpcSinkTest, HeadersForwarded) {
    MemoryChannelConfig channel_config;
    channel_config.keep_alive = std::chrono::milliseconds(0);
    auto memory = std::make_shared<MemoryChannel>(channel_config);
    {
        auto tx = memory->transaction();
        tx->begin();
        tx->put(Event::from_string("x", {{"host", "h1"}}));
        tx->commit();
        tx->close();
    }

    RpcSinkConfig config;
    config.hostname = "h";
    config.port = 1;
    config.batch_size = 4;
    RpcSink sink(config, memory, factory_);

    EXPECT_EQ(sink.process(), Status::Ready);
    ASSERT_EQ(collector_->events.size(), 1u);
    ASSERT_EQ(collector_->events[0].size(), 1u);
    EXPECT_EQ(collector_->events[0][0].headers.at("host"), "h1");
    EXPECT_EQ(collector_->events[0][0].body_string(), "x");
    EXPECT_EQ(memory->size(), 0u);
}

// =============================================================================
// process(): failures
// =============================================================================

TEST_F(RpcSinkTest, SendFailureRollsBackAndThrows) {
    channel_->add({"A", "B"});
    auto sink = make_sink(5);
    sink->start();
    collector_->fail_append = true;

    try {
        sink->process();
        FAIL() << "expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Failed to send events", 0), 0u);
        EXPECT_NE(e.cause().find("collector rejected batch"), std::string::npos);
    }

    // Events returned in order, connection dropped, transaction closed
    EXPECT_EQ(channel_->bodies(), (Bodies{"A", "B"}));
    EXPECT_FALSE(sink->connected());
    EXPECT_EQ(collector_->closes, 1);
    EXPECT_EQ(channel_->count("rollback"), 1u);
    EXPECT_EQ(channel_->count("commit"), 0u);
    EXPECT_EQ(channel_->count("close"), 1u);
    EXPECT_EQ(counters_->get(RpcSink::kBatchSuccess), 0u);
}

TEST_F(RpcSinkTest, RedeliversAfterFailure) {
    channel_->add({"A", "B"});
    auto sink = make_sink(5);
    sink->start();

    collector_->fail_append = true;
    EXPECT_THROW(sink->process(), DeliveryError);

    collector_->fail_append = false;
    EXPECT_EQ(sink->process(), Status::Ready);

    ASSERT_EQ(collector_->batches.size(), 1u);
    EXPECT_EQ(collector_->batches[0], (Bodies{"A", "B"}));
    EXPECT_EQ(collector_->connects, 2);
}

TEST_F(RpcSinkTest, ConnectFailureTakesNothing) {
    channel_->add({"A"});
    collector_->fail_connect = true;
    auto sink = make_sink(5);

    EXPECT_THROW(sink->process(), DeliveryError);

    EXPECT_EQ(channel_->count("take"), 0u);
    EXPECT_EQ(channel_->count("rollback"), 1u);
    EXPECT_EQ(channel_->count("close"), 1u);
    EXPECT_EQ(channel_->bodies(), (Bodies{"A"}));
    EXPECT_FALSE(sink->connected());
}

TEST_F(RpcSinkTest, InactiveConnectionReplacedBeforeTaking) {
    channel_->add({"A"});
    auto sink = make_sink(5);
    sink->start();

    collector_->active = false;
    EXPECT_EQ(sink->process(), Status::Ready);

    EXPECT_EQ(collector_->connects, 2);
    EXPECT_EQ(collector_->closes, 1);
    ASSERT_EQ(collector_->batches.size(), 1u);
}

TEST_F(RpcSinkTest, TakeFailureBacksOffAndKeepsConnection) {
    channel_->add({"A"});
    auto sink = make_sink(5);
    sink->start();
    channel_->state().fail_take = true;

    EXPECT_EQ(sink->process(), Status::Backoff);

    EXPECT_TRUE(sink->connected());
    EXPECT_EQ(collector_->closes, 0);
    EXPECT_EQ(channel_->count("rollback"), 1u);
    EXPECT_EQ(channel_->count("close"), 1u);
    EXPECT_EQ(channel_->bodies(), (Bodies{"A"}));
}

TEST_F(RpcSinkTest, CommitFailureBacksOffAfterSend) {
    channel_->add({"A"});
    auto sink = make_sink(5);
    sink->start();
    channel_->state().fail_commit = true;

    EXPECT_EQ(sink->process(), Status::Backoff);

    // Sent but not committed: the event is redelivered later
    EXPECT_EQ(collector_->batches.size(), 1u);
    EXPECT_EQ(channel_->bodies(), (Bodies{"A"}));
    EXPECT_EQ(counters_->get(RpcSink::kBatchSuccess), 0u);
    EXPECT_TRUE(sink->connected());
}

TEST_F(RpcSinkTest, TransactionCreationFailureBacksOff) {
    auto sink = make_sink(5);
    sink->start();
    channel_->state().fail_transaction = true;

    EXPECT_EQ(sink->process(), Status::Backoff);
    EXPECT_TRUE(channel_->calls().empty());
    EXPECT_TRUE(sink->connected());
}

TEST_F(RpcSinkTest, BeginFailureBacksOff) {
    auto sink = make_sink(5);
    channel_->state().fail_begin = true;

    EXPECT_EQ(sink->process(), Status::Backoff);
    EXPECT_EQ(channel_->count("close"), 1u);
    // The connection is never attempted
    EXPECT_EQ(collector_->connects, 0);
}

TEST_F(RpcSinkTest, NullTransactionBacksOff) {
    channel_->add({"A"});
    auto sink = make_sink(5);
    sink->start();
    channel_->state().null_transaction = true;

    EXPECT_EQ(sink->process(), Status::Backoff);
    EXPECT_TRUE(channel_->calls().empty());
    EXPECT_TRUE(collector_->batches.empty());
    EXPECT_TRUE(sink->connected());

    channel_->state().null_transaction = false;
    EXPECT_EQ(sink->process(), Status::Ready);
    EXPECT_EQ(collector_->batches.size(), 1u);
}

TEST_F(RpcSinkTest, RollbackFailureKeepsSendError) {
    channel_->add({"A", "B"});
    auto sink = make_sink(5);
    sink->start();
    collector_->fail_append = true;
    channel_->state().fail_rollback = true;

    try {
        sink->process();
        FAIL() << "expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_NE(e.cause().find("collector rejected batch"), std::string::npos);
        EXPECT_EQ(e.cause().find("rollback failed"), std::string::npos);
    }

    EXPECT_FALSE(sink->connected());
    EXPECT_EQ(collector_->closes, 1);
    EXPECT_EQ(channel_->count("rollback"), 1u);
    EXPECT_EQ(channel_->count("close"), 1u);
}

TEST_F(RpcSinkTest, CloseFailureKeepsOutcome) {
    channel_->add({"A", "B"});
    auto sink = make_sink(5);
    sink->start();
    channel_->state().fail_close = true;

    EXPECT_EQ(sink->process(), Status::Ready);

    ASSERT_EQ(collector_->batches.size(), 1u);
    EXPECT_EQ(collector_->batches[0], (Bodies{"A", "B"}));
    EXPECT_TRUE(channel_->bodies().empty());
    EXPECT_EQ(channel_->count("commit"), 1u);
    EXPECT_EQ(channel_->count("close"), 1u);
    EXPECT_EQ(counters_->get(RpcSink::kBatchSuccess), 1u);
    EXPECT_TRUE(sink->connected());
}

TEST_F(RpcSinkTest, CloseFailureAfterSendFailureKeepsSendError) {
    channel_->add({"A"});
    auto sink = make_sink(5);
    sink->start();
    collector_->fail_append = true;
    channel_->state().fail_close = true;

    try {
        sink->process();
        FAIL() << "expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_NE(e.cause().find("collector rejected batch"), std::string::npos);
    }
    EXPECT_EQ(channel_->bodies(), (Bodies{"A"}));
}

TEST_F(RpcSinkTest, NonStandardExceptionRollsBackAndTearsDown) {
    channel_->add({"A", "B"});
    auto sink = make_sink(5);
    sink->start();
    collector_->fail_append_foreign = true;

    try {
        sink->process();
        FAIL() << "expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_EQ(e.cause(), "unknown error");
    }

    EXPECT_EQ(channel_->bodies(), (Bodies{"A", "B"}));
    EXPECT_FALSE(sink->connected());
    EXPECT_EQ(collector_->closes, 1);
    EXPECT_EQ(channel_->count("rollback"), 1u);
    EXPECT_EQ(channel_->count("commit"), 0u);
    EXPECT_EQ(channel_->count("close"), 1u);
}

TEST_F(RpcSinkTest, DefaultCountersWhenNoneGiven) {
    RpcSinkConfig config;
    config.hostname = "h";
    config.port = 1;
    RpcSink sink(config, channel_, factory_);

    sink.process();

    auto* group = dynamic_cast<CounterGroup*>(sink.counters().get());
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->get(RpcSink::kBatchEmpty), 1u);
}

}  // namespace relay::test
