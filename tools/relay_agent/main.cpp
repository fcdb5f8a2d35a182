// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief Relay agent - forwards lines read from stdin to a remote collector
///
/// Each input line becomes one event (headers: timestamp, host) and is put
/// into a memory channel. A SinkRunner drains the channel in batches through
/// an RpcSink connected to the collector over gRPC.
///
/// Usage:
///   tail -F app.log | relay_agent --hostname=collector.local --port=41414
///   relay_agent --config=/etc/relay/agent.yaml
///
/// Command line flags override values from the config file.

#include "agent_config.hpp"
#include "line_reader.hpp"

#include "relay/counter_group.hpp"
#include "relay/errors.hpp"
#include "relay/grpc_rpc_client.hpp"
#include "relay/memory_channel.hpp"
#include "relay/rpc_sink.hpp"
#include "relay/sink_runner.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <string>
#include <system_error>
#include <thread>

// Command line flags
DEFINE_string(config, "", "Path to YAML config file");
DEFINE_string(hostname, "", "Collector hostname (overrides config)");
DEFINE_int32(port, 0, "Collector port (overrides config)");
DEFINE_int32(batch_size, 0, "Max events per batch (overrides config, 0=keep)");
DEFINE_string(name, "", "Sink name (overrides config)");
DEFINE_int32(connect_timeout_ms, 0, "Connect timeout in ms (overrides config, 0=keep)");
DEFINE_int32(request_timeout_ms, 0, "Request timeout in ms (overrides config, 0=keep)");
DEFINE_int32(channel_capacity, 0, "Memory channel capacity (overrides config, 0=keep)");
DEFINE_int32(drain_timeout_s, 30, "Max seconds to wait for the channel to drain at end of input");

std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown = true;
}

namespace {

/// Install without SA_RESTART so blocking calls return EINTR on shutdown
bool install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    return sigaction(SIGINT, &sa, nullptr) == 0 && sigaction(SIGTERM, &sa, nullptr) == 0;
}

std::string local_hostname() {
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "unknown";
    }
    return buf;
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void apply_flags(relay::agent::AgentConfig& config) {
    if (!FLAGS_name.empty()) config.sink.name = FLAGS_name;
    if (!FLAGS_hostname.empty()) config.sink.hostname = FLAGS_hostname;
    if (FLAGS_port != 0) config.sink.port = FLAGS_port;
    if (FLAGS_batch_size < 0) {
        throw relay::ConfigError("--batch_size must not be negative");
    }
    if (FLAGS_batch_size > 0) config.sink.batch_size = static_cast<size_t>(FLAGS_batch_size);
    if (FLAGS_connect_timeout_ms > 0) {
        config.client.connect_timeout = std::chrono::milliseconds(FLAGS_connect_timeout_ms);
    }
    if (FLAGS_request_timeout_ms > 0) {
        config.client.request_timeout = std::chrono::milliseconds(FLAGS_request_timeout_ms);
    }
    if (FLAGS_channel_capacity > 0) {
        config.channel.capacity = static_cast<size_t>(FLAGS_channel_capacity);
    }

    config.client.hostname = config.sink.hostname;
    config.client.port = config.sink.port;
    config.client.batch_size = config.sink.batch_size;
}

/// Put one event in its own transaction, retrying while the channel is full
bool put_with_retry(relay::Channel& channel, relay::Event event) {
    while (!g_shutdown) {
        auto tx = channel.transaction();
        try {
            tx->begin();
            tx->put(event);
            tx->commit();
            tx->close();
            return true;
        } catch (const relay::ChannelError& e) {
            VLOG(1) << "Channel put failed, retrying: " << e.what();
            tx->close();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
    return false;
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("Relay agent - forwards stdin lines to a remote collector");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;

    if (!install_signal_handlers()) {
        LOG(ERROR) << "Failed to install signal handlers";
        return 1;
    }

    relay::agent::AgentConfig config;
    try {
        if (!FLAGS_config.empty()) {
            relay::agent::apply_yaml_file(FLAGS_config, config);
        }
        apply_flags(config);
        config.validate();
    } catch (const relay::ConfigError& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        return 1;
    }

    LOG(INFO) << "Starting relay agent";
    LOG(INFO) << "  Collector: " << relay::make_grpc_target(config.sink.hostname, config.sink.port);
    LOG(INFO) << "  Batch size: " << config.sink.batch_size;
    LOG(INFO) << "  Channel capacity: " << config.channel.capacity;

    auto counters = std::make_shared<relay::CounterGroup>(config.sink.name);
    std::shared_ptr<relay::MemoryChannel> channel;
    std::shared_ptr<relay::RpcSink> sink;
    try {
        channel = std::make_shared<relay::MemoryChannel>(config.channel);
        auto factory = std::make_shared<relay::GrpcRpcClientFactory>(config.client);
        sink = std::make_shared<relay::RpcSink>(config.sink, channel, factory, counters);
    } catch (const relay::ConfigError& e) {
        LOG(ERROR) << "Failed to set up pipeline: " << e.what();
        return 1;
    }

    relay::SinkRunner runner(sink, config.runner, counters);
    runner.start();
    LOG(INFO) << sink->to_string() << " running. Press Ctrl+C to stop.";

    const std::string host = local_hostname();
    uint64_t lines = 0;
    std::string line;
    relay::agent::LineReader reader(STDIN_FILENO);
    try {
        while (reader.next(line, g_shutdown) == relay::agent::LineReader::Result::Line) {
            relay::Event event = relay::Event::from_string(
                line, {{"timestamp", std::to_string(now_ms())}, {"host", host}});
            if (!put_with_retry(*channel, std::move(event))) {
                break;
            }
            ++lines;
        }
    } catch (const std::system_error& e) {
        LOG(ERROR) << "Stopped reading input: " << e.what();
    }

    if (!g_shutdown) {
        LOG(INFO) << "End of input after " << lines << " lines, draining channel...";
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(FLAGS_drain_timeout_s);
        while (!g_shutdown && channel->size() > 0 &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (channel->size() > 0) {
            LOG(WARNING) << channel->size() << " events left undelivered";
        }
    } else {
        LOG(INFO) << "Received shutdown signal";
    }

    runner.stop();

    LOG(INFO) << "Final counters: " << *counters;
    LOG(INFO) << "Relay agent stopped";
    return 0;
}
