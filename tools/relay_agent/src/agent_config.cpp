// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "agent_config.hpp"

#include "relay/errors.hpp"

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>

namespace relay::agent {

namespace {

constexpr size_t kDefaultBatchSize = 100;

template <typename T>
bool read_value(const YAML::Node& section, const std::string& section_name,
                const char* key, T& out) {
    if (!section[key]) {
        return false;
    }
    try {
        out = section[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value for " + section_name + "." + key + ": " + e.what());
    }
    return true;
}

/// Reads a non-negative integer; rejects negative input before it can wrap
bool read_count(const YAML::Node& section, const std::string& section_name,
                const char* key, size_t& out) {
    int64_t value = 0;
    if (!read_value(section, section_name, key, value)) {
        return false;
    }
    if (value < 0) {
        throw ConfigError(section_name + "." + key + " must not be negative");
    }
    out = static_cast<size_t>(value);
    return true;
}

bool read_millis(const YAML::Node& section, const std::string& section_name,
                 const char* key, std::chrono::milliseconds& out) {
    int64_t value = 0;
    if (!read_value(section, section_name, key, value)) {
        return false;
    }
    out = std::chrono::milliseconds(value);
    return true;
}

}  // namespace

AgentConfig::AgentConfig() {
    sink.batch_size = kDefaultBatchSize;
    client.batch_size = kDefaultBatchSize;
    client.hostname.clear();
    client.port = 0;
}

void AgentConfig::validate() const {
    if (sink.hostname.empty()) {
        throw ConfigError("No hostname specified");
    }
    if (sink.port == 0) {
        throw ConfigError("No port specified");
    }
    if (sink.port < 0 || sink.port > 65535) {
        throw ConfigError("sink.port out of range: " + std::to_string(sink.port));
    }
    if (sink.batch_size == 0) {
        throw ConfigError("sink.batch-size must be at least 1");
    }
    if (client.connect_timeout.count() <= 0) {
        throw ConfigError("sink.connect-timeout-ms must be positive");
    }
    if (client.request_timeout.count() <= 0) {
        throw ConfigError("sink.request-timeout-ms must be positive");
    }
    if (channel.capacity == 0) {
        throw ConfigError("channel.capacity must be at least 1");
    }
    if (channel.transaction_capacity == 0 || channel.transaction_capacity > channel.capacity) {
        throw ConfigError("channel.transaction-capacity must be between 1 and channel.capacity");
    }
    if (sink.batch_size > channel.transaction_capacity) {
        throw ConfigError("sink.batch-size must not exceed channel.transaction-capacity");
    }
    if (channel.keep_alive.count() < 0) {
        throw ConfigError("channel.keep-alive-ms must not be negative");
    }
    if (runner.backoff_increment.count() <= 0 || runner.max_backoff.count() <= 0) {
        throw ConfigError("runner backoff values must be positive");
    }
}

void apply_yaml(const YAML::Node& root, AgentConfig& config) {
    if (const YAML::Node sink = root["sink"]) {
        read_value(sink, "sink", "name", config.sink.name);
        read_value(sink, "sink", "hostname", config.sink.hostname);
        read_value(sink, "sink", "port", config.sink.port);
        read_count(sink, "sink", "batch-size", config.sink.batch_size);
        read_millis(sink, "sink", "connect-timeout-ms", config.client.connect_timeout);
        read_millis(sink, "sink", "request-timeout-ms", config.client.request_timeout);
        read_value(sink, "sink", "source-id", config.client.source_id);
    }

    if (const YAML::Node channel = root["channel"]) {
        read_value(channel, "channel", "name", config.channel.name);
        read_count(channel, "channel", "capacity", config.channel.capacity);
        read_count(channel, "channel", "transaction-capacity", config.channel.transaction_capacity);
        read_millis(channel, "channel", "keep-alive-ms", config.channel.keep_alive);
    }

    if (const YAML::Node runner = root["runner"]) {
        read_millis(runner, "runner", "backoff-increment-ms", config.runner.backoff_increment);
        read_millis(runner, "runner", "max-backoff-ms", config.runner.max_backoff);
    }

    // The client connects to wherever the sink points it
    config.client.hostname = config.sink.hostname;
    config.client.port = config.sink.port;
    config.client.batch_size = config.sink.batch_size;
}

void apply_yaml_file(const std::string& path, AgentConfig& config) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load config file " + path + ": " + e.what());
    }
    apply_yaml(root, config);
    LOG(INFO) << "Loaded configuration from " << path;
}

}  // namespace relay::agent
