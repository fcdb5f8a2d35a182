// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file agent_config.hpp
/// @brief Configuration of the relay agent (YAML file + validation)
///
/// Example file:
/// @code
///   sink:
///     name: collector-sink
///     hostname: collector.local
///     port: 41414
///     batch-size: 100
///     connect-timeout-ms: 20000
///     request-timeout-ms: 20000
///   channel:
///     capacity: 10000
///     transaction-capacity: 100
///     keep-alive-ms: 3000
///   runner:
///     backoff-increment-ms: 1000
///     max-backoff-ms: 5000
/// @endcode

#include "relay/grpc_rpc_client.hpp"
#include "relay/memory_channel.hpp"
#include "relay/rpc_sink.hpp"
#include "relay/sink_runner.hpp"

#include <string>

namespace YAML {
class Node;
}

namespace relay::agent {

/// Everything needed to build the agent's components
struct AgentConfig {
    RpcSinkConfig sink;
    GrpcRpcClientConfig client;
    MemoryChannelConfig channel;
    SinkRunnerConfig runner;

    AgentConfig();

    /// Check required values and ranges
    /// @throws ConfigError naming the first offending key
    void validate() const;
};

/// Apply values present in a parsed YAML document on top of `config`.
/// Absent keys keep their current value.
/// @throws ConfigError if a value has the wrong type
void apply_yaml(const YAML::Node& root, AgentConfig& config);

/// Load a YAML file on top of `config`
/// @throws ConfigError if the file cannot be read or parsed
void apply_yaml_file(const std::string& path, AgentConfig& config);

}  // namespace relay::agent
