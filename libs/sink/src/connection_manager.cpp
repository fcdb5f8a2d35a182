// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "relay/connection_manager.hpp"
#include "relay/errors.hpp"

#include <glog/logging.h>

#include <utility>

namespace relay {

ConnectionManager::ConnectionManager(std::shared_ptr<RpcClientFactory> factory,
                                     const std::string& hostname,
                                     int port,
                                     size_t batch_size)
    : factory_(std::move(factory))
    , hostname_(hostname)
    , port_(port)
    , batch_size_(batch_size) {
    if (!factory_) {
        throw ConfigError("ConnectionManager for " + hostname_ + ": no RPC client factory given");
    }
}

ConnectionManager::~ConnectionManager() {
    teardown();
}

void ConnectionManager::ensure_connected() {
    if (client_) {
        return;
    }

    VLOG(1) << "Building RPC client for " << hostname_ << ":" << port_
            << " (batch_size=" << batch_size_ << ")";

    // On failure the slot stays empty: the client is only stored once built.
    std::unique_ptr<RpcClient> client;
    try {
        client = factory_->connect(hostname_, port_, batch_size_);
    } catch (const ConnectionError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConnectionError("Failed to connect to " + hostname_ + ":" +
                              std::to_string(port_) + ": " + e.what());
    }
    if (!client) {
        throw ConnectionError("RPC client factory returned no client for " +
                              hostname_ + ":" + std::to_string(port_));
    }
    client_ = std::move(client);
}

void ConnectionManager::verify_connected() {
    if (client_ && !client_->is_active()) {
        LOG(WARNING) << "Connection " << client_->name() << " is no longer active, reconnecting";
        teardown();
    }
    ensure_connected();
}

void ConnectionManager::teardown() {
    if (!client_) {
        return;
    }

    std::unique_ptr<RpcClient> client = std::move(client_);
    VLOG(1) << "Closing RPC client " << client->name();
    try {
        client->close();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Attempt to close RPC client " << client->name()
                   << " failed: " << e.what();
    }
}

}  // namespace relay
