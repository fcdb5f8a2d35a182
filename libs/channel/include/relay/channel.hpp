// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file channel.hpp
/// @brief Abstract interface for transactional event channels
///
/// A Channel is a durable or in-memory queue that sources put events into and
/// sinks take events out of. Every put and take happens inside a Transaction:
///
/// @code
///   auto tx = channel.transaction();
///   tx->begin();
///   TakeResult r = tx->take();
///   ...
///   tx->commit();    // or tx->rollback()
///   tx->close();
/// @endcode
///
/// All takes (or puts) of one transaction are committed or rolled back
/// together. Store failures are reported by throwing ChannelError.

#include "relay/errors.hpp"
#include "relay/event.hpp"

#include <memory>
#include <string>
#include <variant>

namespace relay {

/// Take found no event available
struct ChannelEmpty {};

/// Result of a take: an event, or the empty signal
using TakeResult = std::variant<Event, ChannelEmpty>;

/// Unit of work against a channel
class Transaction {
public:
    virtual ~Transaction() = default;

    /// Open the transaction. Must be called exactly once, before any take/put.
    virtual void begin() = 0;

    /// Stage an event for publication on commit
    virtual void put(Event event) = 0;

    /// Remove the next event from the channel, or report that it is empty
    virtual TakeResult take() = 0;

    /// Make all puts visible and all takes permanent
    virtual void commit() = 0;

    /// Discard all puts and return all taken events to the channel
    virtual void rollback() = 0;

    /// Release the transaction. Idempotent, valid after commit or rollback.
    virtual void close() = 0;
};

/// Transactional event queue
class Channel {
public:
    virtual ~Channel() = default;

    /// Create a new (not yet begun) transaction
    virtual std::unique_ptr<Transaction> transaction() = 0;

    /// Get channel name for logging
    virtual std::string name() const = 0;
};

}  // namespace relay
