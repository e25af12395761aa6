// SPDX-License-Identifier: MIT

// lib/stream/sink.hpp
#pragma once

#include <expected>

#include "stream_pump/stream/chunk.hpp"
#include "stream_pump/stream/error.hpp"
#include "stream_pump/stream/event_emitter.hpp"

namespace stream_pump {

/// Consumer side of a transfer.
///
/// Write() hands a chunk to the sink and returns its capacity signal:
/// - true:  another chunk may be submitted immediately;
/// - false: the internal buffer reached its high-water mark; the next
///          chunk must wait until OnDrain() fires;
/// - Error: the chunk was rejected synchronously.
///
/// Failures detected later (while flushing) are published on OnError().
/// After End(), no more writes are accepted; OnFinish() fires once every
/// accepted byte has been flushed.
///
/// Notifications are delivered through EventEmitters, so several observers
/// (the pump, a progress reporter, a test) can listen to the same sink.
class Sink {
public:
    using WriteResult = std::expected<bool, Error>;

    virtual ~Sink() = default;

    /// Submit @p chunk for writing.
    virtual WriteResult Write(Chunk chunk) = 0;

    /// Signal that no more writes will occur.
    virtual void End() = 0;

    /// Release the underlying resource. No notifications after Close().
    virtual void Close() = 0;

    /// Capacity restored after a Write() returned false.
    EventEmitter<>& OnDrain() { return drain_; }

    /// Asynchronous write failure (terminal).
    EventEmitter<const Error&>& OnError() { return error_; }

    /// All data flushed after End().
    EventEmitter<>& OnFinish() { return finish_; }

protected:
    EventEmitter<> drain_;
    EventEmitter<const Error&> error_;
    EventEmitter<> finish_;
};

}  // namespace stream_pump
