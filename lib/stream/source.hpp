// SPDX-License-Identifier: MIT

// lib/stream/source.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <functional>

#include "stream_pump/stream/chunk.hpp"
#include "stream_pump/stream/error.hpp"

namespace stream_pump {

/// Producer side of a transfer.
///
/// A Source hands out one chunk per Read() request. Results arrive through
/// the callback, which may run inline (before Read() returns) or on a later
/// event loop turn:
/// - a non-empty Chunk of at most @p max_bytes carries data;
/// - an empty Chunk means the source is exhausted;
/// - an Error means the source failed (terminal).
///
/// At most one Read() may be outstanding. After Close() no callback fires.
class Source {
public:
    using ReadResult = std::expected<Chunk, Error>;
    using ReadCallback = std::function<void(ReadResult)>;

    virtual ~Source() = default;

    /// Request the next chunk of at most @p max_bytes (> 0) bytes.
    virtual void Read(size_t max_bytes, ReadCallback callback) = 0;

    /// Release the underlying resource. Drops any pending callback.
    virtual void Close() = 0;
};

}  // namespace stream_pump
