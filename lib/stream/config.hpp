// SPDX-License-Identifier: MIT

// lib/stream/config.hpp
#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "stream_pump/stream/error.hpp"

namespace stream_pump {

/// Default high-water mark: bytes per chunk and default sink backlog.
inline constexpr size_t kDefaultHighWaterMark = 64 * 1024;

/// Configuration for a single StreamPump transfer.
struct PumpConfig {
    size_t chunk_size = kDefaultHighWaterMark;  ///< Max bytes requested per read

    static PumpConfig Defaults() { return PumpConfig{}; }

    /// Check that chunk_size is positive. There is no upper bound; a source
    /// may always return fewer bytes than requested.
    std::expected<void, Error> Validate() const {
        if (chunk_size == 0) {
            return std::unexpected(Error{ErrorCode::ConfigurationError,
                "chunk size must be a positive integer"});
        }
        return {};
    }
};

/// Parse a chunk size from user input (command line, environment).
///
/// Rejects anything that is not a positive base-10 integer, or that does
/// not fit in an int64_t.
inline std::expected<size_t, Error> ParseChunkSize(std::string_view text) {
    int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range && ptr == last) {
        return std::unexpected(Error{ErrorCode::ConfigurationError,
            "chunk size is out of range: '" + std::string(text) + "'"});
    }
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return std::unexpected(Error{ErrorCode::ConfigurationError,
            "chunk size is not an integer: '" + std::string(text) + "'"});
    }
    if (value <= 0) {
        return std::unexpected(Error{ErrorCode::ConfigurationError,
            "chunk size must be a positive integer, got " + std::to_string(value)});
    }
    return static_cast<size_t>(value);
}

}  // namespace stream_pump
