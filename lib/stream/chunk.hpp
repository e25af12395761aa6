// SPDX-License-Identifier: MIT

// lib/stream/chunk.hpp
#pragma once

#include <cstddef>
#include <cstring>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace stream_pump {

/// Immutable, move-only unit of bytes handed from a Source to a Sink.
///
/// A Chunk owns its bytes. Moving it transfers ownership; nothing can
/// modify the contents after construction. An empty chunk is used by
/// sources as the end-of-data marker.
class Chunk {
public:
    Chunk() = default;

    explicit Chunk(std::vector<std::byte> bytes) : bytes_(std::move(bytes)) {}

    /// Copy @p data into a new chunk.
    static Chunk CopyOf(std::span<const std::byte> data) {
        return Chunk(std::vector<std::byte>(data.begin(), data.end()));
    }

    /// Copy the characters of @p text into a new chunk.
    static Chunk FromString(std::string_view text) {
        std::vector<std::byte> bytes(text.size());
        if (!text.empty()) std::memcpy(bytes.data(), text.data(), text.size());
        return Chunk(std::move(bytes));
    }

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;
    Chunk(Chunk&&) noexcept = default;
    Chunk& operator=(Chunk&&) noexcept = default;

    std::span<const std::byte> Bytes() const noexcept { return bytes_; }
    const std::byte* Data() const noexcept { return bytes_.data(); }
    size_t Size() const noexcept { return bytes_.size(); }
    bool Empty() const noexcept { return bytes_.empty(); }

    /// View the bytes as characters (tests and text sinks).
    std::string_view AsStringView() const noexcept {
        return {reinterpret_cast<const char*>(bytes_.data()), bytes_.size()};
    }

private:
    std::vector<std::byte> bytes_;
};

}  // namespace stream_pump
