// SPDX-License-Identifier: MIT

// src/buffer_source.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "stream_pump/stream/event_loop.hpp"
#include "stream_pump/stream/source.hpp"

namespace stream_pump {

// BufferSource - serves an in-memory byte string, one deferred chunk per Read()
class BufferSource : public Source {
public:
    BufferSource(IEventLoop& loop, std::vector<std::byte> data)
        : loop_(loop), data_(std::move(data)), alive_(std::make_shared<bool>(true)) {}

    BufferSource(IEventLoop& loop, std::string_view text)
        : BufferSource(loop, ToBytes(text)) {}

    ~BufferSource() override { *alive_ = false; }

    BufferSource(const BufferSource&) = delete;
    BufferSource& operator=(const BufferSource&) = delete;

    void Read(size_t max_bytes, ReadCallback callback) override {
        if (closed_) {
            loop_.Defer([cb = std::move(callback)]() {
                cb(std::unexpected(Error{ErrorCode::SourceReadError, "source is closed"}));
            });
            return;
        }
        pending_ = std::move(callback);

        std::shared_ptr<bool> alive = alive_;
        loop_.Defer([alive, this, max_bytes]() {
            if (!*alive || !pending_) return;
            size_t n = std::min(max_bytes, data_.size() - offset_);
            auto bytes = std::span<const std::byte>(data_).subspan(offset_, n);
            offset_ += n;
            auto cb = std::move(pending_);
            pending_ = nullptr;
            cb(Chunk::CopyOf(bytes));
        });
    }

    void Close() override {
        closed_ = true;
        pending_ = nullptr;
    }

    size_t Remaining() const { return data_.size() - offset_; }

private:
    static std::vector<std::byte> ToBytes(std::string_view text) {
        auto chunk = Chunk::FromString(text);
        return {chunk.Bytes().begin(), chunk.Bytes().end()};
    }

    IEventLoop& loop_;
    std::vector<std::byte> data_;
    size_t offset_ = 0;
    bool closed_ = false;
    ReadCallback pending_;
    std::shared_ptr<bool> alive_;
};

}  // namespace stream_pump
