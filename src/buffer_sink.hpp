// SPDX-License-Identifier: MIT

// src/buffer_sink.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "stream_pump/stream/config.hpp"
#include "stream_pump/stream/event_loop.hpp"
#include "stream_pump/stream/sink.hpp"

namespace stream_pump {

// BufferSink - collects everything written into memory
//
// Accepted chunks count against the high-water mark until the next loop
// turn "consumes" them into Contents(). Write() returns false once that
// backlog reaches the mark; drain follows on the consuming turn.
class BufferSink : public Sink {
public:
    explicit BufferSink(IEventLoop& loop, size_t high_water_mark = kDefaultHighWaterMark)
        : loop_(loop), high_water_mark_(high_water_mark),
          alive_(std::make_shared<bool>(true)) {}

    ~BufferSink() override { *alive_ = false; }

    BufferSink(const BufferSink&) = delete;
    BufferSink& operator=(const BufferSink&) = delete;

    WriteResult Write(Chunk chunk) override {
        if (closed_) {
            return std::unexpected(Error{ErrorCode::SinkWriteError, "sink is closed"});
        }
        if (ending_) {
            return std::unexpected(Error{ErrorCode::InvalidState, "write after end"});
        }

        backlog_ += chunk.Size();
        pending_.push_back(std::move(chunk));
        ScheduleConsume();

        if (backlog_ >= high_water_mark_) {
            need_drain_ = true;
            return false;
        }
        return true;
    }

    void End() override {
        if (closed_ || ending_) return;
        ending_ = true;
        ScheduleConsume();
    }

    void Close() override {
        closed_ = true;
        pending_.clear();
        backlog_ = 0;
    }

    const std::vector<std::byte>& Contents() const { return contents_; }

    std::string ContentsAsString() const {
        return {reinterpret_cast<const char*>(contents_.data()), contents_.size()};
    }

    // Hand the collected bytes to the caller, leaving the sink empty.
    std::vector<std::byte> TakeContents() { return std::exchange(contents_, {}); }

    bool IsFinished() const { return finished_; }

private:
    void ScheduleConsume() {
        if (consume_scheduled_) return;
        consume_scheduled_ = true;

        std::shared_ptr<bool> alive = alive_;
        loop_.Defer([alive, this]() {
            if (!*alive) return;
            consume_scheduled_ = false;
            Consume();
        });
    }

    void Consume() {
        if (closed_) return;
        for (auto& chunk : pending_) {
            auto bytes = chunk.Bytes();
            contents_.insert(contents_.end(), bytes.begin(), bytes.end());
        }
        pending_.clear();
        backlog_ = 0;

        std::shared_ptr<bool> alive = alive_;
        if (need_drain_) {
            need_drain_ = false;
            drain_.Emit();
            if (!*alive || closed_) return;
        }
        if (ending_ && pending_.empty() && !finished_) {
            finished_ = true;
            finish_.Emit();
        }
    }

    IEventLoop& loop_;
    size_t high_water_mark_;
    std::vector<Chunk> pending_;
    size_t backlog_ = 0;
    std::vector<std::byte> contents_;

    bool consume_scheduled_ = false;
    bool need_drain_ = false;
    bool ending_ = false;
    bool finished_ = false;
    bool closed_ = false;
    std::shared_ptr<bool> alive_;
};

}  // namespace stream_pump
