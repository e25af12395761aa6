// SPDX-License-Identifier: MIT

// src/fd_sink.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <expected>
#include <memory>
#include <string>

#include "stream_pump/stream/config.hpp"
#include "stream_pump/stream/error.hpp"
#include "stream_pump/stream/event_loop.hpp"
#include "stream_pump/stream/sink.hpp"
#include "stream_pump/descriptor.hpp"

namespace stream_pump {

struct FdSinkOptions {
    size_t high_water_mark = kDefaultHighWaterMark;  // Backlog that makes Write() return false
};

// FdSink - buffered Sink writing to a file descriptor
//
// Write() queues the chunk and schedules a flush on the next loop turn.
// It returns false once the queued backlog reaches the high-water mark;
// drain is published when the backlog has been fully written after such a
// false. Writes that would block register the descriptor for writability
// and resume from the write-ready callback.
//
// End() flushes the remaining backlog, releases the descriptor and
// publishes finish. A failed write() publishes error and discards the
// backlog; every later Write() is rejected.
class FdSink : public Sink {
public:
    // Takes ownership of fd when owns_fd is true. Otherwise restore_flags
    // is written back with F_SETFL when the descriptor is released.
    FdSink(IEventLoop& loop, int fd, FdSinkOptions options = {}, bool owns_fd = true,
           int restore_flags = kFlagsUnchanged);
    ~FdSink() override;

    FdSink(const FdSink&) = delete;
    FdSink& operator=(const FdSink&) = delete;
    FdSink(FdSink&&) = delete;
    FdSink& operator=(FdSink&&) = delete;

    WriteResult Write(Chunk chunk) override;
    void End() override;
    void Close() override;

    int fd() const { return fd_; }
    size_t BufferedBytes() const { return buffered_; }
    size_t HighWaterMark() const { return options_.high_water_mark; }
    bool IsFinished() const { return finished_; }

private:
    void ScheduleFlush();
    void Flush();
    void WaitWritable();
    void Fail(const Error& e);
    void ReleaseDescriptor();

    IEventLoop& loop_;
    int fd_;
    FdSinkOptions options_;
    bool owns_fd_;
    int restore_flags_;

    std::deque<Chunk> queue_;
    size_t front_offset_ = 0;  // Bytes of queue_.front() already written
    size_t buffered_ = 0;      // Unwritten bytes across queue_

    std::unique_ptr<IEventHandle> handle_;
    bool waiting_writable_ = false;
    bool flush_scheduled_ = false;
    bool need_drain_ = false;
    bool ending_ = false;
    bool finished_ = false;
    bool failed_ = false;
    bool closed_ = false;

    std::shared_ptr<bool> alive_;
};

// Create or truncate path (mode 0644) as a sink.
std::expected<std::shared_ptr<FdSink>, Error> CreateFileSink(
    IEventLoop& loop, const std::string& path, FdSinkOptions options = {});

// Wrap an existing descriptor (e.g. STDOUT_FILENO), making it non-blocking
// if it is pollable. A borrowed descriptor gets its flags back once the
// sink finishes or is closed.
std::expected<std::shared_ptr<FdSink>, Error> AdoptSink(
    IEventLoop& loop, int fd, bool owns_fd, FdSinkOptions options = {});

}  // namespace stream_pump
