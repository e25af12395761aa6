// SPDX-License-Identifier: MIT

// src/fd_sink.cpp
#include "stream_pump/fd_sink.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

#include "stream_pump/stream/logger.hpp"

namespace stream_pump {

FdSink::FdSink(IEventLoop& loop, int fd, FdSinkOptions options, bool owns_fd,
               int restore_flags)
    : loop_(loop), fd_(fd), options_(options), owns_fd_(owns_fd),
      restore_flags_(restore_flags), alive_(std::make_shared<bool>(true)) {}

FdSink::~FdSink() {
    *alive_ = false;
    Close();
}

Sink::WriteResult FdSink::Write(Chunk chunk) {
    if (closed_ || failed_) {
        return std::unexpected(Error{ErrorCode::SinkWriteError,
            closed_ ? "sink is closed" : "sink failed earlier"});
    }
    if (ending_) {
        return std::unexpected(Error{ErrorCode::InvalidState, "write after end"});
    }

    if (!chunk.Empty()) {
        buffered_ += chunk.Size();
        queue_.push_back(std::move(chunk));
        ScheduleFlush();
    }

    if (buffered_ >= options_.high_water_mark) {
        need_drain_ = true;
        return false;
    }
    return true;
}

void FdSink::End() {
    if (closed_ || failed_ || ending_) return;
    ending_ = true;
    ScheduleFlush();
}

void FdSink::Close() {
    closed_ = true;
    queue_.clear();
    front_offset_ = 0;
    buffered_ = 0;
    ReleaseDescriptor();
}

void FdSink::ScheduleFlush() {
    // A pending write-ready callback flushes everything queued by then.
    if (flush_scheduled_ || waiting_writable_) return;
    flush_scheduled_ = true;

    std::shared_ptr<bool> alive = alive_;
    loop_.Defer([alive, this]() {
        if (!*alive) return;
        flush_scheduled_ = false;
        Flush();
    });
}

void FdSink::Flush() {
    if (closed_ || failed_ || finished_) return;
    waiting_writable_ = false;

    while (!queue_.empty()) {
        const Chunk& front = queue_.front();
        ssize_t n = ::write(fd_, front.Data() + front_offset_, front.Size() - front_offset_);
        if (n > 0) {
            front_offset_ += static_cast<size_t>(n);
            buffered_ -= static_cast<size_t>(n);
            if (front_offset_ == front.Size()) {
                queue_.pop_front();
                front_offset_ = 0;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n == 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
            WaitWritable();
            return;
        }
        Fail(Error{ErrorCode::SinkWriteError, "write() failed", errno});
        return;
    }

    if (handle_) handle_->Update(false, false);

    // Listeners may write more, end, close or destroy us.
    std::shared_ptr<bool> alive = alive_;
    if (need_drain_) {
        need_drain_ = false;
        drain_.Emit();
        if (!*alive || closed_ || failed_) return;
    }

    if (ending_ && queue_.empty() && !finished_) {
        finished_ = true;
        ReleaseDescriptor();
        finish_.Emit();
    }
}

void FdSink::WaitWritable() {
    waiting_writable_ = true;
    if (handle_) {
        handle_->Update(false, true);
        return;
    }

    try {
        handle_ = loop_.Register(
            fd_,
            /*want_read=*/false,
            /*want_write=*/true,
            nullptr,
            [this]() { Flush(); },
            [this](int err) {
                Fail(Error{ErrorCode::SinkWriteError, "descriptor error", err});
            });
    } catch (const std::runtime_error& e) {
        waiting_writable_ = false;
        Fail(Error{ErrorCode::SinkWriteError,
            std::string("cannot wait for writability: ") + e.what()});
    }
}

void FdSink::Fail(const Error& e) {
    if (closed_ || failed_) return;
    failed_ = true;
    queue_.clear();
    front_offset_ = 0;
    buffered_ = 0;
    waiting_writable_ = false;
    handle_.reset();
    Logger::Instance().Debug("sink: fd {} failed: {}", fd_, Describe(e));
    error_.Emit(e);
}

void FdSink::ReleaseDescriptor() {
    handle_.reset();
    waiting_writable_ = false;
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
    } else if (int err = RestoreDescriptor(fd_, restore_flags_); err != 0) {
        Logger::Instance().Warn("sink: restoring flags of fd {} failed: {}",
                                fd_, std::strerror(err));
    }
    fd_ = -1;
}

std::expected<std::shared_ptr<FdSink>, Error> CreateFileSink(
    IEventLoop& loop, const std::string& path, FdSinkOptions options) {
    if (options.high_water_mark == 0) {
        return std::unexpected(Error{ErrorCode::ConfigurationError,
                                     "high-water mark must be positive"});
    }
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(Error{ErrorCode::OpenFailed,
                                     "cannot open '" + path + "' for writing", errno});
    }
    auto sink = AdoptSink(loop, fd, /*owns_fd=*/true, options);
    if (!sink) {
        ::close(fd);
        return sink;
    }
    Logger::Instance().Debug("sink: created '{}' as fd {}", path, fd);
    return sink;
}

std::expected<std::shared_ptr<FdSink>, Error> AdoptSink(
    IEventLoop& loop, int fd, bool owns_fd, FdSinkOptions options) {
    if (options.high_water_mark == 0) {
        return std::unexpected(Error{ErrorCode::ConfigurationError,
                                     "high-water mark must be positive"});
    }
    auto saved_flags = PrepareDescriptor(fd);
    if (!saved_flags) {
        return std::unexpected(saved_flags.error());
    }
    return std::make_shared<FdSink>(loop, fd, options, owns_fd,
                                    owns_fd ? kFlagsUnchanged : *saved_flags);
}

}  // namespace stream_pump
