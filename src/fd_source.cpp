// SPDX-License-Identifier: MIT

// src/fd_source.cpp
#include "stream_pump/fd_source.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#include "stream_pump/stream/logger.hpp"

namespace stream_pump {

FdSource::FdSource(IEventLoop& loop, int fd, bool owns_fd, int restore_flags)
    : loop_(loop), fd_(fd), owns_fd_(owns_fd), restore_flags_(restore_flags),
      alive_(std::make_shared<bool>(true)) {}

FdSource::~FdSource() {
    *alive_ = false;
    Close();
}

void FdSource::Read(size_t max_bytes, ReadCallback callback) {
    if (IsClosed()) {
        loop_.Defer([cb = std::move(callback)]() {
            cb(std::unexpected(Error{ErrorCode::SourceReadError, "source is closed"}));
        });
        return;
    }
    if (pending_ || max_bytes == 0) {
        const char* what = pending_ ? "read requested while another read is pending"
                                    : "read of zero bytes requested";
        loop_.Defer([cb = std::move(callback), what]() {
            cb(std::unexpected(Error{ErrorCode::InvalidState, what}));
        });
        return;
    }

    pending_ = std::move(callback);
    max_bytes_ = max_bytes;

    std::shared_ptr<bool> alive = alive_;
    loop_.Defer([alive, this]() {
        if (*alive) TryRead();
    });
}

void FdSource::Close() {
    handle_.reset();
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
    } else if (int err = RestoreDescriptor(fd_, restore_flags_); err != 0) {
        Logger::Instance().Warn("source: restoring flags of fd {} failed: {}",
                                fd_, std::strerror(err));
    }
    fd_ = -1;
    pending_ = nullptr;
}

void FdSource::TryRead() {
    if (!pending_ || IsClosed()) return;

    if (eof_) {
        Deliver(Chunk{});
        return;
    }

    std::vector<std::byte> buffer(std::min(max_bytes_, kMaxReadSize));
    while (true) {
        ssize_t n = ::read(fd_, buffer.data(), buffer.size());
        if (n > 0) {
            buffer.resize(static_cast<size_t>(n));
            Deliver(Chunk(std::move(buffer)));
            return;
        }
        if (n == 0) {
            eof_ = true;
            Deliver(Chunk{});
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            WaitReadable();
            return;
        }
        Deliver(std::unexpected(Error{ErrorCode::SourceReadError,
                                      "read() failed", errno}));
        return;
    }
}

void FdSource::WaitReadable() {
    if (handle_) return;  // Edge-triggered: next readiness calls TryRead

    try {
        handle_ = loop_.Register(
            fd_,
            /*want_read=*/true,
            /*want_write=*/false,
            [this]() { TryRead(); },
            nullptr,
            [this](int err) {
                Deliver(std::unexpected(Error{ErrorCode::SourceReadError,
                                              "descriptor error", err}));
            });
    } catch (const std::runtime_error& e) {
        Deliver(std::unexpected(Error{ErrorCode::SourceReadError,
            std::string("cannot wait for readability: ") + e.what()}));
    }
}

void FdSource::Deliver(ReadResult result) {
    if (!pending_) return;
    // Move out first: the callback may Close() or destroy this source.
    auto cb = std::move(pending_);
    pending_ = nullptr;
    cb(std::move(result));
}

std::expected<std::shared_ptr<FdSource>, Error> OpenFileSource(
    IEventLoop& loop, const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK);
    if (fd < 0) {
        return std::unexpected(Error{ErrorCode::OpenFailed,
                                     "cannot open '" + path + "' for reading", errno});
    }
    auto source = AdoptSource(loop, fd, /*owns_fd=*/true);
    if (!source) {
        ::close(fd);
        return source;
    }
    Logger::Instance().Debug("source: opened '{}' as fd {}", path, fd);
    return source;
}

std::expected<std::shared_ptr<FdSource>, Error> AdoptSource(
    IEventLoop& loop, int fd, bool owns_fd) {
    auto saved_flags = PrepareDescriptor(fd);
    if (!saved_flags) {
        return std::unexpected(saved_flags.error());
    }
    return std::make_shared<FdSource>(loop, fd, owns_fd,
                                      owns_fd ? kFlagsUnchanged : *saved_flags);
}

}  // namespace stream_pump
