// SPDX-License-Identifier: MIT

// src/fd_source.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <string>

#include "stream_pump/stream/error.hpp"
#include "stream_pump/stream/event_loop.hpp"
#include "stream_pump/stream/source.hpp"
#include "stream_pump/descriptor.hpp"

namespace stream_pump {

// Largest buffer a single read() is given, whatever the requested size.
inline constexpr size_t kMaxReadSize = 1024 * 1024;

// FdSource - Source reading from a file descriptor
//
// Every Read() is attempted on a deferred loop turn, so the caller never
// sees its callback before Read() returns. Regular files are read directly.
// Pipes, sockets and terminals must be non-blocking (see PrepareDescriptor);
// when a read would block the descriptor is registered with the loop and the
// read is retried once it becomes readable.
//
// read() returning 0 is reported as an empty chunk (end of data); the same
// is repeated for any later Read(). A read never asks the kernel for more
// than kMaxReadSize bytes.
//
// A borrowed descriptor (owns_fd false) gets restore_flags written back
// with F_SETFL when the source is closed.
class FdSource : public Source {
public:
    // Takes ownership of fd when owns_fd is true.
    FdSource(IEventLoop& loop, int fd, bool owns_fd = true,
             int restore_flags = kFlagsUnchanged);
    ~FdSource() override;

    FdSource(const FdSource&) = delete;
    FdSource& operator=(const FdSource&) = delete;
    FdSource(FdSource&&) = delete;
    FdSource& operator=(FdSource&&) = delete;

    void Read(size_t max_bytes, ReadCallback callback) override;
    void Close() override;

    int fd() const { return fd_; }
    bool IsClosed() const { return fd_ < 0; }
    bool AtEof() const { return eof_; }

private:
    void TryRead();
    void WaitReadable();
    void Deliver(ReadResult result);

    IEventLoop& loop_;
    int fd_;
    bool owns_fd_;
    int restore_flags_;
    bool eof_ = false;
    std::unique_ptr<IEventHandle> handle_;

    ReadCallback pending_;
    size_t max_bytes_ = 0;

    // Deferred lambdas check this before touching the object
    std::shared_ptr<bool> alive_;
};

// Open path read-only as a source.
std::expected<std::shared_ptr<FdSource>, Error> OpenFileSource(
    IEventLoop& loop, const std::string& path);

// Wrap an existing descriptor (e.g. STDIN_FILENO), making it non-blocking
// if it is pollable. A borrowed descriptor gets its flags back on Close().
std::expected<std::shared_ptr<FdSource>, Error> AdoptSource(
    IEventLoop& loop, int fd, bool owns_fd);

}  // namespace stream_pump
