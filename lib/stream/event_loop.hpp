// SPDX-License-Identifier: MIT

// lib/stream/event_loop.hpp
#pragma once

#include <functional>
#include <memory>

namespace stream_pump {

/// Handle for a registered file descriptor, returned by IEventLoop::Register().
class IEventHandle {
public:
    virtual ~IEventHandle() = default;

    /// Change which events (read/write) are being monitored.
    virtual void Update(bool want_read, bool want_write) = 0;

    /// Return the monitored file descriptor.
    virtual int fd() const = 0;
};

/// Event loop interface for non-blocking I/O.
///
/// Implement this to drive fd-backed sources and sinks from an existing
/// event loop (libuv, asio, etc.). EpollEventLoop is the built-in
/// implementation.
///
/// All callbacks are invoked on the event loop thread.
class IEventLoop {
public:
    using ReadCallback = std::function<void()>;
    using WriteCallback = std::function<void()>;
    using ErrorCallback = std::function<void(int error_code)>;

    virtual ~IEventLoop() = default;

    /// Register a file descriptor for event monitoring.
    ///
    /// Hangup on a descriptor watched for reading is reported as readable,
    /// so the reader observes end of file through read().
    ///
    /// @param fd         File descriptor to monitor (must be pollable)
    /// @param want_read  Monitor for readability
    /// @param want_write Monitor for writability
    /// @param on_read    Called when fd is readable
    /// @param on_write   Called when fd is writable
    /// @param on_error   Called on EPOLLERR (or hangup without read interest)
    /// @return Handle to modify or unregister the fd (unregisters on destruction)
    virtual std::unique_ptr<IEventHandle> Register(
        int fd,
        bool want_read,
        bool want_write,
        ReadCallback on_read,
        WriteCallback on_write,
        ErrorCallback on_error) = 0;

    /// Schedule a callback for the next event loop iteration.
    virtual void Defer(std::function<void()> fn) = 0;

    /// Return true if the caller is on the event loop thread.
    virtual bool IsInEventLoopThread() const = 0;
};

}  // namespace stream_pump
