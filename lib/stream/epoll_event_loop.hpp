// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.hpp
#pragma once

#include <sys/epoll.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "stream_pump/stream/event_loop.hpp"

namespace stream_pump {

class EpollEventLoop;

/// Handle for a registered file descriptor in the epoll event loop.
///
/// Returned by EpollEventLoop::Register().  Destroying the handle
/// automatically removes the fd from the epoll set.
class EpollEventHandle : public IEventHandle {
public:
    /// Construct a handle and register @p fd with the epoll instance.
    /// @throws std::runtime_error if epoll_ctl rejects the fd (e.g. a regular file)
    EpollEventHandle(EpollEventLoop& loop, int fd,
                     bool want_read, bool want_write,
                     IEventLoop::ReadCallback on_read,
                     IEventLoop::WriteCallback on_write,
                     IEventLoop::ErrorCallback on_error);

    ~EpollEventHandle() override;

    EpollEventHandle(const EpollEventHandle&) = delete;
    EpollEventHandle& operator=(const EpollEventHandle&) = delete;
    EpollEventHandle(EpollEventHandle&&) = delete;
    EpollEventHandle& operator=(EpollEventHandle&&) = delete;

    void Update(bool want_read, bool want_write) override;

    int fd() const override { return fd_; }

    /// Dispatch callbacks for the given epoll event mask (called internally).
    void HandleEvents(uint32_t events);

private:
    static uint32_t ComputeEpollFlags(bool want_read, bool want_write);

    EpollEventLoop& loop_;
    int fd_;
    bool want_read_;
    IEventLoop::ReadCallback on_read_;
    IEventLoop::WriteCallback on_write_;
    IEventLoop::ErrorCallback on_error_;
};

/// Epoll-based event loop for non-blocking I/O.
///
/// Wraps Linux epoll to multiplex reads and writes on a single thread.
/// Deferred callbacks run at the start and end of every Poll(); while any
/// are queued, Poll() does not sleep in epoll_wait.
///
/// Thread safety: the loop itself runs on a single thread.  Defer(), Stop()
/// and Wake() may be called from any thread.
class EpollEventLoop : public IEventLoop {
public:
    /// Create an epoll instance and an internal eventfd for cross-thread wakeups.
    /// @throws std::runtime_error if either cannot be created
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;
    EpollEventLoop(EpollEventLoop&&) = delete;
    EpollEventLoop& operator=(EpollEventLoop&&) = delete;

    std::unique_ptr<IEventHandle> Register(
        int fd,
        bool want_read,
        bool want_write,
        ReadCallback on_read,
        WriteCallback on_write,
        ErrorCallback on_error) override;

    /// Queue a callback to run on the event-loop thread.
    void Defer(std::function<void()> fn) override;

    bool IsInEventLoopThread() const override;

    /// Run one iteration, waiting at most @p timeout_ms for events (-1 blocks).
    void Poll(int timeout_ms);

    /// Run the event loop until Stop() is called.
    void Run();

    /// Signal the loop to exit after the current poll completes.
    void Stop();

    /// Wake the event loop from another thread (e.g. after Defer()).
    void Wake();

    /// @return True if deferred callbacks are waiting to run.
    bool HasPendingCallbacks();

    int epoll_fd() const { return epoll_fd_; }

    /// Record a handle destroyed while events are being dispatched, so
    /// events already fetched for it are dropped (called internally).
    void Retire(const EpollEventHandle* handle);

    /// @return True if @p handle was destroyed during the current dispatch.
    bool IsRetired(const EpollEventHandle* handle) const;

private:
    void ProcessDeferredCallbacks();

    enum class State { Idle, Running, Stopped };

    int epoll_fd_;
    int wake_fd_ = -1;
    std::atomic<State> state_{State::Idle};
    std::atomic<std::thread::id> loop_thread_id_{};

    std::mutex deferred_mutex_;
    std::vector<std::function<void()>> deferred_callbacks_;

    // Loop thread only
    bool dispatching_ = false;
    std::vector<const EpollEventHandle*> retired_;

    static constexpr int kMaxEvents = 64;
};

}  // namespace stream_pump
