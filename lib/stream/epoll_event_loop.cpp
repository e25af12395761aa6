// SPDX-License-Identifier: MIT

#include "stream_pump/stream/epoll_event_loop.hpp"

#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include "stream_pump/stream/logger.hpp"

namespace stream_pump {

namespace {

std::runtime_error SystemFailure(const char* what) {
    return std::runtime_error(std::string(what) + " failed: " + std::strerror(errno));
}

}  // namespace

// EpollEventHandle

EpollEventHandle::EpollEventHandle(EpollEventLoop& loop, int fd,
                                   bool want_read, bool want_write,
                                   IEventLoop::ReadCallback on_read,
                                   IEventLoop::WriteCallback on_write,
                                   IEventLoop::ErrorCallback on_error)
    : loop_(loop),
      fd_(fd),
      want_read_(want_read),
      on_read_(std::move(on_read)),
      on_write_(std::move(on_write)),
      on_error_(std::move(on_error)) {
    epoll_event ev{};
    ev.events = ComputeEpollFlags(want_read, want_write);
    ev.data.ptr = this;

    if (epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_ADD, fd_, &ev) < 0) {
        throw SystemFailure("epoll_ctl ADD");
    }
}

EpollEventHandle::~EpollEventHandle() {
    // fd may already be closed by its owner; nothing to report then
    epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_DEL, fd_, nullptr);
    loop_.Retire(this);
}

void EpollEventHandle::Update(bool want_read, bool want_write) {
    epoll_event ev{};
    ev.events = ComputeEpollFlags(want_read, want_write);
    ev.data.ptr = this;

    if (epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_MOD, fd_, &ev) < 0) {
        throw SystemFailure("epoll_ctl MOD");
    }
    want_read_ = want_read;
}

// Callbacks may destroy this handle; `loop` outlives it.
void EpollEventHandle::HandleEvents(uint32_t events) {
    EpollEventLoop& loop = loop_;

    if ((events & EPOLLERR) != 0) {
        int error_code = 0;
        socklen_t len = sizeof(error_code);
        if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error_code, &len) < 0 ||
            error_code == 0) {
            // Pipes are not sockets: a write end whose reader vanished.
            error_code = EPIPE;
        }
        if (on_error_) on_error_(error_code);
        return;  // Don't process read/write after error
    }

    // Peer hung up: a reader drains what is left and then sees EOF.
    if ((events & EPOLLHUP) != 0 && !want_read_) {
        if (on_error_) on_error_(EPIPE);
        return;
    }

    if ((events & (EPOLLIN | EPOLLHUP)) != 0 && on_read_) {
        on_read_();
        if (loop.IsRetired(this)) return;
    }

    if ((events & EPOLLOUT) != 0 && on_write_) {
        on_write_();
    }
}

uint32_t EpollEventHandle::ComputeEpollFlags(bool want_read, bool want_write) {
    uint32_t flags = EPOLLET;  // Edge-triggered mode
    if (want_read) {
        flags |= EPOLLIN;
    }
    if (want_write) {
        flags |= EPOLLOUT;
    }
    return flags;
}

// EpollEventLoop

EpollEventLoop::EpollEventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw SystemFailure("epoll_create1");
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        auto err = SystemFailure("eventfd");
        close(epoll_fd_);
        throw err;
    }

    // data.ptr = nullptr distinguishes the wake fd from handles
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.ptr = nullptr;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        auto err = SystemFailure("epoll_ctl ADD wake_fd");
        close(wake_fd_);
        close(epoll_fd_);
        throw err;
    }
}

EpollEventLoop::~EpollEventLoop() {
    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

std::unique_ptr<IEventHandle> EpollEventLoop::Register(
    int fd,
    bool want_read,
    bool want_write,
    ReadCallback on_read,
    WriteCallback on_write,
    ErrorCallback on_error) {
    return std::make_unique<EpollEventHandle>(
        *this, fd, want_read, want_write,
        std::move(on_read), std::move(on_write), std::move(on_error));
}

void EpollEventLoop::Defer(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        deferred_callbacks_.push_back(std::move(fn));
    }

    if (!IsInEventLoopThread()) {
        Wake();
    }
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return std::this_thread::get_id() == loop_thread_id_.load();
}

void EpollEventLoop::Retire(const EpollEventHandle* handle) {
    if (dispatching_) retired_.push_back(handle);
}

bool EpollEventLoop::IsRetired(const EpollEventHandle* handle) const {
    return std::find(retired_.begin(), retired_.end(), handle) != retired_.end();
}

bool EpollEventLoop::HasPendingCallbacks() {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    return !deferred_callbacks_.empty();
}

void EpollEventLoop::Poll(int timeout_ms) {
    loop_thread_id_.store(std::this_thread::get_id());

    ProcessDeferredCallbacks();

    // Callbacks deferred by the ones above must not wait for I/O.
    int wait_ms = HasPendingCallbacks() ? 0 : timeout_ms;

    epoll_event events[kMaxEvents];
    int nfds = epoll_wait(epoll_fd_, events, kMaxEvents, wait_ms);

    if (nfds < 0) {
        if (errno == EINTR) {
            return;
        }
        throw SystemFailure("epoll_wait");
    }

    dispatching_ = true;
    for (int i = 0; i < nfds; ++i) {
        auto* handle = static_cast<EpollEventHandle*>(events[i].data.ptr);
        if (handle != nullptr) {
            if (!IsRetired(handle)) handle->HandleEvents(events[i].events);
        } else {
            uint64_t val;
            if (read(wake_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                Logger::Instance().Warn("event loop: draining wake fd failed: {}",
                                        std::strerror(errno));
            }
        }
    }
    dispatching_ = false;
    retired_.clear();

    ProcessDeferredCallbacks();
}

void EpollEventLoop::Run() {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        return;  // Already running or stopped
    }
    while (state_.load() == State::Running) {
        Poll(100);  // 100ms cap re-checks state_ periodically
    }
}

void EpollEventLoop::Stop() {
    state_.store(State::Stopped);
    Wake();
}

void EpollEventLoop::Wake() {
    uint64_t val = 1;
    if (write(wake_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        Logger::Instance().Error("event loop: wake failed: {}", std::strerror(errno));
    }
}

void EpollEventLoop::ProcessDeferredCallbacks() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        callbacks.swap(deferred_callbacks_);
    }

    for (auto& cb : callbacks) {
        if (cb) {
            cb();
        }
    }
}

}  // namespace stream_pump
