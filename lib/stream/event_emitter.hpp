// SPDX-License-Identifier: MIT

// lib/stream/event_emitter.hpp
#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace stream_pump {

/// Typed publish/subscribe channel for one named notification.
///
/// Listeners are invoked synchronously, in registration order, on every
/// Emit(). Registration order is part of the contract: a listener added
/// first always observes the notification first.
///
/// Mutation during Emit():
/// - A listener subscribed while an Emit() is running is not invoked by
///   that Emit().
/// - A listener unsubscribed while an Emit() is running is not invoked
///   afterwards, even if it had not been reached yet.
/// - A listener may destroy the emitter itself; Emit() does not touch the
///   emitter after the first listener runs.
///
/// Thread safety: none. All calls must come from the event loop thread.
///
/// @code
/// EventEmitter<const Error&> on_error;
/// auto id = on_error.Subscribe([](const Error& e) { log(e); });
/// on_error.Emit(Error{ErrorCode::SinkWriteError, "disk full"});
/// on_error.Unsubscribe(id);
/// @endcode
template<typename... Args>
class EventEmitter {
public:
    using Listener = std::function<void(Args...)>;
    using SubscriptionId = uint64_t;

    EventEmitter() : alive_(std::make_shared<bool>(true)) {}

    ~EventEmitter() {
        *alive_ = false;
        for (auto& entry : entries_) entry->active = false;
    }

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;
    EventEmitter(EventEmitter&&) = delete;
    EventEmitter& operator=(EventEmitter&&) = delete;

    /// Append @p listener to the end of the listener list.
    /// @return Identifier used to unsubscribe
    SubscriptionId Subscribe(Listener listener) {
        auto entry = std::make_shared<Entry>();
        entry->id = next_id_++;
        entry->listener = std::move(listener);
        entries_.push_back(entry);
        return entry->id;
    }

    /// Remove the listener registered under @p id.
    /// @return false if no such listener exists
    bool Unsubscribe(SubscriptionId id) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
            [id](const auto& e) { return e->id == id; });
        if (it == entries_.end()) return false;
        (*it)->active = false;
        entries_.erase(it);
        return true;
    }

    /// Invoke every listener, in registration order, with @p args.
    void Emit(Args... args) {
        // Snapshot so listeners may subscribe, unsubscribe, or destroy us.
        auto snapshot = entries_;
        for (auto& entry : snapshot) {
            if (entry->active) entry->listener(args...);
        }
    }

    /// Remove all listeners.
    void Clear() {
        for (auto& entry : entries_) entry->active = false;
        entries_.clear();
    }

    size_t ListenerCount() const noexcept { return entries_.size(); }

    /// Liveness token observed by ScopedSubscription.
    std::shared_ptr<bool> AliveToken() const { return alive_; }

private:
    struct Entry {
        SubscriptionId id = 0;
        Listener listener;
        bool active = true;
    };

    std::vector<std::shared_ptr<Entry>> entries_;
    SubscriptionId next_id_ = 1;
    std::shared_ptr<bool> alive_;
};

/// RAII subscription: unsubscribes on destruction or Reset().
///
/// Safe to outlive the emitter; the emitter's liveness token is checked
/// before unsubscribing.
class ScopedSubscription {
public:
    ScopedSubscription() = default;

    template<typename... Args>
    ScopedSubscription(EventEmitter<Args...>& emitter,
                       typename EventEmitter<Args...>::Listener listener)
        : alive_(emitter.AliveToken()) {
        auto id = emitter.Subscribe(std::move(listener));
        EventEmitter<Args...>* target = &emitter;
        unsubscribe_ = [target, id]() { target->Unsubscribe(id); };
    }

    ~ScopedSubscription() { Reset(); }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : alive_(std::move(other.alive_)),
          unsubscribe_(std::move(other.unsubscribe_)) {
        other.unsubscribe_ = nullptr;
    }

    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            Reset();
            alive_ = std::move(other.alive_);
            unsubscribe_ = std::move(other.unsubscribe_);
            other.unsubscribe_ = nullptr;
        }
        return *this;
    }

    /// Unsubscribe now. Idempotent.
    void Reset() {
        if (unsubscribe_ && alive_ && *alive_) unsubscribe_();
        unsubscribe_ = nullptr;
        alive_.reset();
    }

    bool IsActive() const { return unsubscribe_ && alive_ && *alive_; }

private:
    std::shared_ptr<bool> alive_;
    std::function<void()> unsubscribe_;
};

}  // namespace stream_pump
