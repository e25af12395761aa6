// SPDX-License-Identifier: MIT

// lib/stream/completion.hpp
#pragma once

#include <expected>
#include <functional>
#include <utility>

#include "stream_pump/stream/error.hpp"

namespace stream_pump {

/// Exactly-once delivery of a terminal result.
///
/// The first OnResult() or OnError() wins; every later call is dropped.
/// Invalidate() drops all future deliveries (used when the owner is torn
/// down before the producer finishes).
template<typename Result>
class Completion {
public:
    using ResultType = Result;
    using Callback = std::function<void(std::expected<Result, Error>)>;

    Completion() = default;
    explicit Completion(Callback on_result) : on_result_(std::move(on_result)) {}

    void OnResult(Result result) {
        if (!valid_ || delivered_) return;
        delivered_ = true;
        Deliver(std::expected<Result, Error>(std::move(result)));
    }

    void OnError(const Error& e) {
        if (!valid_ || delivered_) return;
        delivered_ = true;
        Deliver(std::unexpected(e));
    }

    void Invalidate() { valid_ = false; }

    bool IsDelivered() const { return delivered_; }

private:
    void Deliver(std::expected<Result, Error> result) {
        // Move out first: the callback may destroy the object owning us.
        auto cb = std::move(on_result_);
        on_result_ = nullptr;
        if (cb) cb(std::move(result));
    }

    Callback on_result_;
    bool valid_ = true;
    bool delivered_ = false;
};

// void specialisation used by Sequence
template<>
class Completion<void> {
public:
    using ResultType = void;
    using Callback = std::function<void(std::expected<void, Error>)>;

    Completion() = default;
    explicit Completion(Callback on_result) : on_result_(std::move(on_result)) {}

    void OnResult() {
        if (!valid_ || delivered_) return;
        delivered_ = true;
        Deliver(std::expected<void, Error>());
    }

    void OnError(const Error& e) {
        if (!valid_ || delivered_) return;
        delivered_ = true;
        Deliver(std::unexpected(e));
    }

    void Invalidate() { valid_ = false; }

    bool IsDelivered() const { return delivered_; }

private:
    void Deliver(std::expected<void, Error> result) {
        auto cb = std::move(on_result_);
        on_result_ = nullptr;
        if (cb) cb(std::move(result));
    }

    Callback on_result_;
    bool valid_ = true;
    bool delivered_ = false;
};

}  // namespace stream_pump
