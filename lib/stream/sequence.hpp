// SPDX-License-Identifier: MIT

// lib/stream/sequence.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "stream_pump/stream/completion.hpp"
#include "stream_pump/stream/error.hpp"

namespace stream_pump {

/// Ordered chain of asynchronous steps.
///
/// Each step receives a continuation and must call it once when its work
/// is done. Step N+1 starts only after step N reported success; the first
/// failure skips every remaining step. The done callback fires exactly once.
///
/// Steps may complete inline or on a later loop turn. Inline completions
/// are iterated, not nested, so long chains use bounded stack.
///
/// @code
/// Sequence()
///     .Then([&](auto next) { ReadAll(a, next); })
///     .Then([&](auto next) { ReadAll(b, next); })
///     .Then([&](auto next) { WriteAll(c, next); })
///     .Run([](std::expected<void, Error> r) { ... });
/// @endcode
class Sequence {
public:
    using StepResult = std::expected<void, Error>;
    using Continuation = std::function<void(StepResult)>;
    using Step = std::function<void(Continuation)>;
    using DoneCallback = std::function<void(StepResult)>;

    /// Append @p step to the chain.
    Sequence& Then(Step step) {
        steps_.push_back(std::move(step));
        return *this;
    }

    size_t StepCount() const { return steps_.size(); }

    /// Run the steps in order. The Sequence may be destroyed or run again
    /// while a previous run is still in progress.
    void Run(DoneCallback on_done) const {
        auto runner = std::make_shared<Runner>(steps_, std::move(on_done));
        runner->Advance();
    }

private:
    struct Runner : std::enable_shared_from_this<Runner> {
        Runner(std::vector<Step> s, DoneCallback cb)
            : steps(std::move(s)), done(std::move(cb)) {}

        void Advance() {
            if (in_loop) {
                again = true;
                return;
            }

            auto self = this->shared_from_this();
            in_loop = true;
            do {
                again = false;
                if (done.IsDelivered()) break;
                if (next == steps.size()) {
                    done.OnResult();
                    break;
                }

                size_t index = next++;
                auto called = std::make_shared<bool>(false);
                steps[index]([self, called](StepResult result) {
                    if (*called) return;  // Duplicate continuation call
                    *called = true;
                    if (!result) {
                        self->done.OnError(result.error());
                        return;
                    }
                    self->Advance();
                });
            } while (again);
            in_loop = false;
        }

        std::vector<Step> steps;
        size_t next = 0;
        Completion<void> done;
        bool in_loop = false;
        bool again = false;
    };

    std::vector<Step> steps_;
};

}  // namespace stream_pump
