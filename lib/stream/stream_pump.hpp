// SPDX-License-Identifier: MIT

// lib/stream/stream_pump.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>

#include "stream_pump/stream/completion.hpp"
#include "stream_pump/stream/config.hpp"
#include "stream_pump/stream/error.hpp"
#include "stream_pump/stream/event_emitter.hpp"
#include "stream_pump/stream/sink.hpp"
#include "stream_pump/stream/source.hpp"

namespace stream_pump {

/// Lifecycle of a transfer.
enum class PumpState {
    Idle,      ///< Created, Start() not yet called
    Active,    ///< Requesting and forwarding chunks
    Draining,  ///< Sink is full; waiting for its drain notification
    Finished,  ///< Source exhausted, sink flushed (terminal)
    Failed,    ///< Read/write error or cancellation (terminal)
};

constexpr std::string_view to_string(PumpState state) {
    switch (state) {
        case PumpState::Idle:     return "Idle";
        case PumpState::Active:   return "Active";
        case PumpState::Draining: return "Draining";
        case PumpState::Finished: return "Finished";
        case PumpState::Failed:   return "Failed";
    }
    return "Unknown";
}

/// Bytes and chunks handed to the sink so far.
struct TransferStats {
    uint64_t bytes = 0;
    uint64_t chunks = 0;
};

// StreamPump - moves a byte stream from a Source to a Sink.
//
// One chunk of at most chunk_size bytes is requested at a time and written
// to the sink before the next one is requested. When Sink::Write() reports
// the sink is full, the pump stops reading until the sink publishes drain.
//
// State machine:
//   Idle -> Active <-> Draining
//             |           |
//             +-----------+-> Finished (end of data, sink finished)
//             +-----------+-> Failed   (read/write error, Cancel)
//
// The completion callback fires exactly once per started transfer: with
// the TransferStats on Finished, with the first Error on Failed. Anything
// that arrives after a terminal state (late read results, sink errors, a
// second Cancel) is discarded.
//
// Threading: single event loop thread, no locks. Sources and sinks may
// complete inline; the pump iterates rather than recursing in that case.
//
// Ownership: the pump holds the source and sink exclusively for the
// transfer and closes both when it reaches a terminal state or is destroyed.
class StreamPump : public std::enable_shared_from_this<StreamPump> {
public:
    using Result = std::expected<TransferStats, Error>;
    using CompletionCallback = std::function<void(Result)>;

    struct PrivateTag {};  // Force use of Create()

    StreamPump(PrivateTag,
               std::shared_ptr<Source> source,
               std::shared_ptr<Sink> sink,
               PumpConfig config);

    ~StreamPump();

    StreamPump(const StreamPump&) = delete;
    StreamPump& operator=(const StreamPump&) = delete;
    StreamPump(StreamPump&&) = delete;
    StreamPump& operator=(StreamPump&&) = delete;

    static std::shared_ptr<StreamPump> Create(
        std::shared_ptr<Source> source,
        std::shared_ptr<Sink> sink,
        PumpConfig config = PumpConfig::Defaults());

    /// Begin the transfer.
    ///
    /// @return ConfigurationError for an invalid chunk size or a missing
    ///         endpoint, InvalidState if the pump is not Idle. On error no
    ///         transfer starts and @p on_complete is never invoked.
    std::expected<void, Error> Start(CompletionCallback on_complete);

    /// Abort the transfer: stop reading, close both endpoints and report
    /// CancellationError. No-op once terminal.
    void Cancel();

    PumpState State() const { return state_; }
    bool IsTerminal() const {
        return state_ == PumpState::Finished || state_ == PumpState::Failed;
    }

    const TransferStats& Stats() const { return stats_; }
    size_t ChunkSize() const { return config_.chunk_size; }

    /// Published on every state transition, after the state has changed.
    EventEmitter<PumpState>& OnStateChange() { return state_changed_; }

private:
    void ReadNext();
    void HandleRead(Source::ReadResult result);
    void HandleDrain();
    void HandleSinkError(const Error& e);
    void HandleSinkFinish();
    void BeginEnd();
    void Finish();
    void Fail(const Error& e);
    void TransitionTo(PumpState next);
    void ReleaseEndpoints();

    std::shared_ptr<Source> source_;
    std::shared_ptr<Sink> sink_;
    PumpConfig config_;

    PumpState state_ = PumpState::Idle;
    TransferStats stats_;
    Completion<TransferStats> completion_;
    EventEmitter<PumpState> state_changed_;

    ScopedSubscription drain_sub_;
    ScopedSubscription error_sub_;
    ScopedSubscription finish_sub_;

    // Read trampoline
    bool in_read_loop_ = false;  // Inside ReadNext()
    bool read_again_ = false;    // Inline completion asked for another read
    bool read_pending_ = false;  // A Read() is outstanding
    bool ending_ = false;        // End() sent, waiting for sink finish
};

}  // namespace stream_pump
