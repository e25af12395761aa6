// SPDX-License-Identifier: MIT

#include "stream_pump/stream/stream_pump.hpp"

#include <string>
#include <utility>

#include "stream_pump/stream/logger.hpp"

namespace stream_pump {

StreamPump::StreamPump(PrivateTag,
                       std::shared_ptr<Source> source,
                       std::shared_ptr<Sink> sink,
                       PumpConfig config)
    : source_(std::move(source)),
      sink_(std::move(sink)),
      config_(config) {}

StreamPump::~StreamPump() {
    if (state_ == PumpState::Idle || IsTerminal()) return;
    // Torn down mid-transfer: nobody is left to notify.
    completion_.Invalidate();
    ReleaseEndpoints();
}

std::shared_ptr<StreamPump> StreamPump::Create(std::shared_ptr<Source> source,
                                               std::shared_ptr<Sink> sink,
                                               PumpConfig config) {
    return std::make_shared<StreamPump>(PrivateTag{}, std::move(source),
                                        std::move(sink), config);
}

std::expected<void, Error> StreamPump::Start(CompletionCallback on_complete) {
    if (state_ != PumpState::Idle) {
        return std::unexpected(Error{ErrorCode::InvalidState,
            "Start called in state " + std::string(to_string(state_))});
    }
    if (auto valid = config_.Validate(); !valid) {
        return std::unexpected(valid.error());
    }
    if (!source_ || !sink_) {
        return std::unexpected(Error{ErrorCode::ConfigurationError,
            "pump requires both a source and a sink"});
    }

    auto self = shared_from_this();
    completion_ = Completion<TransferStats>(std::move(on_complete));

    std::weak_ptr<StreamPump> weak_self = self;
    drain_sub_ = ScopedSubscription(sink_->OnDrain(), [weak_self]() {
        if (auto pump = weak_self.lock()) pump->HandleDrain();
    });
    error_sub_ = ScopedSubscription(sink_->OnError(), [weak_self](const Error& e) {
        if (auto pump = weak_self.lock()) pump->HandleSinkError(e);
    });
    finish_sub_ = ScopedSubscription(sink_->OnFinish(), [weak_self]() {
        if (auto pump = weak_self.lock()) pump->HandleSinkFinish();
    });

    TransitionTo(PumpState::Active);
    ReadNext();
    return {};
}

void StreamPump::Cancel() {
    if (IsTerminal()) return;
    auto self = shared_from_this();
    Fail(Error{ErrorCode::CancellationError, "transfer cancelled"});
}

// Issue reads until one stays pending, the sink fills up, or the transfer
// ends. Inline completions set read_again_ instead of recursing.
void StreamPump::ReadNext() {
    if (in_read_loop_) {
        read_again_ = true;
        return;
    }

    auto self = shared_from_this();
    in_read_loop_ = true;
    do {
        read_again_ = false;
        if (state_ != PumpState::Active || ending_ || read_pending_) break;

        read_pending_ = true;
        std::weak_ptr<StreamPump> weak_self = self;
        source_->Read(config_.chunk_size, [weak_self](Source::ReadResult result) {
            if (auto pump = weak_self.lock()) pump->HandleRead(std::move(result));
        });
    } while (read_again_);
    in_read_loop_ = false;
}

void StreamPump::HandleRead(Source::ReadResult result) {
    read_pending_ = false;
    if (IsTerminal()) return;

    if (!result) {
        Error e = result.error();
        e.code = ErrorCode::SourceReadError;
        Fail(e);
        return;
    }

    Chunk chunk = std::move(*result);
    if (chunk.Empty()) {
        BeginEnd();
        return;
    }

    size_t size = chunk.Size();
    if (size > config_.chunk_size) {
        Fail(Error{ErrorCode::SourceReadError,
            "source returned " + std::to_string(size) + " bytes, requested at most " +
            std::to_string(config_.chunk_size)});
        return;
    }

    auto self = shared_from_this();
    auto accepted = sink_->Write(std::move(chunk));
    if (IsTerminal()) return;  // Sink published an error during Write()

    if (!accepted) {
        Error e = accepted.error();
        e.code = ErrorCode::SinkWriteError;
        Fail(e);
        return;
    }

    stats_.bytes += size;
    ++stats_.chunks;

    if (!*accepted) {
        TransitionTo(PumpState::Draining);
        return;
    }
    ReadNext();
}

void StreamPump::HandleDrain() {
    if (state_ != PumpState::Draining) return;
    TransitionTo(PumpState::Active);
    ReadNext();
}

void StreamPump::HandleSinkError(const Error& e) {
    if (IsTerminal()) return;
    Error err = e;
    err.code = ErrorCode::SinkWriteError;
    Fail(err);
}

void StreamPump::HandleSinkFinish() {
    if (IsTerminal()) return;
    if (!ending_) {
        Fail(Error{ErrorCode::SinkWriteError, "sink finished before end of data"});
        return;
    }
    Finish();
}

void StreamPump::BeginEnd() {
    ending_ = true;
    Logger::Instance().Debug("pump: end of data after {} bytes in {} chunks",
                             stats_.bytes, stats_.chunks);
    auto self = shared_from_this();
    sink_->End();
}

void StreamPump::Finish() {
    TransitionTo(PumpState::Finished);
    ReleaseEndpoints();
    completion_.OnResult(stats_);
}

void StreamPump::Fail(const Error& e) {
    if (IsTerminal()) return;
    TransitionTo(PumpState::Failed);
    if (e.code == ErrorCode::CancellationError) {
        Logger::Instance().Info("pump: cancelled after {} bytes", stats_.bytes);
    } else {
        Logger::Instance().Error("pump: transfer failed after {} bytes: {}",
                                 stats_.bytes, Describe(e));
    }
    ReleaseEndpoints();
    completion_.OnError(e);
}

void StreamPump::TransitionTo(PumpState next) {
    PumpState prev = state_;
    state_ = next;
    Logger::Instance().Debug("pump: {} -> {}", to_string(prev), to_string(next));
    state_changed_.Emit(next);
}

// Drop our subscriptions first so closing cannot call back into us.
void StreamPump::ReleaseEndpoints() {
    drain_sub_.Reset();
    error_sub_.Reset();
    finish_sub_.Reset();
    if (source_) source_->Close();
    if (sink_) sink_->Close();
}

}  // namespace stream_pump
