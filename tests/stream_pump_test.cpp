// SPDX-License-Identifier: MIT

// tests/stream_pump_test.cpp
#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stream_pump/stream/logger.hpp"
#include "stream_pump/stream/sink.hpp"
#include "stream_pump/stream/source.hpp"
#include "stream_pump/stream/stream_pump.hpp"

using namespace stream_pump;

namespace {

// Source producing `length` bytes of 'a'. Reads complete inline unless
// `deferred` is set, in which case the test calls Complete().
class ScriptedSource : public Source {
public:
    explicit ScriptedSource(size_t length) : remaining_(length) {}

    void Read(size_t max_bytes, ReadCallback callback) override {
        ++reads;
        requested.push_back(max_bytes);
        pending_ = std::move(callback);
        pending_max_ = max_bytes;
        if (!deferred) Complete();
    }

    void Close() override { ++closes; }

    // Deliver the outstanding read.
    void Complete() {
        if (!pending_) return;
        auto cb = std::move(pending_);
        pending_ = nullptr;

        ++served;
        if (fail_on_read && served == *fail_on_read) {
            cb(std::unexpected(Error{fail_code, "injected read failure", 5}));
            return;
        }
        if (oversize) {
            cb(Chunk(std::vector<std::byte>(pending_max_ + 1)));
            return;
        }
        size_t n = std::min(pending_max_, remaining_);
        remaining_ -= n;
        cb(Chunk(std::vector<std::byte>(n, std::byte{'a'})));
    }

    bool HasPending() const { return static_cast<bool>(pending_); }

    bool deferred = false;
    bool oversize = false;
    std::optional<int> fail_on_read;  // 1-based read index that fails
    ErrorCode fail_code = ErrorCode::SourceReadError;

    int reads = 0;
    int served = 0;
    int closes = 0;
    std::vector<size_t> requested;

private:
    size_t remaining_;
    size_t pending_max_ = 0;
    ReadCallback pending_;
};

// Sink recording every write. Write() returns false once the unflushed
// backlog reaches `high_water_mark`; the test releases it with Drain().
class RecordingSink : public Sink {
public:
    explicit RecordingSink(size_t high_water_mark = SIZE_MAX)
        : high_water_mark_(high_water_mark) {}

    WriteResult Write(Chunk chunk) override {
        if (full) ++writes_while_full;
        if (reject_writes) {
            return std::unexpected(Error{ErrorCode::InvalidState, "rejected"});
        }
        writes.push_back(chunk.Size());
        total += chunk.Size();
        backlog_ += chunk.Size();
        if (backlog_ >= high_water_mark_) {
            full = true;
            return false;
        }
        return true;
    }

    void End() override {
        ++ends;
        if (auto_finish) finish_.Emit();
    }

    void Close() override { ++closes; }

    void Drain() {
        backlog_ = 0;
        full = false;
        drain_.Emit();
    }

    void Finish() { finish_.Emit(); }
    void EmitError(const Error& e) { error_.Emit(e); }

    bool reject_writes = false;
    bool auto_finish = true;
    bool full = false;

    std::vector<size_t> writes;
    size_t total = 0;
    int writes_while_full = 0;
    int ends = 0;
    int closes = 0;

private:
    size_t high_water_mark_;
    size_t backlog_ = 0;
};

struct Outcome {
    int calls = 0;
    std::optional<StreamPump::Result> result;

    StreamPump::CompletionCallback Callback() {
        return [this](StreamPump::Result r) {
            ++calls;
            result = std::move(r);
        };
    }
};

}  // namespace

class StreamPumpTest : public ::testing::Test {
protected:
    std::shared_ptr<StreamPump> MakePump(size_t length, size_t chunk_size,
                                         size_t high_water_mark = SIZE_MAX) {
        source_ = std::make_shared<ScriptedSource>(length);
        sink_ = std::make_shared<RecordingSink>(high_water_mark);
        return StreamPump::Create(source_, sink_, PumpConfig{chunk_size});
    }

    std::shared_ptr<ScriptedSource> source_;
    std::shared_ptr<RecordingSink> sink_;
    Outcome outcome_;
};

TEST_F(StreamPumpTest, CopiesInChunkSizedPieces) {
    auto pump = MakePump(150000, 65536);

    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    EXPECT_EQ(sink_->writes, (std::vector<size_t>{65536, 65536, 18928}));
    ASSERT_EQ(outcome_.calls, 1);
    ASSERT_TRUE(outcome_.result->has_value());
    EXPECT_EQ((*outcome_.result)->bytes, 150000u);
    EXPECT_EQ((*outcome_.result)->chunks, 3u);
    EXPECT_EQ(pump->State(), PumpState::Finished);
    EXPECT_EQ(sink_->ends, 1);
}

TEST_F(StreamPumpTest, EveryReadRequestsChunkSize) {
    auto pump = MakePump(10000, 4096);
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    for (size_t requested : source_->requested) {
        EXPECT_EQ(requested, 4096u);
    }
}

TEST_F(StreamPumpTest, EmptySourceEndsSinkWithoutWrites) {
    auto pump = MakePump(0, 65536);
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    EXPECT_TRUE(sink_->writes.empty());
    EXPECT_EQ(sink_->ends, 1);
    ASSERT_EQ(outcome_.calls, 1);
    ASSERT_TRUE(outcome_.result->has_value());
    EXPECT_EQ((*outcome_.result)->bytes, 0u);
    EXPECT_EQ((*outcome_.result)->chunks, 0u);
}

TEST_F(StreamPumpTest, ChunkCountIsCeilingOfLengthOverChunkSize) {
    struct Case { size_t length; size_t chunk; };
    for (auto c : {Case{1, 1}, Case{7, 3}, Case{9, 3}, Case{100, 1000},
                   Case{65536, 65536}, Case{65537, 65536}}) {
        Outcome outcome;
        auto pump = MakePump(c.length, c.chunk);
        ASSERT_TRUE(pump->Start(outcome.Callback()).has_value());

        ASSERT_TRUE(outcome.result && outcome.result->has_value());
        size_t expected = (c.length + c.chunk - 1) / c.chunk;
        EXPECT_EQ(sink_->writes.size(), expected) << c.length << "/" << c.chunk;
        EXPECT_EQ(sink_->total, c.length);
        EXPECT_EQ((*outcome.result)->chunks, expected);
    }
}

TEST_F(StreamPumpTest, StopsReadingUntilSinkDrains) {
    auto pump = MakePump(10 * 100, 100, /*high_water_mark=*/250);
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    // Third write crosses the mark.
    EXPECT_EQ(sink_->writes.size(), 3u);
    EXPECT_EQ(pump->State(), PumpState::Draining);
    EXPECT_EQ(source_->reads, 3);
    EXPECT_EQ(outcome_.calls, 0);

    for (int i = 0; i < 10 && sink_->full; ++i) {
        EXPECT_EQ(pump->State(), PumpState::Draining);
        sink_->Drain();
    }

    EXPECT_EQ(sink_->writes_while_full, 0);
    ASSERT_EQ(outcome_.calls, 1);
    EXPECT_TRUE(outcome_.result->has_value());
    EXPECT_EQ(sink_->total, 1000u);
}

TEST_F(StreamPumpTest, DrainWhileActiveIsIgnored) {
    auto pump = MakePump(300, 100);
    source_->deferred = true;
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    sink_->Drain();
    EXPECT_EQ(source_->reads, 1);  // No duplicate read
    EXPECT_EQ(pump->State(), PumpState::Active);
}

TEST_F(StreamPumpTest, ReadFailureStopsTransfer) {
    auto pump = MakePump(1000, 100);
    source_->fail_on_read = 4;
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    EXPECT_EQ(sink_->writes.size(), 3u);
    EXPECT_EQ(sink_->ends, 0);
    EXPECT_EQ(source_->reads, 4);
    ASSERT_EQ(outcome_.calls, 1);
    ASSERT_FALSE(outcome_.result->has_value());
    EXPECT_EQ(outcome_.result->error().code, ErrorCode::SourceReadError);
    EXPECT_EQ(outcome_.result->error().os_errno, 5);
    EXPECT_EQ(pump->State(), PumpState::Failed);
    EXPECT_GE(sink_->closes, 1);
    EXPECT_GE(source_->closes, 1);
}

TEST_F(StreamPumpTest, FailureIsLoggedAtErrorLevel) {
    auto& log = Logger::Instance();
    LogLevel saved = log.Level();
    std::vector<std::pair<LogLevel, std::string>> lines;
    log.SetLevel(LogLevel::Error);
    log.SetOutput([&](LogLevel level, std::string_view message) {
        lines.emplace_back(level, std::string(message));
    });

    auto pump = MakePump(1000, 100);
    source_->fail_on_read = 2;
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    log.SetOutput(nullptr);
    log.SetLevel(saved);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].first, LogLevel::Error);
    EXPECT_NE(lines[0].second.find("transfer failed after 100 bytes"), std::string::npos);
}

TEST_F(StreamPumpTest, SourceErrorsAreReportedAsReadErrors) {
    auto pump = MakePump(1000, 100);
    source_->fail_on_read = 1;
    source_->fail_code = ErrorCode::InvalidState;
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    ASSERT_TRUE(outcome_.result.has_value());
    EXPECT_EQ(outcome_.result->error().code, ErrorCode::SourceReadError);
}

TEST_F(StreamPumpTest, OversizeChunkFails) {
    auto pump = MakePump(1000, 100);
    source_->oversize = true;
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    ASSERT_TRUE(outcome_.result.has_value());
    EXPECT_EQ(outcome_.result->error().code, ErrorCode::SourceReadError);
    EXPECT_TRUE(sink_->writes.empty());
}

TEST_F(StreamPumpTest, RejectedWriteFailsWithoutFurtherReads) {
    auto pump = MakePump(1000, 100);
    sink_->reject_writes = true;
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    EXPECT_EQ(source_->reads, 1);
    ASSERT_EQ(outcome_.calls, 1);
    EXPECT_EQ(outcome_.result->error().code, ErrorCode::SinkWriteError);
    EXPECT_EQ(pump->Stats().chunks, 0u);
    EXPECT_EQ(pump->State(), PumpState::Failed);
}

TEST_F(StreamPumpTest, SinkErrorWhileDrainingFails) {
    auto pump = MakePump(1000, 100, /*high_water_mark=*/100);
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());
    ASSERT_EQ(pump->State(), PumpState::Draining);

    sink_->EmitError(Error{ErrorCode::InvalidState, "device gone", 19});

    ASSERT_EQ(outcome_.calls, 1);
    EXPECT_EQ(outcome_.result->error().code, ErrorCode::SinkWriteError);
    EXPECT_EQ(outcome_.result->error().message, "device gone");

    // Further notifications are ignored.
    sink_->Drain();
    sink_->EmitError(Error{ErrorCode::SinkWriteError, "again"});
    EXPECT_EQ(outcome_.calls, 1);
    EXPECT_EQ(source_->reads, 1);
}

TEST_F(StreamPumpTest, CancelDuringPendingRead) {
    auto pump = MakePump(1000, 100);
    source_->deferred = true;
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());
    source_->Complete();
    ASSERT_TRUE(source_->HasPending());

    pump->Cancel();

    ASSERT_EQ(outcome_.calls, 1);
    EXPECT_EQ(outcome_.result->error().code, ErrorCode::CancellationError);
    EXPECT_EQ(pump->State(), PumpState::Failed);
    EXPECT_GE(source_->closes, 1);
    EXPECT_GE(sink_->closes, 1);

    // A read finishing after cancellation is discarded.
    size_t writes_before = sink_->writes.size();
    source_->Complete();
    EXPECT_EQ(sink_->writes.size(), writes_before);
    EXPECT_EQ(outcome_.calls, 1);
}

TEST_F(StreamPumpTest, CancelWhileDraining) {
    auto pump = MakePump(1000, 100, /*high_water_mark=*/100);
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());
    ASSERT_EQ(pump->State(), PumpState::Draining);

    pump->Cancel();
    sink_->Drain();

    EXPECT_EQ(outcome_.calls, 1);
    EXPECT_EQ(outcome_.result->error().code, ErrorCode::CancellationError);
    EXPECT_EQ(source_->reads, 1);
}

// End() has been sent but the sink has not flushed yet.
TEST_F(StreamPumpTest, CancelWhileWaitingForSinkFinish) {
    auto pump = MakePump(250, 100);
    sink_->auto_finish = false;
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());
    ASSERT_EQ(sink_->ends, 1);
    ASSERT_EQ(outcome_.calls, 0);

    pump->Cancel();
    sink_->Finish();

    ASSERT_EQ(outcome_.calls, 1);
    ASSERT_FALSE(outcome_.result->has_value());
    EXPECT_EQ(outcome_.result->error().code, ErrorCode::CancellationError);
    EXPECT_EQ(pump->State(), PumpState::Failed);
    EXPECT_GE(sink_->closes, 1);
}

TEST_F(StreamPumpTest, CancelAfterFinishIsNoop) {
    auto pump = MakePump(10, 4);
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());
    ASSERT_EQ(pump->State(), PumpState::Finished);

    pump->Cancel();
    pump->Cancel();

    EXPECT_EQ(outcome_.calls, 1);
    EXPECT_EQ(pump->State(), PumpState::Finished);
}

TEST_F(StreamPumpTest, WaitsForSinkFinishBeforeCompleting) {
    auto pump = MakePump(50, 100);
    sink_->auto_finish = false;
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    EXPECT_EQ(sink_->ends, 1);
    EXPECT_EQ(outcome_.calls, 0);
    EXPECT_FALSE(pump->IsTerminal());

    sink_->Finish();
    EXPECT_EQ(outcome_.calls, 1);
    EXPECT_EQ(pump->State(), PumpState::Finished);
}

TEST_F(StreamPumpTest, PrematureSinkFinishFails) {
    auto pump = MakePump(1000, 100, /*high_water_mark=*/100);
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    sink_->Finish();

    ASSERT_EQ(outcome_.calls, 1);
    EXPECT_EQ(outcome_.result->error().code, ErrorCode::SinkWriteError);
}

TEST_F(StreamPumpTest, ZeroChunkSizeRejectedAtStart) {
    auto pump = MakePump(100, 0);
    auto started = pump->Start(outcome_.Callback());

    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(outcome_.calls, 0);
    EXPECT_EQ(source_->reads, 0);
    EXPECT_EQ(pump->State(), PumpState::Idle);
}

TEST_F(StreamPumpTest, LargeChunkSizeIsAccepted) {
    constexpr size_t kChunk = size_t{32} * 1024 * 1024;
    auto pump = MakePump(0, kChunk);
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    EXPECT_EQ(source_->requested, (std::vector<size_t>{kChunk}));
    ASSERT_EQ(outcome_.calls, 1);
    ASSERT_TRUE(outcome_.result->has_value());
    EXPECT_EQ(pump->State(), PumpState::Finished);
}

TEST_F(StreamPumpTest, MissingEndpointRejectedAtStart) {
    auto pump = StreamPump::Create(nullptr, std::make_shared<RecordingSink>());
    auto started = pump->Start(outcome_.Callback());

    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(outcome_.calls, 0);
}

TEST_F(StreamPumpTest, SecondStartIsInvalid) {
    auto pump = MakePump(100, 10);
    source_->deferred = true;
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    Outcome second;
    auto again = pump->Start(second.Callback());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(source_->reads, 1);
    EXPECT_EQ(second.calls, 0);
}

TEST_F(StreamPumpTest, ReportsStateTransitions) {
    auto pump = MakePump(200, 100, /*high_water_mark=*/100);
    std::vector<PumpState> states;
    pump->OnStateChange().Subscribe([&](PumpState s) { states.push_back(s); });

    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());
    sink_->Drain();
    sink_->Drain();

    EXPECT_EQ(states, (std::vector<PumpState>{
        PumpState::Active, PumpState::Draining,
        PumpState::Active, PumpState::Draining,
        PumpState::Active, PumpState::Finished}));
}

TEST_F(StreamPumpTest, DeepSynchronousChainDoesNotOverflow) {
    constexpr size_t kChunks = 500000;
    auto pump = MakePump(kChunks, 1);
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    ASSERT_EQ(outcome_.calls, 1);
    ASSERT_TRUE(outcome_.result->has_value());
    EXPECT_EQ((*outcome_.result)->chunks, kChunks);
}

TEST_F(StreamPumpTest, CompletionMayReleaseLastReference) {
    auto pump = MakePump(300, 100);
    source_->deferred = true;
    bool done = false;

    std::shared_ptr<StreamPump> holder = pump;
    ASSERT_TRUE(holder->Start([&](StreamPump::Result) {
        done = true;
        holder.reset();
    }).has_value());
    pump.reset();

    while (source_->HasPending()) source_->Complete();
    EXPECT_TRUE(done);
    EXPECT_EQ(holder, nullptr);
}

TEST_F(StreamPumpTest, DestroyingActivePumpClosesEndpointsSilently) {
    auto pump = MakePump(300, 100);
    source_->deferred = true;
    ASSERT_TRUE(pump->Start(outcome_.Callback()).has_value());

    pump.reset();

    EXPECT_EQ(outcome_.calls, 0);
    EXPECT_GE(source_->closes, 1);
    EXPECT_GE(sink_->closes, 1);

    source_->Complete();  // Late result finds no pump
    EXPECT_EQ(outcome_.calls, 0);
}
