// SPDX-License-Identifier: MIT

// example/pump_concat.cpp
//
// Concatenate two files into a third, one transfer after another.
//
//   pump_concat <a> <b> <out>
//
// A and B are each pumped into memory, then A+B is pumped into OUT. A
// failure in any step skips the rest; OUT is not created if reading A or B
// fails.

#include <csignal>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "stream_pump/stream/epoll_event_loop.hpp"
#include "stream_pump/stream/logger.hpp"
#include "stream_pump/stream/sequence.hpp"
#include "stream_pump/stream/stream_pump.hpp"
#include "stream_pump/buffer_sink.hpp"
#include "stream_pump/buffer_source.hpp"
#include "stream_pump/fd_sink.hpp"
#include "stream_pump/fd_source.hpp"

using namespace stream_pump;

namespace {

// Run one pump and report its outcome to the sequence.
void RunPump(std::shared_ptr<Source> source, std::shared_ptr<Sink> sink,
             Sequence::Continuation next) {
    auto pump = StreamPump::Create(std::move(source), std::move(sink));
    // The completion callback keeps the pump alive until it has fired.
    auto started = pump->Start([pump, next](StreamPump::Result result) mutable {
        if (!result) {
            next(std::unexpected(result.error()));
            return;
        }
        Logger::Instance().Info("concat: pumped {} bytes", result->bytes);
        next({});
    });
    if (!started) {
        next(std::unexpected(started.error()));
    }
}

// Step: read the whole of path into collected.
Sequence::Step ReadInto(EpollEventLoop& loop, std::string path,
                        std::shared_ptr<std::vector<std::byte>> collected) {
    return [&loop, path = std::move(path), collected](Sequence::Continuation next) {
        auto source = OpenFileSource(loop, path);
        if (!source) {
            next(std::unexpected(source.error()));
            return;
        }
        auto buffer = std::make_shared<BufferSink>(loop);
        RunPump(*source, buffer, [buffer, collected, next](Sequence::StepResult r) {
            if (r) {
                auto bytes = buffer->TakeContents();
                collected->insert(collected->end(), bytes.begin(), bytes.end());
            }
            next(std::move(r));
        });
    };
}

}  // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);

    if (auto env = Logger::Instance().InitFromEnvironment(); !env) {
        fmt::print(stderr, "warning: {}\n", Describe(env.error()));
    }

    if (argc != 4) {
        fmt::print(stderr, "Usage: {} <a> <b> <out>\n", argv[0]);
        return 2;
    }
    std::string out_path = argv[3];

    try {
        EpollEventLoop loop;
        auto collected = std::make_shared<std::vector<std::byte>>();
        int exit_code = 1;

        Sequence()
            .Then(ReadInto(loop, argv[1], collected))
            .Then(ReadInto(loop, argv[2], collected))
            .Then([&loop, &out_path, collected](Sequence::Continuation next) {
                auto sink = CreateFileSink(loop, out_path);
                if (!sink) {
                    next(std::unexpected(sink.error()));
                    return;
                }
                auto source = std::make_shared<BufferSource>(loop, std::move(*collected));
                RunPump(source, *sink, std::move(next));
            })
            .Run([&](Sequence::StepResult result) {
                if (result) {
                    fmt::print(stderr, "wrote '{}'\n", out_path);
                    exit_code = 0;
                } else {
                    fmt::print(stderr, "error: {}\n", Describe(result.error()));
                    exit_code = result.error().code == ErrorCode::ConfigurationError ? 2 : 1;
                }
                loop.Stop();
            });

        loop.Run();
        return exit_code;
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
}
