// SPDX-License-Identifier: MIT

// example/pump_copy.cpp
//
// Copy a file to another file (or to stdout) through a StreamPump.
//
//   pump_copy [--chunk-size N] <src> [<dst>]
//
// Exit status: 0 on success, 1 if the transfer failed, 2 on bad usage or
// configuration.

#include <getopt.h>
#include <unistd.h>

#include <csignal>
#include <cstdio>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "stream_pump/stream/config.hpp"
#include "stream_pump/stream/epoll_event_loop.hpp"
#include "stream_pump/stream/logger.hpp"
#include "stream_pump/stream/sink.hpp"
#include "stream_pump/stream/stream_pump.hpp"
#include "stream_pump/fd_sink.hpp"
#include "stream_pump/fd_source.hpp"

using namespace stream_pump;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

struct Options {
    std::string source;
    std::optional<std::string> destination;
    PumpConfig pump;
    bool help = false;
};

void PrintUsage(const char* prog) {
    fmt::print(stderr, "Usage: {} [options] <src> [<dst>]\n", prog);
    fmt::print(stderr, "  Copies <src> to <dst>, or to stdout when <dst> is omitted.\n");
    fmt::print(stderr, "  -c, --chunk-size N  bytes per read (positive integer, default {})\n",
               kDefaultHighWaterMark);
    fmt::print(stderr, "  -h, --help          show this help\n");
}

std::expected<Options, Error> ParseArgs(int argc, char* argv[]) {
    static constexpr struct option long_options[] = {
        {"chunk-size", required_argument, nullptr, 'c'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    Options options;
    opterr = 0;  // Errors are returned, not printed by getopt
    int ret;
    while ((ret = getopt_long(argc, argv, ":c:h", long_options, nullptr)) != -1) {
        switch (ret) {
        case 'c': {
            auto size = ParseChunkSize(optarg);
            if (!size) return std::unexpected(size.error());
            options.pump.chunk_size = *size;
            break;
        }
        case 'h':
            options.help = true;
            return options;
        case ':':
            return std::unexpected(Error{ErrorCode::ConfigurationError,
                                         "--chunk-size requires a value"});
        default:
            return std::unexpected(Error{ErrorCode::ConfigurationError,
                fmt::format("unknown option '{}'", argv[optind - 1])});
        }
    }

    int positional = argc - optind;
    if (positional < 1 || positional > 2) {
        return std::unexpected(Error{ErrorCode::ConfigurationError,
                                     "expected <src> and optional <dst>"});
    }
    options.source = argv[optind];
    if (positional == 2) options.destination = argv[optind + 1];
    return options;
}

}  // namespace

int main(int argc, char* argv[]) {
    // A closed stdout pipe must surface as EPIPE, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    auto& log = Logger::Instance();
    if (auto env = log.InitFromEnvironment(); !env) {
        fmt::print(stderr, "warning: {}\n", Describe(env.error()));
    }

    auto options = ParseArgs(argc, argv);
    if (!options) {
        fmt::print(stderr, "error: {}\n", options.error().message);
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    if (options->help) {
        PrintUsage(argv[0]);
        return kExitOk;
    }

    try {
        EpollEventLoop loop;

        auto source = OpenFileSource(loop, options->source);
        if (!source) {
            fmt::print(stderr, "error: {}\n", Describe(source.error()));
            return kExitFailed;
        }

        std::shared_ptr<Sink> sink;
        if (options->destination) {
            auto file = CreateFileSink(loop, *options->destination);
            if (!file) {
                fmt::print(stderr, "error: {}\n", Describe(file.error()));
                return kExitFailed;
            }
            sink = *file;
        } else {
            auto out = AdoptSink(loop, STDOUT_FILENO, /*owns_fd=*/false);
            if (!out) {
                fmt::print(stderr, "error: {}\n", Describe(out.error()));
                return kExitFailed;
            }
            sink = *out;
        }

        auto pump = StreamPump::Create(*source, sink, options->pump);
        int exit_code = kExitFailed;

        auto started = pump->Start([&](StreamPump::Result result) {
            if (result) {
                fmt::print(stderr, "copied {} bytes in {} chunks\n",
                           result->bytes, result->chunks);
                exit_code = kExitOk;
            } else {
                fmt::print(stderr, "error: {}\n", Describe(result.error()));
                exit_code = result.error().code == ErrorCode::ConfigurationError
                                ? kExitUsage : kExitFailed;
            }
            loop.Stop();
        });
        if (!started) {
            fmt::print(stderr, "error: {}\n", Describe(started.error()));
            return kExitUsage;
        }

        loop.Run();
        return exit_code;
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return kExitFailed;
    }
}
