// SPDX-License-Identifier: MIT

// lib/stream/logger.hpp
#pragma once

#include <atomic>
#include <expected>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "stream_pump/stream/error.hpp"

namespace stream_pump {

enum class LogLevel { Debug, Info, Warn, Error, Off };

std::string_view to_string(LogLevel level);

/// Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
std::expected<LogLevel, Error> ParseLogLevel(std::string_view text);

/// One-line description of an error: "[category] Code: message (errno N: text)".
std::string Describe(const Error& e);

/// Process-wide levelled logger.
///
/// Messages are formatted with {fmt} and written to stderr as
/// "stream-pump <LEVEL>: <message>". The output can be redirected with
/// SetOutput() (tests capture lines this way). The level check is a relaxed
/// atomic load, so disabled messages are never formatted.
///
/// @code
/// Logger::Instance().Error("transfer failed: {}", Describe(err));
/// @endcode
class Logger {
public:
    using Output = std::function<void(LogLevel, std::string_view)>;

    static Logger& Instance();

    void SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel Level() const { return level_.load(std::memory_order_relaxed); }

    bool Enabled(LogLevel level) const {
        return level != LogLevel::Off && level >= Level();
    }

    /// Replace the output function. nullptr restores stderr.
    void SetOutput(Output output);

    /// Apply STREAM_PUMP_LOG_LEVEL if set and valid.
    /// @return the error for an unparseable value (level left unchanged)
    std::expected<void, stream_pump::Error> InitFromEnvironment();

    template<typename... T>
    void Log(LogLevel level, fmt::format_string<T...> format, T&&... args) {
        if (!Enabled(level)) return;
        Write(level, fmt::format(format, std::forward<T>(args)...));
    }

    template<typename... T>
    void Debug(fmt::format_string<T...> format, T&&... args) {
        Log(LogLevel::Debug, format, std::forward<T>(args)...);
    }

    template<typename... T>
    void Info(fmt::format_string<T...> format, T&&... args) {
        Log(LogLevel::Info, format, std::forward<T>(args)...);
    }

    template<typename... T>
    void Warn(fmt::format_string<T...> format, T&&... args) {
        Log(LogLevel::Warn, format, std::forward<T>(args)...);
    }

    template<typename... T>
    void Error(fmt::format_string<T...> format, T&&... args) {
        Log(LogLevel::Error, format, std::forward<T>(args)...);
    }

private:
    Logger() = default;

    void Write(LogLevel level, const std::string& message);

    std::atomic<LogLevel> level_{LogLevel::Warn};
    std::mutex output_mutex_;
    Output output_;
};

}  // namespace stream_pump
