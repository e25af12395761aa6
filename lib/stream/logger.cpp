// SPDX-License-Identifier: MIT

#include "stream_pump/stream/logger.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace stream_pump {

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::expected<LogLevel, Error> ParseLogLevel(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;

    return std::unexpected(Error{ErrorCode::ConfigurationError,
        fmt::format("unknown log level '{}'", text)});
}

std::string Describe(const Error& e) {
    if (e.os_errno != 0) {
        return fmt::format("[{}] {}: {} (errno {}: {})",
            error_category(e.code), to_string(e.code), e.message,
            e.os_errno, std::strerror(e.os_errno));
    }
    return fmt::format("[{}] {}: {}",
        error_category(e.code), to_string(e.code), e.message);
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::SetOutput(Output output) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    output_ = std::move(output);
}

std::expected<void, stream_pump::Error> Logger::InitFromEnvironment() {
    const char* value = std::getenv("STREAM_PUMP_LOG_LEVEL");
    if (value == nullptr || *value == '\0') return {};

    auto level = ParseLogLevel(value);
    if (!level) return std::unexpected(level.error());
    SetLevel(*level);
    return {};
}

void Logger::Write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (output_) {
        output_(level, message);
        return;
    }
    fmt::print(stderr, "stream-pump {}: {}\n", to_string(level), message);
}

}  // namespace stream_pump
