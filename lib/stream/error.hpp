// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace stream_pump {

/// Error codes for all transfer and endpoint operations.
enum class ErrorCode {
    // Transfer (terminal, never retried)
    ConfigurationError,    ///< Chunk size or other option is invalid
    SourceReadError,       ///< Source failed while producing a chunk
    SinkWriteError,        ///< Sink rejected or failed a write
    CancellationError,     ///< Caller aborted the transfer

    // State
    InvalidState,          ///< Method called in wrong pump or sink state

    // Endpoint setup
    OpenFailed,            ///< File or descriptor could not be opened
};

/// Error payload delivered to completion and error callbacks.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "source", "sink").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigurationError:
            return "config";
        case ErrorCode::SourceReadError:
            return "source";
        case ErrorCode::SinkWriteError:
            return "sink";
        case ErrorCode::CancellationError:
            return "cancel";
        case ErrorCode::InvalidState:
            return "state";
        case ErrorCode::OpenFailed:
            return "io";
    }
    return "unknown";
}

/// Return the enumerator name of an error code.
constexpr std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigurationError: return "ConfigurationError";
        case ErrorCode::SourceReadError:    return "SourceReadError";
        case ErrorCode::SinkWriteError:     return "SinkWriteError";
        case ErrorCode::CancellationError:  return "CancellationError";
        case ErrorCode::InvalidState:       return "InvalidState";
        case ErrorCode::OpenFailed:         return "OpenFailed";
    }
    return "Unknown";
}

}  // namespace stream_pump
