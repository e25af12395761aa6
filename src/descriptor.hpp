// SPDX-License-Identifier: MIT

// src/descriptor.hpp
#pragma once

#include <fcntl.h>
#include <sys/stat.h>

#include <cerrno>
#include <expected>
#include <string>

#include "stream_pump/stream/error.hpp"

namespace stream_pump {

// Returned by PrepareDescriptor when the flags were left untouched.
inline constexpr int kFlagsUnchanged = -1;

// Put a pipe/socket/tty descriptor into non-blocking mode so reads and
// writes return EAGAIN instead of stalling the loop. Regular files are
// left alone: they never block and cannot be polled.
//
// Returns the file status flags as they were before, or kFlagsUnchanged.
// O_NONBLOCK lives on the open file description, which a borrowed
// descriptor shares with other processes, so its owner must put the old
// flags back with RestoreDescriptor().
inline std::expected<int, Error> PrepareDescriptor(int fd) {
    struct stat st{};
    if (fstat(fd, &st) < 0) {
        return std::unexpected(Error{ErrorCode::OpenFailed,
            "fstat(" + std::to_string(fd) + ") failed", errno});
    }
    if (S_ISREG(st.st_mode) || S_ISBLK(st.st_mode)) return kFlagsUnchanged;

    int flags = fcntl(fd, F_GETFL);
    if (flags < 0) {
        return std::unexpected(Error{ErrorCode::OpenFailed,
            "fcntl(F_GETFL) failed on fd " + std::to_string(fd), errno});
    }
    if (flags & O_NONBLOCK) return kFlagsUnchanged;
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::unexpected(Error{ErrorCode::OpenFailed,
            "fcntl(O_NONBLOCK) failed on fd " + std::to_string(fd), errno});
    }
    return flags;
}

// Undo PrepareDescriptor(). Returns errno on failure, 0 otherwise.
inline int RestoreDescriptor(int fd, int saved_flags) {
    if (fd < 0 || saved_flags == kFlagsUnchanged) return 0;
    if (fcntl(fd, F_SETFL, saved_flags) < 0) return errno;
    return 0;
}

}  // namespace stream_pump
