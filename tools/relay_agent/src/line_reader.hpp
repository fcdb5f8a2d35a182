// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file line_reader.hpp
/// @brief Newline-delimited reader on a file descriptor that can be stopped
///
/// Waits for input with poll() in short slices and checks a stop flag between
/// them, so a shutdown request ends a read even when the writer stays silent.

#include <atomic>
#include <chrono>
#include <string>

namespace relay::agent {

class LineReader {
public:
    enum class Result {
        Line,     ///< `line` holds the next line, without its newline
        Eof,      ///< writer closed and no buffered data is left
        Stopped,  ///< stop flag was set before a complete line arrived
    };

    explicit LineReader(int fd,
                        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    /// Read the next line. A final line without a trailing newline is
    /// returned before Eof.
    /// @throws std::system_error if poll() or read() fails
    Result next(std::string& line, const std::atomic<bool>& stop);

private:
    bool take_buffered_line(std::string& line);

    int fd_;
    std::chrono::milliseconds poll_interval_;
    std::string buffer_;
    bool eof_ = false;
};

}  // namespace relay::agent
