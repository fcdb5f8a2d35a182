// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "line_reader.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace relay::agent {

namespace {

constexpr size_t kReadChunk = 4096;

}  // namespace

LineReader::LineReader(int fd, std::chrono::milliseconds poll_interval)
    : fd_(fd)
    , poll_interval_(poll_interval) {
}

bool LineReader::take_buffered_line(std::string& line) {
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos) {
        return false;
    }
    line.assign(buffer_, 0, pos);
    buffer_.erase(0, pos + 1);
    return true;
}

LineReader::Result LineReader::next(std::string& line, const std::atomic<bool>& stop) {
    char chunk[kReadChunk];

    while (true) {
        if (take_buffered_line(line)) {
            return Result::Line;
        }
        if (eof_) {
            if (buffer_.empty()) {
                return Result::Eof;
            }
            line.swap(buffer_);
            buffer_.clear();
            return Result::Line;
        }
        if (stop) {
            return Result::Stopped;
        }

        struct pollfd pfd {};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int ready = poll(&pfd, 1, static_cast<int>(poll_interval_.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "poll on input failed");
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            throw std::system_error(errno, std::generic_category(), "read on input failed");
        }
    }
}

}  // namespace relay::agent
