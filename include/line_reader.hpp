#pragma once

#include <atomic>
#include <chrono>
#include <string>

namespace tether {

// Newline-delimited reader over a file descriptor that never blocks longer
// than one poll interval, so a stop flag is noticed while input is idle.
class LineReader {
public:
    explicit LineReader(int fd, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200))
        : fd_(fd), poll_interval_(poll_interval) {}

    /**
     * Next line without its terminator. A trailing line without a newline is
     * returned at end of input.
     * @return false at end of input, on a read error, or once stop is set.
     */
    bool next(std::string& line, const std::atomic<bool>& stop);

private:
    int fd_;
    std::chrono::milliseconds poll_interval_;
    std::string pending_;
    bool eof_ = false;
};

}
