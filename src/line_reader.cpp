#include "line_reader.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>

namespace tether {

bool LineReader::next(std::string& line, const std::atomic<bool>& stop) {
    for (;;) {
        if (stop) return false;

        auto nl = pending_.find('\n');
        if (nl != std::string::npos) {
            line = pending_.substr(0, nl);
            pending_.erase(0, nl + 1);
            return true;
        }
        if (eof_) {
            if (pending_.empty()) return false;
            line = std::move(pending_);
            pending_.clear();
            return true;
        }

        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(poll_interval_.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (rc == 0) continue;

        char buf[4096];
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return false;
        }
        if (n == 0) {
            eof_ = true;
        } else {
            pending_.append(buf, static_cast<size_t>(n));
        }
    }
}

}
