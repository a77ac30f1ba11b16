#pragma once
// LineReader: newline-framed input from a file descriptor
//
// Reads whatever bytes are available with ::read and keeps its own buffer,
// so several lines arriving in one write are all handed out at once and
// poll() on the descriptor stays truthful.

#include "log.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>
#include <unistd.h>

namespace spanda {

class LineReader {
public:
    enum class Status { Ok, Eof, Error };

    static constexpr size_t MAX_LINE_SIZE = 64 * 1024;

    explicit LineReader(int fd) : fd_(fd) {}

    // One read(); complete lines are appended to `lines`. At end of input a
    // trailing unterminated line is delivered too.
    Status read_available(std::vector<std::string>& lines) {
        char buf[4096];
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return Status::Ok;
            log::warn("input", "read failed: %s", std::strerror(errno));
            return Status::Error;
        }
        if (n == 0) {
            if (!buffer_.empty()) {
                lines.push_back(strip_cr(buffer_));
                buffer_.clear();
            }
            return Status::Eof;
        }

        buffer_.append(buf, static_cast<size_t>(n));
        size_t pos;
        while ((pos = buffer_.find('\n')) != std::string::npos) {
            lines.push_back(strip_cr(buffer_.substr(0, pos)));
            buffer_.erase(0, pos + 1);
        }

        if (buffer_.size() > MAX_LINE_SIZE) {
            log::warn("input", "Line too long (%zu bytes), dropped", buffer_.size());
            buffer_.clear();
        }
        return Status::Ok;
    }

    size_t pending() const { return buffer_.size(); }

private:
    static std::string strip_cr(std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return line;
    }

    int fd_;
    std::string buffer_;
};

} // namespace spanda
