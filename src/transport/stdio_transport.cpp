#include "mcpgate/transport/stdio_transport.hpp"
#include "mcpgate/error.hpp"
#include "mcpgate/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace mcpgate {

namespace {

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO, false, Options{}) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, true, Options{}) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : StdioTransport(read_fd, write_fd, true, opts) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, bool owns_fds, Options opts)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(owns_fds), opts_(opts) {
    if (::pipe(wakeup_pipe_) < 0) {
        fail_construction("Failed to create wakeup pipe");
    }
    // Set non-blocking on write end of wakeup pipe
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    if (flags < 0 || ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK) < 0) {
        fail_construction("Failed to configure wakeup pipe");
    }
}

// The destructor does not run for a constructor that throws, so release
// every descriptor this object holds before reporting the failure.
void StdioTransport::fail_construction(const char* what) {
    const int err = errno;
    for (int& fd : wakeup_pipe_) {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
    if (owns_fds_) {
        if (read_fd_ >= 0) ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
        read_fd_ = write_fd_ = -1;
    }
    throw McpTransportError(std::string(what) + ": " + std::strerror(err));
}

StdioTransport::~StdioTransport() {
    close();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

bool StdioTransport::next_line(std::string& line) {
    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl == std::string::npos) {
            if (discarding_) buffer_.clear();
            return false;
        }
        if (discarding_) {
            buffer_.erase(0, nl + 1);
            discarding_ = false;
            continue;
        }

        line.assign(buffer_, 0, nl);
        buffer_.erase(0, nl + 1);

        // Remove trailing \r if present (CRLF)
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_blank(line)) continue;
        return true;
    }
}

bool StdioTransport::fill_buffer() {
    char chunk[4096];

    while (true) {
        // Use poll() so that close() can interrupt the blocking read
        // via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("poll failed: ") + std::strerror(errno));
        }

        // Wakeup pipe has data: close() was called
        if (fds[1].revents & POLLIN) return false;

        if (fds[0].revents & POLLNVAL) {
            throw McpTransportError("Read descriptor is not open");
        }
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw McpTransportError(std::string("Read error: ") + std::strerror(errno));
        }
        if (n == 0) {
            eof_ = true;
            return true;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
        return true;
    }
}

std::optional<JsonRpcMessage> StdioTransport::receive() {
    std::string line;
    while (!closed_) {
        if (next_line(line)) {
            if (line.size() > opts_.max_message_size) {
                throw McpParseError("Message exceeds maximum size of " +
                                    std::to_string(opts_.max_message_size) + " bytes");
            }
            return Codec::parse(line);
        }

        if (eof_) {
            if (discarding_ || is_blank(buffer_)) {
                buffer_.clear();
                discarding_ = false;
                return std::nullopt;
            }
            buffer_.clear();
            throw McpParseError("Unterminated message at end of stream");
        }

        if (buffer_.size() > opts_.max_message_size) {
            buffer_.clear();
            discarding_ = true;
            throw McpParseError("Message exceeds maximum size of " +
                                std::to_string(opts_.max_message_size) + " bytes");
        }

        if (!fill_buffer()) break;
    }
    return std::nullopt;
}

void StdioTransport::write_all(const std::string& data) {
    const char* p = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("Write error: ") + std::strerror(errno));
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    if (closed_) {
        throw McpTransportError("Transport closed");
    }
    std::string record = Codec::serialize(msg);
    record += '\n';

    // One locked write per record so concurrent senders never interleave.
    std::lock_guard<std::mutex> lock(write_mutex_);
    write_all(record);
}

void StdioTransport::close() {
    if (closed_.exchange(true)) return;
    // Write to wakeup pipe to interrupt poll() in receive().
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            logger()->warn("StdioTransport: failed to signal reader: {}", std::strerror(errno));
        }
    }
}

bool StdioTransport::is_connected() const {
    return !closed_ && !eof_;
}

} // namespace mcpgate
