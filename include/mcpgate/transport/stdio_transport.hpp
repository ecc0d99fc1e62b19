#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <mutex>
#include <string>

namespace mcpgate {

/// StdioTransport reads newline-delimited JSON from one descriptor and writes
/// it to another (stdin/stdout by default).
class StdioTransport : public ITransport {
public:
    struct Options {
        size_t max_message_size = 4 * 1024 * 1024;
    };

    /// Create transport using system stdin/stdout. The descriptors are not closed.
    StdioTransport();

    /// Create transport using specified file descriptors, which it takes
    /// ownership of (for pipes and testing).
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, Options opts);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void send(const JsonRpcMessage& msg) override;
    std::optional<JsonRpcMessage> receive() override;
    void close() override;
    bool is_connected() const override;

private:
    StdioTransport(int read_fd, int write_fd, bool owns_fds, Options opts);
    [[noreturn]] void fail_construction(const char* what);

    /// Pop the next complete line from buffer_ into `line`.
    bool next_line(std::string& line);
    /// Append more input to buffer_. Returns false if close() interrupted the wait.
    bool fill_buffer();
    void write_all(const std::string& data);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    Options opts_;

    std::string buffer_;
    bool discarding_{false};   // skipping the rest of an over-long line
    std::atomic<bool> eof_{false};
    std::atomic<bool> closed_{false};

    std::mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // pipe for interrupting poll() in receive()
};

} // namespace mcpgate
