#pragma once
#include "mcpgate/session.hpp"
#include "mcpgate/transport/stdio_transport.hpp"
#include <nlohmann/json.hpp>
#include <poll.h>
#include <unistd.h>
#include <chrono>
#include <csignal>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace mcpgate::testing {

/// Remote end of a pair of pipes. The session side gets a StdioTransport that
/// owns its two descriptors; the peer writes raw lines and reads raw JSON so
/// tests can inspect the exact wire shape.
class PipePeer {
public:
    PipePeer() {
        std::signal(SIGPIPE, SIG_IGN);
        int c2s[2], s2c[2];
        if (pipe(c2s) != 0 || pipe(s2c) != 0) {
            throw std::runtime_error("pipe() failed");
        }
        server_read_ = c2s[0];
        write_fd_ = c2s[1];
        read_fd_ = s2c[0];
        server_write_ = s2c[1];
    }

    ~PipePeer() {
        close_write();
        if (read_fd_ >= 0) ::close(read_fd_);
        // Only reached if the transport was never handed out
        if (server_read_ >= 0) ::close(server_read_);
        if (server_write_ >= 0) ::close(server_write_);
    }

    PipePeer(const PipePeer&) = delete;
    PipePeer& operator=(const PipePeer&) = delete;

    std::unique_ptr<StdioTransport> take_transport(StdioTransport::Options opts = {}) {
        auto t = std::make_unique<StdioTransport>(server_read_, server_write_, opts);
        server_read_ = server_write_ = -1;
        return t;
    }

    void send_raw(const std::string& data) {
        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = ::write(write_fd_, data.data() + off, data.size() - off);
            if (n <= 0) throw std::runtime_error("peer write failed");
            off += static_cast<size_t>(n);
        }
    }

    void send_json(const nlohmann::json& j) { send_raw(j.dump() + "\n"); }

    void request(const nlohmann::json& id, const std::string& method,
                 nlohmann::json params = nlohmann::json::object()) {
        send_json({{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}});
    }

    void notify(const std::string& method) {
        send_json({{"jsonrpc", "2.0"}, {"method", method}});
    }

    /// Next line from the session, or nullopt on timeout/EOF.
    std::optional<nlohmann::json> read_json(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto nl = buffer_.find('\n');
            if (nl != std::string::npos) {
                std::string line = buffer_.substr(0, nl);
                buffer_.erase(0, nl + 1);
                return nlohmann::json::parse(line);
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return std::nullopt;

            pollfd pfd{read_fd_, POLLIN, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
            if (rc <= 0) return std::nullopt;
            char buf[4096];
            ssize_t n = ::read(read_fd_, buf, sizeof(buf));
            if (n <= 0) return std::nullopt;
            buffer_.append(buf, static_cast<size_t>(n));
        }
    }

    /// Read until the response carrying `id` arrives. Anything else read on
    /// the way is kept in `others`.
    std::optional<nlohmann::json> await_response(const nlohmann::json& id) {
        while (auto msg = read_json()) {
            if (msg->contains("id") && msg->at("id") == id && !msg->contains("method")) {
                return msg;
            }
            others.push_back(std::move(*msg));
        }
        return std::nullopt;
    }

    void close_write() {
        if (write_fd_ >= 0) {
            ::close(write_fd_);
            write_fd_ = -1;
        }
    }

    std::vector<nlohmann::json> others;

private:
    int server_read_{-1};
    int server_write_{-1};
    int write_fd_{-1};
    int read_fd_{-1};
    std::string buffer_;
};

/// Runs Session::serve on a background thread against a PipePeer.
class ServedSession {
public:
    explicit ServedSession(Session& session) : session_(session) {}

    ~ServedSession() { stop(); }

    void start() {
        thread_ = std::thread([this, t = peer.take_transport()]() mutable {
            session_.serve(std::move(t));
        });
    }

    /// initialize + initialized; returns the initialize result.
    nlohmann::json handshake(const nlohmann::json& id = 0) {
        peer.request(id, "initialize",
                     {{"protocolVersion", "2024-11-05"},
                      {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}},
                      {"capabilities", nlohmann::json::object()}});
        auto resp = peer.await_response(id);
        peer.notify("notifications/initialized");
        if (!resp || !resp->contains("result")) {
            throw std::runtime_error("handshake failed");
        }
        return resp->at("result");
    }

    nlohmann::json call(const nlohmann::json& id, const std::string& method,
                        nlohmann::json params = nlohmann::json::object()) {
        peer.request(id, method, std::move(params));
        auto resp = peer.await_response(id);
        if (!resp) throw std::runtime_error("no response to " + method);
        return *resp;
    }

    void stop() {
        if (!thread_.joinable()) return;
        peer.close_write();
        session_.shutdown();
        thread_.join();
    }

    PipePeer peer;

private:
    Session& session_;
    std::thread thread_;
};

} // namespace mcpgate::testing
