#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace mcpgate {

/// The transport a session is currently attached to. Responses and
/// notifications share it; the transport itself serializes the writes.
class TransportSlot {
public:
    void attach(std::shared_ptr<ITransport> transport);
    std::shared_ptr<ITransport> detach();
    [[nodiscard]] std::shared_ptr<ITransport> get() const;

    /// Returns false if nothing is attached. Throws McpTransportError if the
    /// write fails.
    bool send(const JsonRpcMessage& msg) const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<ITransport> transport_;
};

/// Builds and sends server-initiated notifications. Independent of the
/// handshake state. Every method returns false when no transport is attached.
class NotificationEmitter {
public:
    explicit NotificationEmitter(const TransportSlot& slot) : slot_(slot) {}

    bool resources_list_changed();
    bool tools_list_changed();
    bool prompts_list_changed();
    bool resource_updated(const std::string& uri);
    bool log_message(LogLevel level, const nlohmann::json& data,
                     std::optional<std::string> logger = std::nullopt);

    bool notify(std::string method, std::optional<nlohmann::json> params = std::nullopt);

private:
    const TransportSlot& slot_;
};

} // namespace mcpgate
