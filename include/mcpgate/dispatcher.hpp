#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "handlers.hpp"
#include "registry.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcpgate {

/// The fixed set of methods the session understands.
enum class MethodKind {
    Initialize,
    Initialized,
    ResourcesList,
    ResourcesRead,
    ToolsList,
    ToolsCall,
    PromptsList,
    PromptsGet
};

[[nodiscard]] std::optional<MethodKind> method_kind(std::string_view method);

/// The four capability registries a session owns.
struct Registries {
    ResourceRegistry resources;
    ResourceTemplateRegistry resource_templates;
    ToolRegistry tools;
    PromptRegistry prompts;
};

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;

/// Handshake state machine plus method routing. Thread-safe: dispatch() is
/// called concurrently from the worker pool.
class Dispatcher {
public:
    Dispatcher(ServerIdentity identity, CapabilitySet capabilities,
               std::optional<std::string> instructions, const Registries& registries);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Handle one inbound message and return the response to send, if any.
    /// Notifications and responses never produce one. Does not throw.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg,
                                                          const CancellationToken& cancellation = {});

    [[nodiscard]] bool initialized() const { return initialized_.load(std::memory_order_acquire); }

    /// Client identity from the first accepted initialize request.
    [[nodiscard]] std::optional<Implementation> client_info() const;

    [[nodiscard]] const ServerIdentity& identity() const { return identity_; }
    [[nodiscard]] const CapabilitySet& capabilities() const { return capabilities_; }

private:
    JsonRpcResponse handle_request(const JsonRpcRequest& req, const CancellationToken& cancellation);
    void handle_notification(const JsonRpcNotification& notif);

    HandlerResult initialize(const nlohmann::json& params);
    HandlerResult list_resources();
    HandlerResult read_resource(const RequestContext& ctx, const nlohmann::json& params);
    HandlerResult list_tools();
    HandlerResult call_tool(const RequestContext& ctx, const nlohmann::json& params);
    HandlerResult list_prompts();
    HandlerResult get_prompt(const RequestContext& ctx, const nlohmann::json& params);

    const ServerIdentity identity_;
    const CapabilitySet capabilities_;
    const std::optional<std::string> instructions_;
    const Registries& registries_;

    std::atomic<bool> initialized_{false};
    mutable std::mutex client_mutex_;
    std::optional<Implementation> client_info_;
};

} // namespace mcpgate
