#pragma once
#include "types.hpp"
#include "handlers.hpp"
#include "registry.hpp"
#include "dispatcher.hpp"
#include "notifier.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <optional>
#include <string>

namespace mcpgate {

/// One protocol session: identity, capability registries, handshake state and
/// the transport it is served over.
///
/// Register capabilities at any time, then call serve() (or serve_stdio()),
/// which runs the receive loop on the calling thread until the peer closes
/// the stream or shutdown() is called. Each inbound message is handled on a
/// worker thread, so a slow tool does not hold up the messages behind it.
class Session {
public:
    struct Options {
        ServerIdentity identity;
        CapabilitySet capabilities = default_capabilities();
        std::optional<std::string> instructions;
        /// Must be at least 1; the constructor throws std::invalid_argument otherwise.
        size_t worker_threads = 4;
        /// Emit list_changed notifications when registrations change while a
        /// transport is attached.
        bool auto_notify_list_changed = false;
    };

    explicit Session(Options opts);
    ~Session();

    // Non-copyable, non-movable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // ---- Resource registration ----
    // Re-registering an existing key replaces the previous entry.
    void add_resource(ResourceDefinition def, std::shared_ptr<ResourceHandler> handler);
    void add_resource(ResourceDefinition def, ResourceReadFn handler);
    /// Throws McpError if the template pattern does not compile.
    void add_resource_template(ResourceTemplate tmpl, std::shared_ptr<ResourceTemplateHandler> handler);
    void add_resource_template(ResourceTemplate tmpl, ResourceTemplateReadFn handler);
    bool remove_resource(const std::string& uri);
    bool remove_resource_template(const std::string& uri_template);

    // ---- Tool registration ----
    void add_tool(ToolDefinition def, std::shared_ptr<ToolHandler> handler);
    void add_tool(ToolDefinition def, ToolFn handler);
    bool remove_tool(const std::string& name);

    // ---- Prompt registration ----
    void add_prompt(PromptDefinition def, std::shared_ptr<PromptHandler> handler);
    void add_prompt(PromptDefinition def, PromptFn handler);
    bool remove_prompt(const std::string& name);

    [[nodiscard]] const Registries& registries() const;

    // ---- Notifications ----
    NotificationEmitter& notifications();

    // ---- State ----
    [[nodiscard]] bool is_initialized() const;
    [[nodiscard]] std::optional<Implementation> client_info() const;
    [[nodiscard]] const ServerIdentity& identity() const;

    // ---- Transport ----
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    /// Cancel in-flight handlers' tokens and close the transport. Final.
    void shutdown();

    [[nodiscard]] bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpgate
