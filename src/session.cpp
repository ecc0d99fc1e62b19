#include "mcpgate/session.hpp"
#include "mcpgate/error.hpp"
#include "mcpgate/executor.hpp"
#include "mcpgate/log.hpp"
#include "mcpgate/transport/stdio_transport.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <utility>

namespace mcpgate {

// ----------- Session::Impl -----------

struct Session::Impl {
    Options opts;
    Registries registries;
    Dispatcher dispatcher;
    TransportSlot transport;
    NotificationEmitter notifier;
    CancellationSource cancellation;

    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};

    explicit Impl(Options o)
        : opts(std::move(o)),
          dispatcher(opts.identity, opts.capabilities, opts.instructions, registries),
          notifier(transport) {
        if (opts.worker_threads == 0) {
            throw std::invalid_argument("Session requires at least one worker thread");
        }
    }

    template <typename Handler>
    static void require_handler(const std::shared_ptr<Handler>& handler, const std::string& key) {
        if (!handler) {
            throw std::invalid_argument("Null handler registered for '" + key + "'");
        }
    }

    void warn_replaced(bool replaced, const char* kind, const std::string& key) {
        if (replaced) {
            logger()->warn("Replacing previously registered {} '{}'", kind, key);
        }
    }

    // Registration never fails because of the peer; a dead transport shows up
    // in the receive loop instead.
    template <typename Notify>
    void list_changed(Notify notify) {
        if (!opts.auto_notify_list_changed || !running) return;
        try {
            notify();
        } catch (const McpTransportError& e) {
            logger()->warn("list_changed notification not delivered: {}", e.what());
        }
    }

    void handle(const JsonRpcMessage& msg) {
        auto response = dispatcher.dispatch(msg, cancellation.token());
        if (!response) return;
        try {
            transport.send(*response);
        } catch (const McpTransportError& e) {
            logger()->error("Failed to send response id={}: {}",
                            correlation_key(response->id), e.what());
            if (auto t = transport.get()) t->close();
        }
    }

    void answer_parse_error(const McpParseError& e) {
        if (!e.id) {
            logger()->warn("Dropping undecodable message: {}", e.what());
            return;
        }
        logger()->warn("Parse error in message id={}: {}", correlation_key(*e.id), e.what());
        auto resp = JsonRpcResponse::failure(*e.id, error::ParseError,
                                             std::string("Parse error: ") + e.what());
        transport.send(resp);
    }

    void receive_loop(ITransport& t, WorkerPool& pool) {
        while (true) {
            std::optional<JsonRpcMessage> msg;
            try {
                msg = t.receive();
            } catch (const McpParseError& e) {
                try {
                    answer_parse_error(e);
                } catch (const McpTransportError& te) {
                    logger()->error("Transport failure: {}", te.what());
                    return;
                }
                continue;
            } catch (const McpTransportError& e) {
                logger()->error("Transport failure: {}", e.what());
                return;
            }

            if (!msg) {
                logger()->info("Transport closed");
                return;
            }
            if (!pool.post([this, m = std::move(*msg)] { handle(m); })) {
                return;
            }
        }
    }
};

// ----------- Session -----------

Session::Session(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
}

Session::~Session() {
    if (impl_) shutdown();
}

void Session::add_resource(ResourceDefinition def, std::shared_ptr<ResourceHandler> handler) {
    Impl::require_handler(handler, def.uri);
    std::string key = def.uri;
    bool replaced = impl_->registries.resources.add(ResourceEntry{std::move(def), std::move(handler)});
    impl_->warn_replaced(replaced, "resource", key);
    impl_->list_changed([this] { impl_->notifier.resources_list_changed(); });
}

void Session::add_resource(ResourceDefinition def, ResourceReadFn handler) {
    add_resource(std::move(def), make_resource_handler(std::move(handler)));
}

void Session::add_resource_template(ResourceTemplate tmpl,
                                    std::shared_ptr<ResourceTemplateHandler> handler) {
    Impl::require_handler(handler, tmpl.uri_template);
    std::string key = tmpl.uri_template;
    UriTemplate matcher = UriTemplate::compile(tmpl.uri_template);
    bool replaced = impl_->registries.resource_templates.add(
        ResourceTemplateEntry{std::move(tmpl), std::move(matcher), std::move(handler)});
    impl_->warn_replaced(replaced, "resource template", key);
    impl_->list_changed([this] { impl_->notifier.resources_list_changed(); });
}

void Session::add_resource_template(ResourceTemplate tmpl, ResourceTemplateReadFn handler) {
    add_resource_template(std::move(tmpl), make_resource_template_handler(std::move(handler)));
}

bool Session::remove_resource(const std::string& uri) {
    bool removed = impl_->registries.resources.remove(uri);
    if (removed) impl_->list_changed([this] { impl_->notifier.resources_list_changed(); });
    return removed;
}

bool Session::remove_resource_template(const std::string& uri_template) {
    bool removed = impl_->registries.resource_templates.remove(uri_template);
    if (removed) impl_->list_changed([this] { impl_->notifier.resources_list_changed(); });
    return removed;
}

void Session::add_tool(ToolDefinition def, std::shared_ptr<ToolHandler> handler) {
    Impl::require_handler(handler, def.name);
    std::string key = def.name;
    bool replaced = impl_->registries.tools.add(ToolEntry{std::move(def), std::move(handler)});
    impl_->warn_replaced(replaced, "tool", key);
    impl_->list_changed([this] { impl_->notifier.tools_list_changed(); });
}

void Session::add_tool(ToolDefinition def, ToolFn handler) {
    add_tool(std::move(def), make_tool_handler(std::move(handler)));
}

bool Session::remove_tool(const std::string& name) {
    bool removed = impl_->registries.tools.remove(name);
    if (removed) impl_->list_changed([this] { impl_->notifier.tools_list_changed(); });
    return removed;
}

void Session::add_prompt(PromptDefinition def, std::shared_ptr<PromptHandler> handler) {
    Impl::require_handler(handler, def.name);
    std::string key = def.name;
    bool replaced = impl_->registries.prompts.add(PromptEntry{std::move(def), std::move(handler)});
    impl_->warn_replaced(replaced, "prompt", key);
    impl_->list_changed([this] { impl_->notifier.prompts_list_changed(); });
}

void Session::add_prompt(PromptDefinition def, PromptFn handler) {
    add_prompt(std::move(def), make_prompt_handler(std::move(handler)));
}

bool Session::remove_prompt(const std::string& name) {
    bool removed = impl_->registries.prompts.remove(name);
    if (removed) impl_->list_changed([this] { impl_->notifier.prompts_list_changed(); });
    return removed;
}

const Registries& Session::registries() const {
    return impl_->registries;
}

NotificationEmitter& Session::notifications() {
    return impl_->notifier;
}

bool Session::is_initialized() const {
    return impl_->dispatcher.initialized();
}

std::optional<Implementation> Session::client_info() const {
    return impl_->dispatcher.client_info();
}

const ServerIdentity& Session::identity() const {
    return impl_->dispatcher.identity();
}

void Session::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("Session::serve requires a transport");
    }
    if (impl_->running.exchange(true)) {
        throw McpError("Session is already serving a transport");
    }

    std::unique_ptr<WorkerPool> pool;
    try {
        pool = std::make_unique<WorkerPool>(impl_->opts.worker_threads);
    } catch (...) {
        impl_->running = false;
        throw;
    }

    std::shared_ptr<ITransport> t(std::move(transport));
    impl_->transport.attach(t);
    // shutdown() may have run before the transport was attached
    if (impl_->stop_requested) t->close();

    logger()->info("Serving {} {}", impl_->opts.identity.name, impl_->opts.identity.version);
    impl_->receive_loop(*t, *pool);
    // Let in-flight handlers finish and send their responses.
    pool->shutdown();
    pool.reset();

    impl_->transport.detach();
    t->close();
    impl_->running = false;
    logger()->info("Session stopped");
}

void Session::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void Session::shutdown() {
    impl_->stop_requested = true;
    impl_->cancellation.request_cancel();
    if (auto t = impl_->transport.get()) {
        t->close();
    }
}

bool Session::is_running() const {
    return impl_->running;
}

} // namespace mcpgate
