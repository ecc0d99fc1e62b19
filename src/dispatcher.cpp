#include "mcpgate/dispatcher.hpp"
#include "mcpgate/error.hpp"
#include "mcpgate/log.hpp"
#include "mcpgate/methods.hpp"
#include "mcpgate/version.hpp"
#include <array>
#include <utility>

namespace mcpgate {

namespace {

constexpr std::array<std::pair<std::string_view, MethodKind>, 9> kMethodTable{{
    {methods::Initialize,       MethodKind::Initialize},
    {methods::Initialized,      MethodKind::Initialized},
    {methods::InitializedAlias, MethodKind::Initialized},
    {methods::ResourcesList,    MethodKind::ResourcesList},
    {methods::ResourcesRead,    MethodKind::ResourcesRead},
    {methods::ToolsList,        MethodKind::ToolsList},
    {methods::ToolsCall,        MethodKind::ToolsCall},
    {methods::PromptsList,      MethodKind::PromptsList},
    {methods::PromptsGet,       MethodKind::PromptsGet},
}};

JsonRpcError make_error(int code, std::string message) {
    return JsonRpcError{code, std::move(message), std::nullopt};
}

// Absent params are treated as an empty object.
nlohmann::json params_object(const std::optional<nlohmann::json>& params) {
    if (!params || params->is_null()) return nlohmann::json::object();
    if (!params->is_object()) {
        throw McpProtocolError(error::InvalidParams, "params must be an object");
    }
    return *params;
}

std::string require_string(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        throw McpProtocolError(error::InvalidParams,
                               std::string("Missing or invalid '") + key + "' parameter");
    }
    return it->get<std::string>();
}

nlohmann::json arguments_of(const nlohmann::json& params) {
    auto it = params.find("arguments");
    if (it == params.end() || it->is_null()) return nlohmann::json::object();
    if (!it->is_object()) {
        throw McpProtocolError(error::InvalidParams, "'arguments' must be an object");
    }
    return *it;
}

CallToolResult tool_failure(const std::string& what) {
    CallToolResult result;
    result.is_error = true;
    result.content.push_back(TextContent{"Error: " + what});
    return result;
}

} // anonymous namespace

std::optional<MethodKind> method_kind(std::string_view method) {
    for (const auto& [name, kind] : kMethodTable) {
        if (name == method) return kind;
    }
    return std::nullopt;
}

Dispatcher::Dispatcher(ServerIdentity identity, CapabilitySet capabilities,
                       std::optional<std::string> instructions, const Registries& registries)
    : identity_(std::move(identity)),
      capabilities_(std::move(capabilities)),
      instructions_(std::move(instructions)),
      registries_(registries) {
}

std::optional<Implementation> Dispatcher::client_info() const {
    std::lock_guard<std::mutex> lock(client_mutex_);
    return client_info_;
}

std::optional<JsonRpcResponse> Dispatcher::dispatch(const JsonRpcMessage& msg,
                                                    const CancellationToken& cancellation) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        return handle_request(*req, cancellation);
    }
    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        handle_notification(*notif);
        return std::nullopt;
    }
    // This session issues no requests of its own, so there is nothing to correlate.
    const auto& resp = std::get<JsonRpcResponse>(msg);
    logger()->warn("Ignoring unsolicited response id={}", correlation_key(resp.id));
    return std::nullopt;
}

void Dispatcher::handle_notification(const JsonRpcNotification& notif) {
    auto kind = method_kind(notif.method);
    if (kind == MethodKind::Initialized) {
        logger()->debug("Client confirmed initialization");
        return;
    }
    logger()->debug("Ignoring notification {}", notif.method);
}

JsonRpcResponse Dispatcher::handle_request(const JsonRpcRequest& req,
                                           const CancellationToken& cancellation) {
    logger()->debug("Request {} id={}", req.method, correlation_key(req.id));

    auto kind = method_kind(req.method);
    if (!initialized() && kind != MethodKind::Initialize) {
        return JsonRpcResponse::failure(req.id, error::NotInitialized, "Server not initialized");
    }
    if (!kind) {
        return JsonRpcResponse::failure(req.id, error::MethodNotFound,
                                        "Method not found: " + req.method);
    }

    RequestContext ctx{req.id, req.method, cancellation};
    HandlerResult result;
    try {
        nlohmann::json params = params_object(req.params);
        switch (*kind) {
            case MethodKind::Initialize:    result = initialize(params); break;
            case MethodKind::Initialized:   result = nlohmann::json::object(); break;
            case MethodKind::ResourcesList: result = list_resources(); break;
            case MethodKind::ResourcesRead: result = read_resource(ctx, params); break;
            case MethodKind::ToolsList:     result = list_tools(); break;
            case MethodKind::ToolsCall:     result = call_tool(ctx, params); break;
            case MethodKind::PromptsList:   result = list_prompts(); break;
            case MethodKind::PromptsGet:    result = get_prompt(ctx, params); break;
        }
    } catch (const McpProtocolError& e) {
        result = make_error(e.code, e.what());
    } catch (const std::exception& e) {
        logger()->error("{} failed: {}", req.method, e.what());
        result = make_error(error::InternalError, e.what());
    } catch (...) {
        logger()->error("{} failed with a non-standard exception", req.method);
        result = make_error(error::InternalError, "Internal error");
    }

    if (auto* err = std::get_if<JsonRpcError>(&result)) {
        JsonRpcResponse resp;
        resp.id = req.id;
        resp.error = std::move(*err);
        return resp;
    }
    return JsonRpcResponse::success(req.id, std::move(std::get<nlohmann::json>(result)));
}

HandlerResult Dispatcher::initialize(const nlohmann::json& params) {
    InitializeParams init;
    try {
        from_json(params, init);
    } catch (const nlohmann::json::exception& e) {
        return make_error(error::InvalidParams, std::string("Invalid initialize params: ") + e.what());
    }

    bool expected = false;
    if (initialized_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        {
            std::lock_guard<std::mutex> lock(client_mutex_);
            client_info_ = init.client_info;
        }
        logger()->info("Session initialized by {} {} (requested protocol {})",
                       init.client_info ? init.client_info->name : "<unknown>",
                       init.client_info ? init.client_info->version : "",
                       init.protocol_version.empty() ? "<none>" : init.protocol_version);
    } else {
        logger()->debug("Repeated initialize request");
    }

    InitializeResult result;
    result.protocol_version = std::string(PROTOCOL_VERSION);
    result.capabilities = capabilities_;
    result.server_info = identity_;
    result.instructions = instructions_;

    nlohmann::json j;
    to_json(j, result);
    return j;
}

HandlerResult Dispatcher::list_resources() {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& def : registries_.resources.definitions()) {
        list.push_back(nlohmann::json(def));
    }
    for (const auto& def : registries_.resource_templates.definitions()) {
        list.push_back(nlohmann::json(def));
    }
    return nlohmann::json{{"resources", std::move(list)}};
}

HandlerResult Dispatcher::read_resource(const RequestContext& ctx, const nlohmann::json& params) {
    std::string uri = require_string(params, "uri");

    std::vector<ResourceContent> contents;
    try {
        if (auto entry = registries_.resources.find(uri)) {
            contents = entry->handler->read(ctx, uri);
        } else if (auto match = registries_.resource_templates.match(uri)) {
            contents = match->entry.handler->read(ctx, uri, match->params);
        } else {
            return make_error(error::InvalidParams, "Resource not found: " + uri);
        }
    } catch (const McpProtocolError&) {
        throw;
    } catch (const std::exception& e) {
        logger()->error("Resource handler for {} failed: {}", uri, e.what());
        return make_error(error::InternalError, std::string("Error reading resource: ") + e.what());
    } catch (...) {
        logger()->error("Resource handler for {} failed with a non-standard exception", uri);
        return make_error(error::InternalError, "Error reading resource: unknown error");
    }
    return nlohmann::json{{"contents", contents}};
}

HandlerResult Dispatcher::list_tools() {
    return nlohmann::json{{"tools", registries_.tools.definitions()}};
}

HandlerResult Dispatcher::call_tool(const RequestContext& ctx, const nlohmann::json& params) {
    std::string name = require_string(params, "name");
    nlohmann::json arguments = arguments_of(params);

    auto entry = registries_.tools.find(name);
    if (!entry) {
        return make_error(error::InvalidParams, "Tool not found: " + name);
    }

    // A tool that fails still produces a result; only the isError flag differs.
    CallToolResult tool_result;
    try {
        tool_result = entry->handler->call(ctx, arguments);
    } catch (const std::exception& e) {
        logger()->warn("Tool {} failed: {}", name, e.what());
        tool_result = tool_failure(e.what());
    } catch (...) {
        logger()->warn("Tool {} failed with a non-standard exception", name);
        tool_result = tool_failure("unknown error");
    }

    nlohmann::json j;
    to_json(j, tool_result);
    return j;
}

HandlerResult Dispatcher::list_prompts() {
    return nlohmann::json{{"prompts", registries_.prompts.definitions()}};
}

HandlerResult Dispatcher::get_prompt(const RequestContext& ctx, const nlohmann::json& params) {
    std::string name = require_string(params, "name");
    nlohmann::json arguments = arguments_of(params);

    auto entry = registries_.prompts.find(name);
    if (!entry) {
        return make_error(error::InvalidParams, "Prompt not found: " + name);
    }

    GetPromptResult prompt;
    try {
        prompt = entry->handler->get(ctx, arguments);
    } catch (const McpProtocolError&) {
        throw;
    } catch (const std::exception& e) {
        logger()->error("Prompt {} failed: {}", name, e.what());
        return make_error(error::InternalError, e.what());
    } catch (...) {
        logger()->error("Prompt {} failed with a non-standard exception", name);
        return make_error(error::InternalError, "Prompt handler failed");
    }

    nlohmann::json j;
    to_json(j, prompt);
    return j;
}

} // namespace mcpgate
