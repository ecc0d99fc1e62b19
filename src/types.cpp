#include "mcpgate/types.hpp"
#include <stdexcept>

namespace mcpgate {

using nlohmann::json;

namespace {

template <typename T>
void put_if(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

template <typename T>
void read_if(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) out = it->template get<T>();
}

std::string required_string(const json& j, const char* key) {
    return j.at(key).get<std::string>();
}

// Resource bodies share one shape whether embedded in a prompt or returned by a read.
template <typename Body>
json resource_body(const Body& b) {
    json j{{"uri", b.uri}};
    put_if(j, "mimeType", b.mime_type);
    put_if(j, "text", b.text);
    put_if(j, "blob", b.blob);
    return j;
}

template <typename Body>
void read_resource_body(const json& j, Body& b) {
    b.uri = required_string(j, "uri");
    read_if(j, "mimeType", b.mime_type);
    read_if(j, "text", b.text);
    read_if(j, "blob", b.blob);
}

} // anonymous namespace

// ---- Content blocks ----

void to_json(json& j, const TextContent& t) {
    j = json{{"type", "text"}, {"text", t.text}};
}

void from_json(const json& j, TextContent& t) {
    t.text = required_string(j, "text");
}

void to_json(json& j, const ImageContent& t) {
    j = json{{"type", "image"}, {"data", t.data}, {"mimeType", t.mime_type}};
}

void from_json(const json& j, ImageContent& t) {
    t.data = required_string(j, "data");
    t.mime_type = required_string(j, "mimeType");
}

void to_json(json& j, const EmbeddedResource& t) {
    j = json{{"type", "resource"}, {"resource", resource_body(t)}};
}

void from_json(const json& j, EmbeddedResource& t) {
    read_resource_body(j.at("resource"), t);
}

void to_json(json& j, const Content& c) {
    std::visit([&j](const auto& block) { to_json(j, block); }, c);
}

void from_json(const json& j, Content& c) {
    const std::string kind = required_string(j, "type");
    if (kind == "text") {
        TextContent t;
        from_json(j, t);
        c = std::move(t);
    } else if (kind == "image") {
        ImageContent i;
        from_json(j, i);
        c = std::move(i);
    } else if (kind == "resource") {
        EmbeddedResource r;
        from_json(j, r);
        c = std::move(r);
    } else {
        throw std::invalid_argument("Unknown content type: " + kind);
    }
}

namespace {

json content_array(const std::vector<Content>& blocks) {
    json arr = json::array();
    for (const auto& block : blocks) {
        json item;
        to_json(item, block);
        arr.push_back(std::move(item));
    }
    return arr;
}

} // anonymous namespace

// ---- Tools ----

void to_json(json& j, const ToolDefinition& t) {
    j = json{{"name", t.name}, {"inputSchema", t.input_schema}};
    put_if(j, "description", t.description);
}

void from_json(const json& j, ToolDefinition& t) {
    t.name = required_string(j, "name");
    read_if(j, "description", t.description);
    t.input_schema = j.value("inputSchema", json{{"type", "object"}});
}

void to_json(json& j, const CallToolResult& t) {
    j = json{{"content", content_array(t.content)}, {"isError", t.is_error}};
}

void from_json(const json& j, CallToolResult& t) {
    t.content.clear();
    for (const auto& item : j.value("content", json::array())) {
        Content c;
        from_json(item, c);
        t.content.push_back(std::move(c));
    }
    t.is_error = j.value("isError", false);
}

// ---- Resources ----

void to_json(json& j, const ResourceDefinition& t) {
    j = json{{"uri", t.uri}, {"name", t.name}};
    put_if(j, "description", t.description);
    put_if(j, "mimeType", t.mime_type);
}

void from_json(const json& j, ResourceDefinition& t) {
    t.uri = required_string(j, "uri");
    t.name = required_string(j, "name");
    read_if(j, "description", t.description);
    read_if(j, "mimeType", t.mime_type);
}

void to_json(json& j, const ResourceContent& t) {
    j = resource_body(t);
}

void from_json(const json& j, ResourceContent& t) {
    read_resource_body(j, t);
}

// Listed next to static resources, so the pattern is published under "uri".
void to_json(json& j, const ResourceTemplate& t) {
    j = json{{"uri", t.uri_template}, {"name", t.name}};
    put_if(j, "description", t.description);
    put_if(j, "mimeType", t.mime_type);
}

void from_json(const json& j, ResourceTemplate& t) {
    t.uri_template = required_string(j, "uri");
    t.name = required_string(j, "name");
    read_if(j, "description", t.description);
    read_if(j, "mimeType", t.mime_type);
}

// ---- Prompts ----

void to_json(json& j, const PromptArgument& t) {
    j = json{{"name", t.name}, {"required", t.required}};
    put_if(j, "description", t.description);
}

void from_json(const json& j, PromptArgument& t) {
    t.name = required_string(j, "name");
    read_if(j, "description", t.description);
    t.required = j.value("required", false);
}

void to_json(json& j, const PromptDefinition& t) {
    json args = json::array();
    for (const auto& a : t.arguments) args.push_back(a);
    j = json{{"name", t.name}, {"arguments", std::move(args)}};
    put_if(j, "description", t.description);
}

void from_json(const json& j, PromptDefinition& t) {
    t.name = required_string(j, "name");
    read_if(j, "description", t.description);
    t.arguments.clear();
    for (const auto& a : j.value("arguments", json::array())) {
        t.arguments.push_back(a.get<PromptArgument>());
    }
}

void to_json(json& j, const PromptMessage& t) {
    json content;
    to_json(content, t.content);
    j = json{{"role", t.role}, {"content", std::move(content)}};
}

void from_json(const json& j, PromptMessage& t) {
    t.role = required_string(j, "role");
    from_json(j.at("content"), t.content);
}

void to_json(json& j, const GetPromptResult& t) {
    json messages = json::array();
    for (const auto& m : t.messages) {
        json item;
        to_json(item, m);
        messages.push_back(std::move(item));
    }
    j = json{{"messages", std::move(messages)}};
    put_if(j, "description", t.description);
}

void from_json(const json& j, GetPromptResult& t) {
    read_if(j, "description", t.description);
    t.messages.clear();
    for (const auto& item : j.at("messages")) {
        PromptMessage m;
        from_json(item, m);
        t.messages.push_back(std::move(m));
    }
}

// ---- Handshake ----

CapabilitySet default_capabilities() {
    CapabilitySet caps = json::object();
    for (const char* feature : {"resources", "tools", "prompts", "logging"}) {
        caps[feature] = json::object();
    }
    return caps;
}

void to_json(json& j, const Implementation& t) {
    j = json{{"name", t.name}, {"version", t.version}};
}

void from_json(const json& j, Implementation& t) {
    t.name = required_string(j, "name");
    t.version = required_string(j, "version");
}

// Every field is advisory; only their types are checked.
void from_json(const json& j, InitializeParams& t) {
    t.protocol_version = j.value("protocolVersion", std::string());
    read_if(j, "clientInfo", t.client_info);
    t.capabilities = j.value("capabilities", json::object());
}

void to_json(json& j, const InitializeResult& t) {
    json server;
    to_json(server, t.server_info);
    j = json{{"protocolVersion", t.protocol_version},
             {"capabilities", t.capabilities},
             {"serverInfo", std::move(server)}};
    put_if(j, "instructions", t.instructions);
}

void from_json(const json& j, InitializeResult& t) {
    t.protocol_version = required_string(j, "protocolVersion");
    t.capabilities = j.at("capabilities");
    from_json(j.at("serverInfo"), t.server_info);
    read_if(j, "instructions", t.instructions);
}

// ---- Logging ----

namespace {

constexpr std::pair<LogLevel, const char*> kLogLevelNames[] = {
    {LogLevel::Debug, "debug"},       {LogLevel::Info, "info"},
    {LogLevel::Notice, "notice"},     {LogLevel::Warning, "warning"},
    {LogLevel::Error, "error"},       {LogLevel::Critical, "critical"},
    {LogLevel::Alert, "alert"},       {LogLevel::Emergency, "emergency"},
};

} // anonymous namespace

std::string log_level_to_string(LogLevel level) {
    for (const auto& [value, name] : kLogLevelNames) {
        if (value == level) return name;
    }
    return "info";
}

LogLevel log_level_from_string(const std::string& s) {
    for (const auto& [value, name] : kLogLevelNames) {
        if (s == name) return value;
    }
    throw std::invalid_argument("Unknown log level: " + s);
}

void to_json(json& j, LogLevel level) {
    j = log_level_to_string(level);
}

void from_json(const json& j, LogLevel& level) {
    level = log_level_from_string(j.get<std::string>());
}

void to_json(json& j, const LogMessage& t) {
    j = json{{"level", log_level_to_string(t.level)}, {"data", t.data}};
    put_if(j, "logger", t.logger);
}

void from_json(const json& j, LogMessage& t) {
    from_json(j.at("level"), t.level);
    t.data = j.at("data");
    read_if(j, "logger", t.logger);
}

} // namespace mcpgate
