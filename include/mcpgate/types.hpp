#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpgate {

// ---------- Content blocks ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

struct ImageContent {
    std::string data;  // base64
    std::string mime_type;

    bool operator==(const ImageContent& o) const {
        return data == o.data && mime_type == o.mime_type;
    }
};

/// Resource body inlined into a tool result or prompt message.
struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64

    bool operator==(const EmbeddedResource& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text && blob == o.blob;
    }
};

/// Serialized with a "type" discriminator: "text", "image" or "resource".
using Content = std::variant<TextContent, ImageContent, EmbeddedResource>;

// ---------- Tools ----------

struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json{{"type", "object"}};
};

/// `is_error` marks a failure reported in-band; it is always serialized.
struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;
};

// ---------- Resources ----------

struct ResourceDefinition {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
};

/// One item of a resources/read result. Exactly one of text/blob is expected.
struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64
};

/// Descriptor for a "{placeholder}" URI pattern; see UriTemplate.
struct ResourceTemplate {
    std::string uri_template;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    bool operator==(const ResourceTemplate& o) const {
        return uri_template == o.uri_template && name == o.name
               && description == o.description && mime_type == o.mime_type;
    }
};

// ---------- Prompts ----------

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    bool operator==(const PromptArgument& o) const {
        return name == o.name && description == o.description && required == o.required;
    }
};

struct PromptDefinition {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    bool operator==(const PromptDefinition& o) const {
        return name == o.name && description == o.description && arguments == o.arguments;
    }
};

struct PromptMessage {
    std::string role;  // "user" or "assistant"
    Content content;

    bool operator==(const PromptMessage& o) const {
        return role == o.role && content == o.content;
    }
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;

    bool operator==(const GetPromptResult& o) const {
        return description == o.description && messages == o.messages;
    }
};

// ---------- Handshake ----------

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

/// Identity advertised in the initialize result. Fixed for the session lifetime.
using ServerIdentity = Implementation;

/// Feature name -> descriptor, advertised verbatim during the handshake.
using CapabilitySet = nlohmann::json;

/// {resources:{}, tools:{}, prompts:{}, logging:{}}
[[nodiscard]] CapabilitySet default_capabilities();

/// What the peer sent with initialize. Logged, never used for gating.
struct InitializeParams {
    std::string protocol_version;
    std::optional<Implementation> client_info;
    nlohmann::json capabilities = nlohmann::json::object();
};

struct InitializeResult {
    std::string protocol_version;
    CapabilitySet capabilities;
    ServerIdentity server_info;
    std::optional<std::string> instructions;
};

// ---------- Logging ----------

/// Syslog severities carried by notifications/message.
enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

std::string log_level_to_string(LogLevel level);
/// Throws std::invalid_argument on an unknown name.
LogLevel log_level_from_string(const std::string& s);

struct LogMessage {
    LogLevel level;
    std::optional<std::string> logger;
    nlohmann::json data;
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);
void to_json(nlohmann::json& j, const ImageContent& t);
void from_json(const nlohmann::json& j, ImageContent& t);
void to_json(nlohmann::json& j, const EmbeddedResource& t);
void from_json(const nlohmann::json& j, EmbeddedResource& t);

// Content is a std::variant, so call these directly rather than through json(...)
void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const ResourceDefinition& t);
void from_json(const nlohmann::json& j, ResourceDefinition& t);
void to_json(nlohmann::json& j, const ResourceContent& t);
void from_json(const nlohmann::json& j, ResourceContent& t);
void to_json(nlohmann::json& j, const ResourceTemplate& t);
void from_json(const nlohmann::json& j, ResourceTemplate& t);

void to_json(nlohmann::json& j, const PromptArgument& t);
void from_json(const nlohmann::json& j, PromptArgument& t);
void to_json(nlohmann::json& j, const PromptDefinition& t);
void from_json(const nlohmann::json& j, PromptDefinition& t);
void to_json(nlohmann::json& j, const PromptMessage& t);
void from_json(const nlohmann::json& j, PromptMessage& t);
void to_json(nlohmann::json& j, const GetPromptResult& t);
void from_json(const nlohmann::json& j, GetPromptResult& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);
void from_json(const nlohmann::json& j, InitializeParams& t);
void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

void to_json(nlohmann::json& j, LogLevel level);
void from_json(const nlohmann::json& j, LogLevel& level);
void to_json(nlohmann::json& j, const LogMessage& t);
void from_json(const nlohmann::json& j, LogMessage& t);

} // namespace mcpgate
