#pragma once
#include <string_view>

namespace mcpgate::methods {

// Requests
constexpr std::string_view Initialize       = "initialize";
constexpr std::string_view ResourcesList    = "resources/list";
constexpr std::string_view ResourcesRead    = "resources/read";
constexpr std::string_view ToolsList        = "tools/list";
constexpr std::string_view ToolsCall        = "tools/call";
constexpr std::string_view PromptsList      = "prompts/list";
constexpr std::string_view PromptsGet       = "prompts/get";

// Client notifications
constexpr std::string_view Initialized      = "initialized";
constexpr std::string_view InitializedAlias = "notifications/initialized";

// Server notifications
constexpr std::string_view ResourcesListChanged = "notifications/resources/list_changed";
constexpr std::string_view ResourceUpdated      = "notifications/resources/updated";
constexpr std::string_view ToolsListChanged     = "notifications/tools/list_changed";
constexpr std::string_view PromptsListChanged   = "notifications/prompts/list_changed";
constexpr std::string_view LogMessage           = "notifications/message";

} // namespace mcpgate::methods
