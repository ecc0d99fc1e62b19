#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>

namespace mcpgate {

class Codec {
public:
    /// Parse one JSON-RPC record into a message.
    /// Throws McpParseError on invalid JSON or an invalid envelope; the error
    /// carries the request id when one could be recovered from the payload.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace mcpgate
