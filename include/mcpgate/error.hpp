#pragma once
#include "json_rpc.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace mcpgate {

/// JSON-RPC error codes placed on the wire.
namespace error {
    constexpr int ParseError     = -32700;  // undecodable envelope
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;  // also unknown resource/tool/prompt
    constexpr int InternalError  = -32603;
    constexpr int NotInitialized = -32002;  // request before initialize
} // namespace error

/// Base of everything the library throws.
class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed envelope. `id` is set when the payload was readable enough to
/// recover the sender's correlation id, so a parse-error response can be sent.
class McpParseError : public McpError {
public:
    explicit McpParseError(const std::string& msg,
                           std::optional<RequestId> salvaged_id = std::nullopt)
        : McpError(msg), id(std::move(salvaged_id)) {}

    std::optional<RequestId> id;
};

/// Thrown inside request handling to answer with a specific error code.
class McpProtocolError : public McpError {
public:
    McpProtocolError(int error_code, const std::string& msg)
        : McpError(msg), code(error_code) {}

    int code;
};

/// The byte stream failed: write error, broken pipe, closed transport.
class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

} // namespace mcpgate
