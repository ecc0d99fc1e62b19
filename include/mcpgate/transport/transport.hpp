#pragma once
#include "../json_rpc.hpp"
#include <optional>

namespace mcpgate {

/// Abstract duplex message channel.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Send one message. Safe to call from several threads; records are never
    /// interleaved. Throws McpTransportError on I/O failure or after close().
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Block until the next message arrives. Returns nullopt once the channel
    /// is closed. Throws McpParseError for an undecodable record (the
    /// transport stays usable) and McpTransportError for stream failures.
    /// Single reader only.
    [[nodiscard]] virtual std::optional<JsonRpcMessage> receive() = 0;

    /// Idempotent. Wakes a blocked receive(), which then returns nullopt.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcpgate
