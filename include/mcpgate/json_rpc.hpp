#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcpgate {

/// Correlation id. The alternative held is the JSON type the peer sent, so an
/// integer id is echoed as an integer, a fractional one as a double and a
/// string as a string.
///
/// RequestId is a std::variant: use the to_json/from_json overloads below
/// directly, never `nlohmann::json(id)` or `j.get<RequestId>()`.
using RequestId = std::variant<int64_t, double, std::string>;

void to_json(nlohmann::json& j, const RequestId& id);
/// Throws std::invalid_argument unless `j` is a number or a string.
void from_json(const nlohmann::json& j, RequestId& id);

/// Normalized text form of an id, for log lines only.
[[nodiscard]] std::string correlation_key(const RequestId& id);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;
};

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;
};

/// Exactly one of result/error is set on a well-formed response; if both are,
/// only the error is written.
struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    static JsonRpcResponse success(RequestId id, nlohmann::json result);
    static JsonRpcResponse failure(RequestId id, int code, std::string message);
};

/// Fire-and-forget envelope; never carries an id and is never answered.
struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);
void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);
void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void from_json(const nlohmann::json& j, JsonRpcNotification& n);
void to_json(nlohmann::json& j, const JsonRpcMessage& m);

} // namespace mcpgate
