#include "mcpgate/json_rpc.hpp"
#include "mcpgate/version.hpp"
#include <limits>
#include <stdexcept>

namespace mcpgate {

namespace {

nlohmann::json envelope() {
    return nlohmann::json{{"jsonrpc", std::string(JSONRPC_VERSION)}};
}

void put_params(nlohmann::json& j, const std::optional<nlohmann::json>& params) {
    if (params) j["params"] = *params;
}

std::optional<nlohmann::json> member(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    return *it;
}

} // anonymous namespace

// ---- RequestId ----

void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

void from_json(const nlohmann::json& j, RequestId& id) {
    switch (j.type()) {
        case nlohmann::json::value_t::number_integer:
            id = j.get<int64_t>();
            return;
        case nlohmann::json::value_t::number_unsigned: {
            // Only ids beyond int64 range lose their integral type
            auto u = j.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                id = static_cast<int64_t>(u);
            } else {
                id = static_cast<double>(u);
            }
            return;
        }
        case nlohmann::json::value_t::number_float:
            id = j.get<double>();
            return;
        case nlohmann::json::value_t::string:
            id = j.get<std::string>();
            return;
        default:
            throw std::invalid_argument(std::string("RequestId must be a number or a string, got ")
                                        + j.type_name());
    }
}

std::string correlation_key(const RequestId& id) {
    struct Render {
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const { return nlohmann::json(v).dump(); }
        std::string operator()(const std::string& v) const { return v; }
    };
    return std::visit(Render{}, id);
}

// ---- Error object ----

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    e.data = member(j, "data");
}

// ---- Envelopes ----

JsonRpcResponse JsonRpcResponse::success(RequestId id, nlohmann::json result) {
    return JsonRpcResponse{std::move(id), std::move(result), std::nullopt};
}

JsonRpcResponse JsonRpcResponse::failure(RequestId id, int code, std::string message) {
    return JsonRpcResponse{std::move(id), std::nullopt,
                           JsonRpcError{code, std::move(message), std::nullopt}};
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = envelope();
    to_json(j["id"], r.id);
    j["method"] = r.method;
    put_params(j, r.params);
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    r.method = j.at("method").get<std::string>();
    r.params = member(j, "params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = envelope();
    to_json(j["id"], r.id);
    if (r.error) {
        to_json(j["error"], *r.error);
    } else {
        j["result"] = r.result.value_or(nlohmann::json::object());
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    from_json(j.at("id"), r.id);
    r.result = member(j, "result");
    if (auto err = member(j, "error")) {
        JsonRpcError e;
        from_json(*err, e);
        r.error = std::move(e);
    } else {
        r.error.reset();
    }
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = envelope();
    j["method"] = n.method;
    put_params(j, n.params);
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    n.method = j.at("method").get<std::string>();
    n.params = member(j, "params");
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace mcpgate
