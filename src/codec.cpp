#include "mcpgate/codec.hpp"
#include "mcpgate/error.hpp"
#include "mcpgate/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>
#include <utility>

namespace mcpgate {

namespace {

namespace od = simdjson::ondemand;

[[noreturn]] void fail(simdjson::error_code err) {
    throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
}

template <typename T, typename Result>
T take(Result&& result) {
    T value;
    if (auto err = std::forward<Result>(result).get(value)) fail(err);
    return value;
}

nlohmann::json to_dom(od::value val);

// Keep integers integral so correlation ids are echoed unchanged
nlohmann::json number_to_dom(od::value& val) {
    switch (take<od::number_type>(val.get_number_type())) {
        case od::number_type::signed_integer:
            return take<int64_t>(val.get_int64());
        case od::number_type::unsigned_integer:
            return take<uint64_t>(val.get_uint64());
        default:
            return take<double>(val.get_double());
    }
}

nlohmann::json object_to_dom(od::object obj) {
    nlohmann::json out = nlohmann::json::object();
    for (auto field_result : obj) {
        auto field = take<od::field>(std::move(field_result));
        auto key = take<std::string_view>(field.unescaped_key());
        out[std::string(key)] = to_dom(field.value());
    }
    return out;
}

// simdjson parses lazily, so every syntax error surfaces here as an error code.
nlohmann::json to_dom(od::value val) {
    switch (take<od::json_type>(val.type())) {
        case od::json_type::object:
            return object_to_dom(take<od::object>(val.get_object()));
        case od::json_type::array: {
            nlohmann::json out = nlohmann::json::array();
            for (auto elem : take<od::array>(val.get_array())) {
                out.push_back(to_dom(take<od::value>(std::move(elem))));
            }
            return out;
        }
        case od::json_type::string:
            return std::string(take<std::string_view>(val.get_string()));
        case od::json_type::number:
            return number_to_dom(val);
        case od::json_type::boolean:
            return take<bool>(val.get_bool());
        case od::json_type::null:
            return nullptr;
    }
    fail(simdjson::INCORRECT_TYPE);
}

nlohmann::json decode_object(std::string_view raw) {
    // The parser needs SIMDJSON_PADDING readable bytes past the input
    simdjson::padded_string padded(raw.data(), raw.size());
    od::parser parser;
    od::document doc;
    if (auto err = parser.iterate(padded).get(doc)) fail(err);

    switch (take<od::json_type>(doc.type())) {
        case od::json_type::object:
            break;
        case od::json_type::array:
            throw McpParseError("Batch messages are not supported");
        default:
            throw McpParseError("Message must be a JSON object");
    }

    nlohmann::json j = object_to_dom(take<od::object>(doc.get_object()));
    if (!doc.at_end()) {
        throw McpParseError("Trailing content after JSON document");
    }
    return j;
}

bool is_valid_id(const nlohmann::json& id) {
    return id.is_number() || id.is_string();
}

// Best effort: lets a -32700 answer reach the sender of a bad envelope.
std::optional<RequestId> salvage_id(const nlohmann::json& j) {
    auto it = j.find("id");
    if (it == j.end() || !is_valid_id(*it)) return std::nullopt;
    RequestId id;
    from_json(*it, id);
    return id;
}

} // anonymous namespace

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty message");
    }
    return parse_object(decode_object(raw));
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    const auto salvaged = salvage_id(j);

    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw McpParseError("Missing 'jsonrpc' member", salvaged);
    }
    if (!version->is_string() || version->get_ref<const std::string&>() != JSONRPC_VERSION) {
        throw McpParseError("Unsupported jsonrpc version, expected \"2.0\"", salvaged);
    }

    auto id = j.find("id");
    auto method = j.find("method");
    const bool has_id = id != j.end();
    const bool has_method = method != j.end();

    if (has_method && !method->is_string()) {
        throw McpParseError("'method' must be a string", salvaged);
    }
    if (has_id && !is_valid_id(*id)) {
        throw McpParseError(id->is_null() ? "'id' must not be null"
                                          : "'id' must be a string or a number");
    }

    if (has_method) {
        if (has_id) {
            JsonRpcRequest req;
            from_json(j, req);
            return req;
        }
        JsonRpcNotification notif;
        from_json(j, notif);
        return notif;
    }
    if (!has_id) {
        throw McpParseError("Envelope has neither 'id' nor 'method'");
    }

    try {
        JsonRpcResponse resp;
        from_json(j, resp);
        return resp;
    } catch (const nlohmann::json::exception& e) {
        throw McpParseError(std::string("Malformed error object: ") + e.what(), salvaged);
    }
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Handler text may hold invalid UTF-8; replace it rather than fail the send
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mcpgate
