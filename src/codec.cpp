#include "mcpipboy/codec.hpp"
#include "mcpipboy/error.hpp"
#include "mcpipboy/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace mcpipboy {

namespace {

template<typename Node>
nlohmann::json number_to_nlohmann(Node& node) {
    // integers keep their integer type so ids are echoed unchanged
    auto as_int = node.get_int64();
    if (as_int.error() == simdjson::SUCCESS) {
        return nlohmann::json(as_int.value());
    }
    auto as_uint = node.get_uint64();
    if (as_uint.error() == simdjson::SUCCESS) {
        return nlohmann::json(as_uint.value());
    }
    return nlohmann::json(node.get_double().value());
}

nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number:
            return number_to_nlohmann(val);
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

// Scalar documents cannot be read through get_value(), so the top level is
// dispatched on the document itself.
nlohmann::json document_to_nlohmann(simdjson::ondemand::document& doc) {
    switch (doc.type()) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array: {
            simdjson::ondemand::value val = doc.get_value();
            return simdjson_to_nlohmann(val);
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number:
            return number_to_nlohmann(doc);
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(doc.get_bool().value());
        default: {
            bool is_null = doc.is_null();
            if (!is_null) throw McpParseError("JSON parse error: unexpected token");
            return nlohmann::json(nullptr);
        }
    }
}

// Best-effort id recovery for error replies; null when absent or unusable.
RequestId recover_id(const nlohmann::json& j) {
    RequestId id;
    auto it = j.find("id");
    if (it == j.end()) return id;
    try {
        from_json(*it, id);
    } catch (const std::invalid_argument&) {
        id = std::monostate{};
    }
    return id;
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    // On-demand parsing is lazy: malformed content surfaces as an exception
    // during traversal, and trailing garbage only shows up at the end.
    try {
        nlohmann::json j = document_to_nlohmann(doc);
        if (!doc.at_end()) {
            throw McpParseError("JSON parse error: trailing content");
        }
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    RequestId id = recover_id(j);

    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw McpInvalidRequestError(id, "Invalid Request: missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw McpInvalidRequestError(id, "Invalid Request: 'jsonrpc' must be \"2.0\"");
    }

    auto method = j.find("method");
    if (method != j.end()) {
        if (!method->is_string()) {
            throw McpInvalidRequestError(id, "Invalid Request: 'method' must be a string");
        }
        std::optional<nlohmann::json> params;
        if (auto p = j.find("params"); p != j.end() && !p->is_null()) {
            if (!p->is_object()) {
                throw McpInvalidRequestError(id, "Invalid Request: 'params' must be an object");
            }
            params = *p;
        }

        auto raw_id = j.find("id");
        if (raw_id == j.end() || raw_id->is_null()) {
            JsonRpcNotification notif;
            notif.method = method->get<std::string>();
            notif.params = std::move(params);
            return notif;
        }
        if (!raw_id->is_string() && !raw_id->is_number_integer()) {
            throw McpInvalidRequestError(std::monostate{},
                                         "Invalid Request: 'id' must be a string, integer or null");
        }
        if (std::holds_alternative<std::monostate>(id)) {
            throw McpInvalidRequestError(id, "Invalid Request: 'id' out of range");
        }
        JsonRpcRequest req;
        req.id = id;
        req.method = method->get<std::string>();
        req.params = std::move(params);
        return req;
    }

    if (j.contains("result") || j.contains("error")) {
        JsonRpcResponse resp;
        resp.id = id;
        if (j.contains("result")) resp.result = j.at("result");
        if (j.contains("error")) {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception&) {
                throw McpInvalidRequestError(id, "Invalid Request: malformed 'error' object");
            }
        }
        return resp;
    }

    throw McpInvalidRequestError(id, "Invalid Request: missing 'method' field");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    if (!j.is_object()) {
        throw McpInvalidRequestError(std::monostate{}, "Invalid Request: message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace mcpipboy
