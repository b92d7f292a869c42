#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>

namespace mcpipboy {

class Codec {
public:
    /// Parse one line into a message.
    /// Throws McpParseError when the bytes are not JSON, and
    /// McpInvalidRequestError when the JSON is not a JSON-RPC 2.0 message.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse raw bytes into a JSON value. Throws McpParseError.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Serialize a message to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace mcpipboy
