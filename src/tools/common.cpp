#include "mcpipboy/tools/common.hpp"

namespace mcpipboy {
namespace tools {

InputSchema checksum_schema(const std::string& noun, int max_count) {
    InputSchema schema;
    schema.param(string_param("operation", "Operation to perform: 'validate' or 'generate'")
                     .one_of({"validate", "generate"})
                     .defaults_to("validate"))
          .param(string_param("input", noun + " to validate (required for validate operation)")
                     .non_empty())
          .param(integer_param("count", "Number of " + noun + "s to generate (1-"
                                            + std::to_string(max_count) + ", default: 1)")
                     .range(1, max_count)
                     .defaults_to(1))
          .require_when("input", "operation", "validate");
    return schema;
}

ChecksumInput parse_checksum_input(const InputSchema& schema, const nlohmann::json& params) {
    ChecksumInput in;
    in.operation = schema.get<std::string>(params, "operation").value_or("validate");
    in.input = schema.get<std::string>(params, "input").value_or("");
    in.count = schema.get<int>(params, "count").value_or(1);
    return in;
}

nlohmann::json identifier_output_schema(const std::string& noun) {
    return {
        {"type", "object"},
        {"properties", {
            {"result", {
                {"description", "Generated " + noun + "(s) or validation result"},
                {"oneOf", nlohmann::json::array({
                    {{"type", "string"}},
                    {{"type", "array"}, {"items", {{"type", "string"}}}},
                    {{"type", "object"}, {"properties", {
                        {"valid", {{"type", "boolean"}}},
                        {"error", {{"type", "string"}}},
                        {"input", {{"type", "string"}}}
                    }}, {"required", nlohmann::json::array({"valid", "input"})}}
                })}
            }}
        }}
    };
}

std::string remove_all(std::string_view s, std::initializer_list<std::string_view> tokens) {
    std::string out(s);
    for (auto token : tokens) {
        if (token.empty()) continue;
        size_t pos = 0;
        while ((pos = out.find(token, pos)) != std::string::npos) {
            out.erase(pos, token.size());
        }
    }
    return out;
}

bool all_digits(std::string_view s) {
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

nlohmann::json invalid_result(const std::string& error, const std::string& input) {
    return {{"valid", false}, {"error", error}, {"input", input}};
}

} // namespace tools
} // namespace mcpipboy
