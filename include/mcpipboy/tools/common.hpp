#pragma once
#include "../schema.hpp"
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpipboy {
namespace tools {

/// Arguments shared by the validate/generate identifier tools.
struct ChecksumInput {
    std::string operation;
    std::string input;
    int count = 1;
};

/// Schema with `operation` (validate|generate, default validate), `input`
/// (required when validating) and `count` (1..max_count).
[[nodiscard]] InputSchema checksum_schema(const std::string& noun, int max_count);

[[nodiscard]] ChecksumInput parse_checksum_input(const InputSchema& schema,
                                                 const nlohmann::json& params);

/// Output schema for tools whose result is a string, a list of strings or a
/// validation object.
[[nodiscard]] nlohmann::json identifier_output_schema(const std::string& noun);

/// Copy of `s` with every occurrence of each token removed.
[[nodiscard]] std::string remove_all(std::string_view s, std::initializer_list<std::string_view> tokens);

[[nodiscard]] bool all_digits(std::string_view s);

/// {"valid": false, "error": ..., "input": ...}
[[nodiscard]] nlohmann::json invalid_result(const std::string& error, const std::string& input);

/// One value when count is 1, otherwise the whole array.
template<typename T>
[[nodiscard]] nlohmann::json one_or_many(const std::vector<T>& values) {
    if (values.size() == 1) return values.front();
    return values;
}

} // namespace tools
} // namespace mcpipboy
