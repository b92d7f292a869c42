#pragma once
#include "error.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpipboy {

enum class ParamType { String, Integer, Number, Boolean };

[[nodiscard]] std::string_view to_string(ParamType type);

/// Declaration of one tool parameter. Built with the *_param() helpers and
/// refined through the chaining setters.
struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    std::string description;
    bool required = false;
    std::vector<std::string> enum_values;
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<size_t> min_length;
    std::optional<nlohmann::json> default_value;

    ParamSpec& require() { required = true; return *this; }
    ParamSpec& one_of(std::vector<std::string> values) { enum_values = std::move(values); return *this; }
    ParamSpec& range(double lo, double hi) { minimum = lo; maximum = hi; return *this; }
    ParamSpec& non_empty() { min_length = 1; return *this; }
    ParamSpec& defaults_to(nlohmann::json value) { default_value = std::move(value); return *this; }
};

[[nodiscard]] ParamSpec string_param(std::string name, std::string description);
[[nodiscard]] ParamSpec integer_param(std::string name, std::string description);
[[nodiscard]] ParamSpec number_param(std::string name, std::string description);
[[nodiscard]] ParamSpec boolean_param(std::string name, std::string description);

/// `field` is required whenever the effective value of `when_field` is `when_value`.
struct ConditionalRequirement {
    std::string field;
    std::string when_field;
    std::string when_value;
};

/// Closed object schema for a tool's arguments. The same instance produces the
/// JSON Schema advertised by tools/list and validates incoming arguments.
class InputSchema {
public:
    InputSchema& param(ParamSpec spec);
    InputSchema& require_when(std::string field, std::string when_field, std::string when_value);

    [[nodiscard]] const std::vector<ParamSpec>& params() const { return params_; }
    [[nodiscard]] const ParamSpec* find(std::string_view name) const;

    [[nodiscard]] nlohmann::json to_json() const;

    /// Returns the first failure found, or nullopt when `args` conforms.
    /// A null `args` is treated as an empty object.
    [[nodiscard]] std::optional<ValidationFailure> validate(const nlohmann::json& args) const;

    /// Value supplied in `args`, else the declared default, else nullopt.
    [[nodiscard]] std::optional<nlohmann::json> effective(const nlohmann::json& args,
                                                          std::string_view name) const;

    template<typename T>
    [[nodiscard]] std::optional<T> get(const nlohmann::json& args, std::string_view name) const {
        auto v = effective(args, name);
        if (!v) return std::nullopt;
        return v->template get<T>();
    }

private:
    std::vector<ParamSpec> params_;
    std::vector<ConditionalRequirement> conditions_;
};

/// JSON type name as used in JSON Schema ("string", "integer", "null", ...).
[[nodiscard]] std::string json_type_name(const nlohmann::json& value);

} // namespace mcpipboy
