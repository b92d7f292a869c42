#include "mcpipboy/schema.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace mcpipboy {

namespace {

ParamSpec make_param(std::string name, ParamType type, std::string description) {
    ParamSpec spec;
    spec.name = std::move(name);
    spec.type = type;
    spec.description = std::move(description);
    return spec;
}

bool matches_type(const nlohmann::json& value, ParamType type) {
    switch (type) {
        case ParamType::String:
            return value.is_string();
        case ParamType::Boolean:
            return value.is_boolean();
        case ParamType::Number:
            return value.is_number();
        case ParamType::Integer:
            if (value.is_number_integer()) return true;
            if (value.is_number_float()) {
                double d = value.get<double>();
                return std::isfinite(d) && std::floor(d) == d;
            }
            return false;
    }
    return false;
}

std::string format_bound(double bound, ParamType type) {
    std::ostringstream os;
    if (type == ParamType::Integer) {
        os << static_cast<long long>(bound);
    } else {
        os << bound;
    }
    return os.str();
}

nlohmann::json bound_json(double bound, ParamType type) {
    if (type == ParamType::Integer) return static_cast<int64_t>(bound);
    return bound;
}

std::optional<ValidationFailure> check_value(const ParamSpec& spec, const nlohmann::json& value) {
    if (!matches_type(value, spec.type)) {
        return TypeMismatch{spec.name, std::string(to_string(spec.type)), json_type_name(value)};
    }
    if (!spec.enum_values.empty()) {
        const auto& s = value.get_ref<const std::string&>();
        if (std::find(spec.enum_values.begin(), spec.enum_values.end(), s) == spec.enum_values.end()) {
            std::string allowed;
            for (const auto& e : spec.enum_values) {
                if (!allowed.empty()) allowed += ", ";
                allowed += e;
            }
            return ConstraintViolation{spec.name, "must be one of: " + allowed};
        }
    }
    if (spec.type == ParamType::Integer || spec.type == ParamType::Number) {
        double d = value.get<double>();
        if (spec.minimum && d < *spec.minimum) {
            return ConstraintViolation{spec.name, "minimum " + format_bound(*spec.minimum, spec.type)};
        }
        if (spec.maximum && d > *spec.maximum) {
            return ConstraintViolation{spec.name, "maximum " + format_bound(*spec.maximum, spec.type)};
        }
    }
    if (spec.min_length && spec.type == ParamType::String
        && value.get_ref<const std::string&>().size() < *spec.min_length) {
        return ConstraintViolation{spec.name, "minLength " + std::to_string(*spec.min_length)};
    }
    return std::nullopt;
}

} // anonymous namespace

std::string_view to_string(ParamType type) {
    switch (type) {
        case ParamType::String:  return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Number:  return "number";
        case ParamType::Boolean: return "boolean";
    }
    return "string";
}

std::string json_type_name(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:            return "null";
        case nlohmann::json::value_t::object:          return "object";
        case nlohmann::json::value_t::array:           return "array";
        case nlohmann::json::value_t::string:          return "string";
        case nlohmann::json::value_t::boolean:         return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float:    return "number";
        default:                                       return "unknown";
    }
}

ParamSpec string_param(std::string name, std::string description) {
    return make_param(std::move(name), ParamType::String, std::move(description));
}

ParamSpec integer_param(std::string name, std::string description) {
    return make_param(std::move(name), ParamType::Integer, std::move(description));
}

ParamSpec number_param(std::string name, std::string description) {
    return make_param(std::move(name), ParamType::Number, std::move(description));
}

ParamSpec boolean_param(std::string name, std::string description) {
    return make_param(std::move(name), ParamType::Boolean, std::move(description));
}

InputSchema& InputSchema::param(ParamSpec spec) {
    params_.push_back(std::move(spec));
    return *this;
}

InputSchema& InputSchema::require_when(std::string field, std::string when_field,
                                       std::string when_value) {
    conditions_.push_back({std::move(field), std::move(when_field), std::move(when_value)});
    return *this;
}

const ParamSpec* InputSchema::find(std::string_view name) const {
    for (const auto& p : params_) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

nlohmann::json InputSchema::to_json() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& p : params_) {
        nlohmann::json prop = {{"type", std::string(to_string(p.type))}};
        if (!p.description.empty()) prop["description"] = p.description;
        if (!p.enum_values.empty()) prop["enum"] = p.enum_values;
        if (p.minimum) prop["minimum"] = bound_json(*p.minimum, p.type);
        if (p.maximum) prop["maximum"] = bound_json(*p.maximum, p.type);
        if (p.min_length) prop["minLength"] = *p.min_length;
        if (p.default_value) prop["default"] = *p.default_value;
        properties[p.name] = std::move(prop);
        if (p.required) required.push_back(p.name);
    }

    nlohmann::json schema = {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"additionalProperties", false}
    };
    if (!required.empty()) schema["required"] = std::move(required);

    if (!conditions_.empty()) {
        nlohmann::json all_of = nlohmann::json::array();
        for (const auto& c : conditions_) {
            nlohmann::json when = {
                {"properties", {{c.when_field, {{"const", c.when_value}}}}}
            };
            // an absent field only matches when its default is the trigger value
            const ParamSpec* trigger = find(c.when_field);
            bool default_matches = trigger && trigger->default_value
                                   && *trigger->default_value == c.when_value;
            if (!default_matches) when["required"] = nlohmann::json::array({c.when_field});
            nlohmann::json then = {{"required", nlohmann::json::array({c.field})}};
            all_of.push_back({{"if", std::move(when)}, {"then", std::move(then)}});
        }
        schema["allOf"] = std::move(all_of);
    }
    return schema;
}

std::optional<ValidationFailure> InputSchema::validate(const nlohmann::json& args) const {
    if (args.is_null()) {
        return validate(nlohmann::json::object());
    }
    if (!args.is_object()) {
        return TypeMismatch{"arguments", "object", json_type_name(args)};
    }

    for (const auto& spec : params_) {
        auto it = args.find(spec.name);
        if (it == args.end()) {
            if (spec.required) return MissingParameter{spec.name};
            continue;
        }
        if (auto failure = check_value(spec, *it)) return failure;
    }

    for (auto it = args.begin(); it != args.end(); ++it) {
        if (!find(it.key())) {
            return ConstraintViolation{it.key(), "additionalProperties: unknown parameter"};
        }
    }

    for (const auto& c : conditions_) {
        auto trigger = effective(args, c.when_field);
        if (!trigger || *trigger != c.when_value) continue;
        auto it = args.find(c.field);
        if (it == args.end()) {
            return MissingParameter{c.field};
        }
    }
    return std::nullopt;
}

std::optional<nlohmann::json> InputSchema::effective(const nlohmann::json& args,
                                                     std::string_view name) const {
    if (args.is_object()) {
        auto it = args.find(std::string(name));
        if (it != args.end()) return *it;
    }
    if (const ParamSpec* spec = find(name); spec && spec->default_value) {
        return spec->default_value;
    }
    return std::nullopt;
}

} // namespace mcpipboy
