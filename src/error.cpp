#include "mcpipboy/error.hpp"

namespace mcpipboy {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

std::string describe(const ValidationFailure& failure) {
    return std::visit(overloaded{
        [](const MissingParameter& f) {
            return "missing required parameter: " + f.field;
        },
        [](const TypeMismatch& f) {
            return "parameter '" + f.field + "' must be " + f.expected + ", got " + f.actual;
        },
        [](const ConstraintViolation& f) {
            return "parameter '" + f.field + "' violates constraint: " + f.constraint;
        },
    }, failure);
}

void to_json(nlohmann::json& j, const ValidationFailure& failure) {
    std::visit(overloaded{
        [&j](const MissingParameter& f) {
            j = {{"kind", "missing_parameter"}, {"field", f.field}};
        },
        [&j](const TypeMismatch& f) {
            j = {{"kind", "type_mismatch"}, {"field", f.field},
                 {"expected", f.expected}, {"actual", f.actual}};
        },
        [&j](const ConstraintViolation& f) {
            j = {{"kind", "constraint"}, {"field", f.field}, {"constraint", f.constraint}};
        },
    }, failure);
}

} // namespace mcpipboy
