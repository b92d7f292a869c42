#include "mcpipboy/tools/random.hpp"
#include "mcpipboy/error.hpp"
#include <cmath>
#include <cstdint>
#include <string>

namespace mcpipboy {
namespace tools {

namespace {

InputSchema random_schema() {
    InputSchema schema;
    schema.param(string_param("type", "Type of random value: integer, float, boolean")
                     .one_of({"integer", "float", "boolean"})
                     .defaults_to("integer"))
          .param(integer_param("count", "Number of random values to generate (1-1000)")
                     .range(1, 1000)
                     .defaults_to(1))
          .param(number_param("min", "Minimum value (for integer/float types)"))
          .param(number_param("max", "Maximum value (for integer/float types)"))
          .param(integer_param("precision", "Decimal places for float values (0-10)")
                     .range(0, 10)
                     .defaults_to(2));
    return schema;
}

nlohmann::json random_output_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"result", {
                {"description", "Random value, or an array of values when count > 1"},
                {"oneOf", nlohmann::json::array({
                    {{"type", "number"}},
                    {{"type", "boolean"}},
                    {{"type", "array"}}
                })}
            }}
        }}
    };
}

// Exclusive upper bound; 2^63 is exact as a double.
constexpr double kInt64Bound = 9223372036854775808.0;

int64_t integer_bound(double v, const char* name) {
    if (!(v >= -kInt64Bound && v < kInt64Bound)) {
        throw ExecutionError(std::string(name) + " is outside the 64-bit integer range");
    }
    return static_cast<int64_t>(v);
}

nlohmann::json collapse(nlohmann::json values) {
    if (values.size() == 1) return values.front();
    return values;
}

} // anonymous namespace

RandomTool::RandomTool(std::shared_ptr<RandomSource> random)
    : TypedTool("random",
                "Generate random numbers with various types and distributions",
                random_schema(),
                random_output_schema()),
      random_(std::move(random)) {}

double RandomTool::round_to(double value, int precision) {
    double multiplier = std::pow(10.0, precision);
    double scaled = value * multiplier;
    if (!std::isfinite(scaled)) return value;
    return std::floor(scaled + 0.5) / multiplier;
}

RandomInput RandomTool::parse(const nlohmann::json& params) const {
    const auto& schema = input_schema();
    RandomInput in;
    in.type = schema.get<std::string>(params, "type").value_or("integer");
    in.count = schema.get<int>(params, "count").value_or(1);
    in.min = schema.get<double>(params, "min");
    in.max = schema.get<double>(params, "max");
    in.precision = schema.get<int>(params, "precision").value_or(2);
    return in;
}

nlohmann::json RandomTool::run(const RandomInput& input) const {
    nlohmann::json values = nlohmann::json::array();

    if (input.type == "boolean") {
        for (int i = 0; i < input.count; ++i) values.push_back(random_->coin());
        return collapse(std::move(values));
    }

    if (input.type == "integer") {
        int64_t lo = integer_bound(input.min.value_or(0), "min");
        int64_t hi = integer_bound(input.max.value_or(100), "max");
        if (lo > hi) throw ExecutionError("min must be less than or equal to max");
        for (int i = 0; i < input.count; ++i) values.push_back(random_->uniform_int(lo, hi));
        return collapse(std::move(values));
    }

    double lo = input.min.value_or(0.0);
    double hi = input.max.value_or(1.0);
    if (lo > hi) throw ExecutionError("min must be less than or equal to max");
    if (!std::isfinite(hi - lo)) throw ExecutionError("range between min and max is too large");
    for (int i = 0; i < input.count; ++i) {
        double v = lo == hi ? lo : random_->uniform_real(lo, hi);
        values.push_back(round_to(v, input.precision));
    }
    return collapse(std::move(values));
}

} // namespace tools
} // namespace mcpipboy
