#pragma once
#include "../clock.hpp"
#include "../tool.hpp"
#include <memory>
#include <optional>
#include <string>

namespace mcpipboy {
namespace tools {

struct RandomInput {
    std::string type = "integer";
    int count = 1;
    std::optional<double> min;
    std::optional<double> max;
    int precision = 2;
};

class RandomTool : public TypedTool<RandomInput> {
public:
    explicit RandomTool(std::shared_ptr<RandomSource> random);

    /// Rounds half up to `precision` decimal places.
    [[nodiscard]] static double round_to(double value, int precision);

protected:
    RandomInput parse(const nlohmann::json& params) const override;
    nlohmann::json run(const RandomInput& input) const override;

private:
    std::shared_ptr<RandomSource> random_;
};

} // namespace tools
} // namespace mcpipboy
