#pragma once
#include "../clock.hpp"
#include "../tool.hpp"
#include "common.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace mcpipboy {
namespace tools {

class Ean13Tool : public TypedTool<ChecksumInput> {
public:
    explicit Ean13Tool(std::shared_ptr<RandomSource> random);

    /// Check digit for the first twelve digits (weights 1,3,1,3...).
    [[nodiscard]] static int check_digit(std::string_view first_twelve);
    [[nodiscard]] static nlohmann::json validate(const std::string& input);

protected:
    ChecksumInput parse(const nlohmann::json& params) const override;
    nlohmann::json run(const ChecksumInput& input) const override;

private:
    std::shared_ptr<RandomSource> random_;
};

} // namespace tools
} // namespace mcpipboy
