#pragma once
#include "../clock.hpp"
#include "../tool.hpp"
#include "common.hpp"
#include <memory>
#include <string>

namespace mcpipboy {
namespace tools {

/// IMO ship identification numbers: seven digits, the last one a weighted
/// checksum of the first six (weights 7..2, mod 10).
class ImoTool : public TypedTool<ChecksumInput> {
public:
    explicit ImoTool(std::shared_ptr<RandomSource> random);

    [[nodiscard]] static int check_digit(std::string_view first_six);
    [[nodiscard]] static nlohmann::json validate(const std::string& input);

protected:
    ChecksumInput parse(const nlohmann::json& params) const override;
    nlohmann::json run(const ChecksumInput& input) const override;

private:
    std::shared_ptr<RandomSource> random_;
};

} // namespace tools
} // namespace mcpipboy
