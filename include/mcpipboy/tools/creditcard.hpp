#pragma once
#include "../clock.hpp"
#include "../tool.hpp"
#include "common.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpipboy {
namespace tools {

struct CreditCardInput {
    ChecksumInput common;
    std::optional<std::string> card_type;
};

class CreditCardTool : public TypedTool<CreditCardInput> {
public:
    explicit CreditCardTool(std::shared_ptr<RandomSource> random);

    [[nodiscard]] static bool luhn_valid(std::string_view digits);
    /// Digit that makes `partial` followed by it pass the Luhn check.
    [[nodiscard]] static int luhn_check_digit(std::string_view partial);
    /// visa, mastercard, amex, discover, diners, jcb or unknown.
    [[nodiscard]] static std::string detect_type(std::string_view digits);
    [[nodiscard]] static nlohmann::json validate(const std::string& input);

protected:
    CreditCardInput parse(const nlohmann::json& params) const override;
    nlohmann::json run(const CreditCardInput& input) const override;

private:
    std::string generate(std::string type) const;

    std::shared_ptr<RandomSource> random_;
};

} // namespace tools
} // namespace mcpipboy
