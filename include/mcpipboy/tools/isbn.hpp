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

struct IsbnInput {
    ChecksumInput common;
    std::optional<std::string> format;
};

/// ISBN-10 (mod 11, 'X' for ten) and ISBN-13 (EAN-13 checksum).
class IsbnTool : public TypedTool<IsbnInput> {
public:
    explicit IsbnTool(std::shared_ptr<RandomSource> random);

    /// '0'..'9' or 'X' for the first nine digits.
    [[nodiscard]] static char isbn10_check_digit(std::string_view first_nine);
    [[nodiscard]] static nlohmann::json validate(const std::string& input, const std::string& format);

protected:
    IsbnInput parse(const nlohmann::json& params) const override;
    nlohmann::json run(const IsbnInput& input) const override;

private:
    std::string generate(const std::string& format) const;

    std::shared_ptr<RandomSource> random_;
};

} // namespace tools
} // namespace mcpipboy
