#pragma once
#include "../clock.hpp"
#include "../tool.hpp"
#include "common.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpipboy {
namespace tools {

struct IbanCountry {
    const char* code;
    const char* name;
    int length;
};

/// Countries the generator knows, with their IBAN lengths.
[[nodiscard]] const std::vector<IbanCountry>& iban_countries();

struct IbanInput {
    ChecksumInput common;
    std::optional<std::string> country_code;
};

class IbanTool : public TypedTool<IbanInput> {
public:
    explicit IbanTool(std::shared_ptr<RandomSource> random);

    /// ISO 13616 MOD-97 remainder of an upper-case alphanumeric IBAN after
    /// moving the first four characters to the end.
    [[nodiscard]] static int mod97(std::string_view iban);
    /// Two check digits for `country` + `bban`.
    [[nodiscard]] static std::string check_digits(std::string_view country, std::string_view bban);
    [[nodiscard]] static nlohmann::json validate(const std::string& input);

protected:
    IbanInput parse(const nlohmann::json& params) const override;
    nlohmann::json run(const IbanInput& input) const override;

private:
    std::string generate(const IbanCountry& country) const;

    std::shared_ptr<RandomSource> random_;
};

} // namespace tools
} // namespace mcpipboy
