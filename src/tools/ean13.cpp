#include "mcpipboy/tools/ean13.hpp"
#include <vector>

namespace mcpipboy {
namespace tools {

Ean13Tool::Ean13Tool(std::shared_ptr<RandomSource> random)
    : TypedTool("ean13",
                "Generate and validate EAN-13 barcodes. EAN-13 codes are 13-digit numbers "
                "whose last digit is a checksum of the first twelve.",
                checksum_schema("EAN-13 code", 100),
                identifier_output_schema("EAN-13 code")),
      random_(std::move(random)) {
    add_resource("ean13://algorithm", "EAN-13 Algorithm", "How the EAN-13 check digit is computed", {
        {"name", "EAN-13 Check Digit Algorithm"},
        {"format", "13-digit number with check digit"},
        {"steps", {
            "Multiply the digits in odd positions (1st, 3rd, ...) by 1",
            "Multiply the digits in even positions (2nd, 4th, ...) by 3",
            "Sum the first twelve weighted digits",
            "Check digit = (10 - (sum mod 10)) mod 10"
        }},
        {"example", {
            {"ean13", "4006381333931"},
            {"sum", 89},
            {"check_digit", 1}
        }}
    });
    add_resource("ean13://examples", "EAN-13 Examples", "Valid and invalid EAN-13 codes",
        nlohmann::json::array({
            {{"ean13", "4006381333931"}, {"valid", true}, {"description", "Valid EAN-13 code"}},
            {{"ean13", "9780306406157"}, {"valid", true}, {"description", "Bookland EAN (ISBN-13)"}},
            {{"ean13", "4006381333932"}, {"valid", false}, {"description", "Wrong check digit"}},
            {{"ean13", "400638133393"}, {"valid", false}, {"description", "Too short"}}
        }));
}

int Ean13Tool::check_digit(std::string_view first_twelve) {
    int sum = 0;
    for (size_t i = 0; i < 12; ++i) {
        int d = first_twelve[i] - '0';
        sum += (i % 2 == 0) ? d : d * 3;
    }
    return (10 - sum % 10) % 10;
}

nlohmann::json Ean13Tool::validate(const std::string& input) {
    std::string clean = remove_all(input, {" ", "-", "\xE2\x80\x94"});
    if (clean.size() != 13) {
        return invalid_result("EAN-13 must be exactly 13 characters", input);
    }
    if (!all_digits(clean)) {
        return invalid_result("EAN-13 must contain only digits", input);
    }
    int expected = check_digit(clean);
    if (clean[12] - '0' != expected) {
        return invalid_result("invalid check digit. Expected " + std::to_string(expected)
                              + ", got " + clean[12], input);
    }
    return {{"valid", true}, {"ean13", clean}, {"input", input}};
}

ChecksumInput Ean13Tool::parse(const nlohmann::json& params) const {
    return parse_checksum_input(input_schema(), params);
}

nlohmann::json Ean13Tool::run(const ChecksumInput& input) const {
    if (input.operation == "validate") {
        return validate(input.input);
    }
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(input.count));
    for (int n = 0; n < input.count; ++n) {
        std::string digits;
        for (int i = 0; i < 12; ++i) {
            digits += static_cast<char>('0' + random_->uniform_int(0, 9));
        }
        digits += static_cast<char>('0' + check_digit(digits));
        out.push_back(digits);
    }
    return one_or_many(out);
}

} // namespace tools
} // namespace mcpipboy
