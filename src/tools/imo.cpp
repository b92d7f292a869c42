#include "mcpipboy/tools/imo.hpp"
#include <vector>

namespace mcpipboy {
namespace tools {

ImoTool::ImoTool(std::shared_ptr<RandomSource> random)
    : TypedTool("imo",
                "Generate and validate International Maritime Organization (IMO) numbers. "
                "IMO numbers are 7-digit numbers with a check digit calculated using a "
                "weighted sum algorithm.",
                checksum_schema("IMO number", 100),
                identifier_output_schema("IMO number")),
      random_(std::move(random)) {
    add_resource("imo://algorithm", "IMO Algorithm", "How the IMO check digit is computed", {
        {"name", "IMO Number Algorithm"},
        {"format", "7-digit number with check digit"},
        {"weights", {7, 6, 5, 4, 3, 2}},
        {"formula", "check digit = (7*d1 + 6*d2 + 5*d3 + 4*d4 + 3*d5 + 2*d6) mod 10"},
        {"example", {
            {"digits", {1, 2, 3, 4, 5, 6}},
            {"calculation", "7 + 12 + 15 + 16 + 15 + 12 = 77"},
            {"check_digit", 7},
            {"result", "1234567"}
        }}
    });
    add_resource("imo://examples", "IMO Examples", "Valid and invalid IMO numbers",
        nlohmann::json::array({
            {{"imo", "1234567"}, {"valid", true}, {"description", "Valid IMO number"}},
            {{"imo", "9074729"}, {"valid", true}, {"description", "Another valid IMO number"}},
            {{"imo", "1234568"}, {"valid", false}, {"description", "Wrong check digit"}},
            {{"imo", "123456"}, {"valid", false}, {"description", "Too short"}}
        }));
}

int ImoTool::check_digit(std::string_view first_six) {
    int sum = 0;
    for (size_t i = 0; i < 6; ++i) {
        sum += (first_six[i] - '0') * static_cast<int>(7 - i);
    }
    return sum % 10;
}

nlohmann::json ImoTool::validate(const std::string& input) {
    std::string clean = remove_all(input, {" ", "-"});
    if (clean.size() != 7) {
        return invalid_result("IMO number must be exactly 7 digits", input);
    }
    if (!all_digits(clean)) {
        return invalid_result("IMO number must contain only digits", input);
    }
    int expected = check_digit(clean);
    int actual = clean[6] - '0';
    if (expected != actual) {
        return invalid_result("invalid check digit. Expected " + std::to_string(expected)
                              + ", got " + std::to_string(actual), input);
    }
    return {{"valid", true}, {"imo", clean}, {"input", input}};
}

ChecksumInput ImoTool::parse(const nlohmann::json& params) const {
    return parse_checksum_input(input_schema(), params);
}

nlohmann::json ImoTool::run(const ChecksumInput& input) const {
    if (input.operation == "validate") {
        return validate(input.input);
    }
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(input.count));
    for (int n = 0; n < input.count; ++n) {
        std::string digits;
        for (int i = 0; i < 6; ++i) {
            digits += static_cast<char>('0' + random_->uniform_int(0, 9));
        }
        digits += static_cast<char>('0' + check_digit(digits));
        out.push_back(digits);
    }
    return one_or_many(out);
}

} // namespace tools
} // namespace mcpipboy
