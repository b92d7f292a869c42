#include "mcpipboy/tools/isbn.hpp"
#include "mcpipboy/tools/ean13.hpp"
#include <vector>

namespace mcpipboy {
namespace tools {

namespace {

InputSchema isbn_schema() {
    InputSchema schema = checksum_schema("ISBN", 100);
    schema.param(string_param("format",
                              "ISBN format: 'isbn10', 'isbn13' or 'auto' "
                              "(default: auto for validation, isbn13 for generation)")
                     .one_of({"isbn10", "isbn13", "auto"}));
    return schema;
}

// Empty string when valid, otherwise the reason.
std::string check_isbn10(const std::string& isbn) {
    if (isbn.size() != 10) return "ISBN-10 must be exactly 10 characters";
    if (!all_digits(std::string_view(isbn).substr(0, 9))) {
        return "ISBN-10 must contain only digits (except last character)";
    }
    char last = isbn[9];
    if (last != 'X' && (last < '0' || last > '9')) {
        return "ISBN-10 last character must be digit or X";
    }
    char expected = IsbnTool::isbn10_check_digit(isbn);
    if (last != expected) {
        return std::string("invalid check digit. Expected ") + expected + ", got " + last;
    }
    return {};
}

std::string check_isbn13(const std::string& isbn) {
    if (isbn.size() != 13) return "ISBN-13 must be exactly 13 characters";
    if (!all_digits(isbn)) return "ISBN-13 must contain only digits";
    int expected = Ean13Tool::check_digit(isbn);
    if (isbn[12] - '0' != expected) {
        return "invalid check digit. Expected " + std::to_string(expected) + ", got " + isbn[12];
    }
    return {};
}

} // anonymous namespace

IsbnTool::IsbnTool(std::shared_ptr<RandomSource> random)
    : TypedTool("isbn",
                "Generate and validate International Standard Book Numbers (ISBN-10 and ISBN-13).",
                isbn_schema(),
                identifier_output_schema("ISBN")),
      random_(std::move(random)) {
    add_resource("isbn://formats", "ISBN Formats", "Supported ISBN formats", {
        {"formats", nlohmann::json::array({
            {{"name", "ISBN-10"}, {"length", 10},
             {"description", "Ten characters; the check character may be X"}},
            {{"name", "ISBN-13"}, {"length", 13},
             {"description", "Thirteen digits, prefix 978 or 979, EAN-13 checksum"}}
        })},
        {"separators", nlohmann::json::array({" ", "-"})}
    });
    add_resource("isbn://algorithms", "ISBN Algorithms", "How ISBN check digits are computed", {
        {"isbn10", {
            {"weights", {10, 9, 8, 7, 6, 5, 4, 3, 2}},
            {"formula", "check = (11 - (sum mod 11)) mod 11, 10 is written as X"},
            {"example", "0306406152"}
        }},
        {"isbn13", {
            {"weights", {1, 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3}},
            {"formula", "check = (10 - (sum mod 10)) mod 10"},
            {"example", "9780306406157"}
        }}
    });
    add_resource("isbn://examples", "ISBN Examples", "Valid and invalid ISBNs",
        nlohmann::json::array({
            {{"isbn", "0-306-40615-2"}, {"format", "ISBN-10"}, {"valid", true}},
            {{"isbn", "978-0-306-40615-7"}, {"format", "ISBN-13"}, {"valid", true}},
            {{"isbn", "0-8044-2957-X"}, {"format", "ISBN-10"}, {"valid", true}},
            {{"isbn", "0-306-40615-3"}, {"format", "ISBN-10"}, {"valid", false}}
        }));
}

char IsbnTool::isbn10_check_digit(std::string_view first_nine) {
    int sum = 0;
    for (size_t i = 0; i < 9; ++i) {
        sum += (first_nine[i] - '0') * static_cast<int>(10 - i);
    }
    int check = (11 - sum % 11) % 11;
    return check == 10 ? 'X' : static_cast<char>('0' + check);
}

nlohmann::json IsbnTool::validate(const std::string& input, const std::string& format) {
    std::string clean = remove_all(input, {" ", "-", "\xE2\x80\x94"});
    std::string fmt = format;
    if (fmt == "auto") {
        if (clean.size() == 10) {
            fmt = "isbn10";
        } else if (clean.size() == 13) {
            fmt = "isbn13";
        } else {
            return invalid_result("unable to auto-detect ISBN format (must be 10 or 13 digits)", input);
        }
    }
    std::string problem = fmt == "isbn10" ? check_isbn10(clean) : check_isbn13(clean);
    if (!problem.empty()) return invalid_result(problem, input);
    return {{"valid", true}, {"isbn", clean}, {"format", fmt == "isbn10" ? "ISBN10" : "ISBN13"},
            {"input", input}};
}

IsbnInput IsbnTool::parse(const nlohmann::json& params) const {
    IsbnInput in;
    in.common = parse_checksum_input(input_schema(), params);
    in.format = input_schema().get<std::string>(params, "format");
    return in;
}

std::string IsbnTool::generate(const std::string& format) const {
    if (format == "isbn10") {
        std::string digits;
        for (int i = 0; i < 9; ++i) {
            digits += static_cast<char>('0' + random_->uniform_int(0, 9));
        }
        return digits + isbn10_check_digit(digits);
    }
    std::string digits = random_->coin() ? "978" : "979";
    for (int i = 0; i < 9; ++i) {
        digits += static_cast<char>('0' + random_->uniform_int(0, 9));
    }
    return digits + static_cast<char>('0' + Ean13Tool::check_digit(digits));
}

nlohmann::json IsbnTool::run(const IsbnInput& input) const {
    if (input.common.operation == "validate") {
        return validate(input.common.input, input.format.value_or("auto"));
    }
    std::string format = input.format.value_or("isbn13");
    if (format == "auto") format = "isbn13";
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(input.common.count));
    for (int n = 0; n < input.common.count; ++n) out.push_back(generate(format));
    return one_or_many(out);
}

} // namespace tools
} // namespace mcpipboy
