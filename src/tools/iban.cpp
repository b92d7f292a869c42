#include "mcpipboy/tools/iban.hpp"
#include "mcpipboy/error.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace mcpipboy {
namespace tools {

namespace {

bool is_upper_alpha(char c) { return c >= 'A' && c <= 'Z'; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

const IbanCountry* find_country(const std::string& code) {
    for (const auto& c : iban_countries()) {
        if (code == c.code) return &c;
    }
    return nullptr;
}

InputSchema iban_schema() {
    InputSchema schema = checksum_schema("IBAN", 100);
    schema.param(string_param("country-code",
                              "ISO 3166-1 alpha-2 country code for generation (random when omitted)"));
    return schema;
}

nlohmann::json countries_resource() {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& c : iban_countries()) {
        list.push_back({{"code", c.code}, {"name", c.name}, {"length", c.length}});
    }
    return {{"countries", std::move(list)}};
}

} // anonymous namespace

const std::vector<IbanCountry>& iban_countries() {
    static const std::vector<IbanCountry> countries = {
        {"GB", "United Kingdom", 22}, {"DE", "Germany", 22},     {"FR", "France", 27},
        {"IT", "Italy", 27},          {"ES", "Spain", 24},       {"NL", "Netherlands", 18},
        {"BE", "Belgium", 16},        {"AT", "Austria", 20},     {"CH", "Switzerland", 21},
        {"SE", "Sweden", 24},         {"NO", "Norway", 15},      {"DK", "Denmark", 18},
        {"FI", "Finland", 18},        {"PL", "Poland", 28},      {"CZ", "Czech Republic", 24},
        {"HU", "Hungary", 28},        {"RO", "Romania", 24},     {"BG", "Bulgaria", 22},
        {"HR", "Croatia", 21},        {"SI", "Slovenia", 19},    {"SK", "Slovakia", 24},
        {"LT", "Lithuania", 20},      {"LV", "Latvia", 21},      {"EE", "Estonia", 20},
        {"IE", "Ireland", 22},        {"PT", "Portugal", 25},    {"GR", "Greece", 27},
        {"CY", "Cyprus", 28},         {"MT", "Malta", 31},       {"LU", "Luxembourg", 20},
    };
    return countries;
}

IbanTool::IbanTool(std::shared_ptr<RandomSource> random)
    : TypedTool("iban",
                "Generate and validate International Bank Account Numbers (IBAN) using the "
                "MOD-97 checksum.",
                iban_schema(),
                identifier_output_schema("IBAN")),
      random_(std::move(random)) {
    add_resource("iban://countries", "IBAN Countries", "Supported countries and IBAN lengths",
                 countries_resource());
    add_resource("iban://mod97", "MOD-97 Algorithm", "How IBAN check digits are verified", {
        {"name", "MOD-97 (ISO 7064)"},
        {"steps", {
            "Remove spaces and convert to upper case",
            "Move the first four characters to the end",
            "Replace each letter with two digits (A=10 ... Z=35)",
            "The IBAN is valid if the resulting number mod 97 equals 1"
        }},
        {"generation", "check digits = 98 - mod97(country + \"00\" + BBAN), zero padded"},
        {"example", {{"iban", "GB82WEST12345698765432"}, {"valid", true}}}
    });
    add_resource("iban://examples", "IBAN Examples", "Valid and invalid IBANs",
        nlohmann::json::array({
            {{"iban", "GB82WEST12345698765432"}, {"country", "GB"}, {"valid", true}},
            {{"iban", "DE89370400440532013000"}, {"country", "DE"}, {"valid", true}},
            {{"iban", "FR1420041010050500013M02606"}, {"country", "FR"}, {"valid", true}},
            {{"iban", "GB82WEST12345698765433"}, {"country", "GB"}, {"valid", false}}
        }));
}

int IbanTool::mod97(std::string_view iban) {
    std::string rearranged = std::string(iban.substr(4)) + std::string(iban.substr(0, 4));
    int remainder = 0;
    for (char c : rearranged) {
        if (is_upper_alpha(c)) {
            int v = c - 'A' + 10;
            remainder = (remainder * 100 + v) % 97;
        } else {
            remainder = (remainder * 10 + (c - '0')) % 97;
        }
    }
    return remainder;
}

std::string IbanTool::check_digits(std::string_view country, std::string_view bban) {
    std::string probe = std::string(country) + "00" + std::string(bban);
    int check = 98 - mod97(probe);
    char buf[3];
    std::snprintf(buf, sizeof(buf), "%02d", check);
    return buf;
}

nlohmann::json IbanTool::validate(const std::string& input) {
    std::string clean = to_upper(remove_all(input, {" "}));
    if (clean.size() < 15 || clean.size() > 34) {
        return invalid_result("IBAN must be between 15 and 34 characters", input);
    }
    if (!is_upper_alpha(clean[0]) || !is_upper_alpha(clean[1])) {
        return invalid_result("IBAN must start with 2 letters (country code)", input);
    }
    if (!std::all_of(clean.begin(), clean.end(),
                     [](char c) { return is_upper_alpha(c) || is_digit(c); })) {
        return invalid_result("IBAN must contain only letters and numbers", input);
    }
    if (mod97(clean) != 1) {
        return invalid_result("invalid check digits", input);
    }
    return {{"valid", true}, {"iban", clean}, {"country", clean.substr(0, 2)}, {"input", input}};
}

IbanInput IbanTool::parse(const nlohmann::json& params) const {
    IbanInput in;
    in.common = parse_checksum_input(input_schema(), params);
    if (auto cc = input_schema().get<std::string>(params, "country-code"); cc && !cc->empty()) {
        in.country_code = to_upper(*cc);
    }
    return in;
}

std::string IbanTool::generate(const IbanCountry& country) const {
    std::string bban;
    for (int i = 0; i < country.length - 4; ++i) {
        if (random_->coin()) {
            bban += static_cast<char>('0' + random_->uniform_int(0, 9));
        } else {
            bban += static_cast<char>('A' + random_->uniform_int(0, 25));
        }
    }
    return std::string(country.code) + check_digits(country.code, bban) + bban;
}

nlohmann::json IbanTool::run(const IbanInput& input) const {
    if (input.common.operation == "validate") {
        return validate(input.common.input);
    }

    const IbanCountry* fixed = nullptr;
    if (input.country_code) {
        fixed = find_country(*input.country_code);
        if (!fixed) {
            throw ExecutionError("invalid country code: " + *input.country_code
                                 + ". Must be a supported ISO 3166-1 alpha-2 country code");
        }
    }

    const auto& countries = iban_countries();
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(input.common.count));
    for (int n = 0; n < input.common.count; ++n) {
        const IbanCountry& c = fixed ? *fixed
            : countries[static_cast<size_t>(random_->uniform_int(0, countries.size() - 1))];
        out.push_back(generate(c));
    }
    return one_or_many(out);
}

} // namespace tools
} // namespace mcpipboy
