#include "mcpipboy/tools/creditcard.hpp"
#include <array>
#include <vector>

namespace mcpipboy {
namespace tools {

namespace {

const std::array<const char*, 6> kCardTypes = {
    "visa", "mastercard", "amex", "discover", "diners", "jcb"
};

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

// Numeric value of the first n digits, or -1 when shorter.
int prefix_value(std::string_view digits, size_t n) {
    if (digits.size() < n) return -1;
    int v = 0;
    for (size_t i = 0; i < n; ++i) v = v * 10 + (digits[i] - '0');
    return v;
}

InputSchema creditcard_schema() {
    InputSchema schema = checksum_schema("credit card number", 100);
    schema.param(string_param("card-type",
                              "Card type for generation: visa, mastercard, amex, discover, diners, jcb "
                              "(random when omitted)")
                     .one_of({kCardTypes.begin(), kCardTypes.end()}));
    return schema;
}

nlohmann::json types_resource() {
    auto type = [](const char* name, const char* description,
                   std::vector<std::string> prefixes, std::vector<int> lengths) {
        return nlohmann::json{{"name", name}, {"description", description},
                              {"prefixes", prefixes}, {"lengths", lengths}};
    };
    return {{"types", nlohmann::json::array({
        type("visa", "Visa", {"4"}, {13, 16, 19}),
        type("mastercard", "Mastercard", {"51-55", "2221-2720"}, {16}),
        type("amex", "American Express", {"34", "37"}, {15}),
        type("discover", "Discover", {"6011", "65", "644-649"}, {16}),
        type("diners", "Diners Club", {"300-305", "36", "38"}, {14}),
        type("jcb", "JCB", {"3528-3589"}, {16})
    })}};
}

} // anonymous namespace

CreditCardTool::CreditCardTool(std::shared_ptr<RandomSource> random)
    : TypedTool("creditcard",
                "Generate and validate credit card numbers using the Luhn algorithm. "
                "Supports Visa, Mastercard, American Express, Discover, Diners Club and JCB.",
                creditcard_schema(),
                identifier_output_schema("credit card number")),
      random_(std::move(random)) {
    add_resource("creditcard://types", "Credit Card Types", "Issuer prefixes and lengths",
                 types_resource());
    add_resource("creditcard://luhn", "Luhn Algorithm", "How the Luhn checksum works", {
        {"name", "Luhn Algorithm"},
        {"steps", {
            "Starting from the rightmost digit, double every second digit",
            "If doubling results in a two-digit number, add its digits together",
            "Sum all the digits",
            "The number is valid if the total is divisible by 10"
        }},
        {"example", {{"number", "4532015112830366"}, {"valid", true}}}
    });
    add_resource("creditcard://examples", "Credit Card Examples", "Test card numbers",
        nlohmann::json::array({
            {{"number", "4532015112830366"}, {"type", "visa"}, {"valid", true}},
            {{"number", "5555555555554444"}, {"type", "mastercard"}, {"valid", true}},
            {{"number", "378282246310005"}, {"type", "amex"}, {"valid", true}},
            {{"number", "4532015112830367"}, {"type", "visa"}, {"valid", false},
             {"description", "Wrong check digit"}}
        }));
}

bool CreditCardTool::luhn_valid(std::string_view digits) {
    int sum = 0;
    bool twice = false;
    for (size_t i = digits.size(); i-- > 0;) {
        int d = digits[i] - '0';
        if (twice) {
            d *= 2;
            if (d > 9) d -= 9;
        }
        sum += d;
        twice = !twice;
    }
    return sum % 10 == 0;
}

int CreditCardTool::luhn_check_digit(std::string_view partial) {
    int sum = 0;
    bool twice = true;
    for (size_t i = partial.size(); i-- > 0;) {
        int d = partial[i] - '0';
        if (twice) {
            d *= 2;
            if (d > 9) d -= 9;
        }
        sum += d;
        twice = !twice;
    }
    return (10 - sum % 10) % 10;
}

std::string CreditCardTool::detect_type(std::string_view n) {
    if (starts_with(n, "4")) return "visa";
    if (starts_with(n, "34") || starts_with(n, "37")) return "amex";

    int two = prefix_value(n, 2);
    int three = prefix_value(n, 3);
    int four = prefix_value(n, 4);
    if (two >= 51 && two <= 55) return "mastercard";
    if (four >= 2221 && four <= 2720) return "mastercard";
    if (starts_with(n, "6011") || starts_with(n, "65")) return "discover";
    if (three >= 644 && three <= 649) return "discover";
    if (three >= 300 && three <= 305) return "diners";
    if (starts_with(n, "36") || starts_with(n, "38")) return "diners";
    if (four >= 3528 && four <= 3589) return "jcb";
    return "unknown";
}

nlohmann::json CreditCardTool::validate(const std::string& input) {
    std::string clean = remove_all(input, {" ", "-"});
    if (!all_digits(clean)) {
        return invalid_result("credit card number must contain only digits", input);
    }
    if (clean.size() < 13 || clean.size() > 19) {
        return invalid_result("credit card number must be between 13 and 19 digits", input);
    }
    if (!luhn_valid(clean)) {
        return invalid_result("invalid check digit", input);
    }
    return {{"valid", true}, {"card", clean}, {"type", detect_type(clean)}, {"input", input}};
}

CreditCardInput CreditCardTool::parse(const nlohmann::json& params) const {
    CreditCardInput in;
    in.common = parse_checksum_input(input_schema(), params);
    in.card_type = input_schema().get<std::string>(params, "card-type");
    return in;
}

std::string CreditCardTool::generate(std::string type) const {
    if (type.empty()) {
        type = kCardTypes[static_cast<size_t>(random_->uniform_int(0, kCardTypes.size() - 1))];
    }

    std::string prefix;
    size_t length = 16;
    if (type == "visa") {
        prefix = "4";
    } else if (type == "mastercard") {
        prefix = std::to_string(random_->uniform_int(51, 55));
    } else if (type == "amex") {
        prefix = random_->coin() ? "34" : "37";
        length = 15;
    } else if (type == "discover") {
        prefix = "6011";
    } else if (type == "diners") {
        static const std::array<const char*, 8> kDiners = {
            "300", "301", "302", "303", "304", "305", "36", "38"
        };
        prefix = kDiners[static_cast<size_t>(random_->uniform_int(0, kDiners.size() - 1))];
        length = 14;
    } else if (type == "jcb") {
        prefix = std::to_string(random_->uniform_int(3528, 3589));
    } else {
        throw ExecutionError("unsupported card type: " + type);
    }

    std::string number = prefix;
    while (number.size() < length - 1) {
        number += static_cast<char>('0' + random_->uniform_int(0, 9));
    }
    number += static_cast<char>('0' + luhn_check_digit(number));
    return number;
}

nlohmann::json CreditCardTool::run(const CreditCardInput& input) const {
    if (input.common.operation == "validate") {
        return validate(input.common.input);
    }
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(input.common.count));
    for (int n = 0; n < input.common.count; ++n) {
        out.push_back(generate(input.card_type.value_or("")));
    }
    return one_or_many(out);
}

} // namespace tools
} // namespace mcpipboy
