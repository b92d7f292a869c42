#include <gtest/gtest.h>
#include "mcpipboy/dispatcher.hpp"
#include "mcpipboy/error.hpp"
#include "mcpipboy/tools/creditcard.hpp"
#include "mcpipboy/tools/ean13.hpp"
#include "mcpipboy/tools/imo.hpp"
#include "mcpipboy/tools/isbn.hpp"

using namespace mcpipboy;
using namespace mcpipboy::tools;

namespace {

std::shared_ptr<RandomSource> seeded(uint64_t seed = 1234) {
    return std::make_shared<Mt19937Random>(seed);
}

} // namespace

// ---- IMO ----

TEST(ImoTool, CheckDigit) {
    EXPECT_EQ(ImoTool::check_digit("907472"), 9);
    EXPECT_EQ(ImoTool::check_digit("123456"), 7);
}

TEST(ImoTool, ValidNumbers) {
    auto r = ImoTool::validate("9074729");
    EXPECT_EQ(r["valid"], true);
    EXPECT_EQ(r["imo"], "9074729");
    EXPECT_EQ(ImoTool::validate("123 4567")["valid"], true);
}

TEST(ImoTool, InvalidNumbers) {
    auto r = ImoTool::validate("1234568");
    EXPECT_EQ(r["valid"], false);
    EXPECT_EQ(r["error"], "invalid check digit. Expected 7, got 8");
    EXPECT_EQ(r["input"], "1234568");

    EXPECT_EQ(ImoTool::validate("123456")["error"], "IMO number must be exactly 7 digits");
    EXPECT_EQ(ImoTool::validate("12345A7")["error"], "IMO number must contain only digits");
}

TEST(ImoTool, GenerateProducesValidNumbers) {
    ImoTool tool(seeded());
    auto out = tool.execute({{"operation", "generate"}, {"count", 20}});
    ASSERT_TRUE(out.is_array());
    ASSERT_EQ(out.size(), 20u);
    for (const auto& imo : out) {
        EXPECT_EQ(ImoTool::validate(imo.get<std::string>())["valid"], true) << imo;
    }
}

TEST(ImoTool, SingleGenerateIsString) {
    ImoTool tool(seeded());
    auto out = tool.execute({{"operation", "generate"}});
    ASSERT_TRUE(out.is_string());
    EXPECT_EQ(out.get<std::string>().size(), 7u);
}

TEST(ImoTool, SchemaRequiresInputForValidate) {
    ImoTool tool(seeded());
    auto failure = tool.validate_params(nlohmann::json::object());
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(describe(*failure), "missing required parameter: input");
    EXPECT_FALSE(tool.validate_params({{"operation", "generate"}, {"count", 100}}).has_value());
    EXPECT_TRUE(tool.validate_params({{"operation", "generate"}, {"count", 101}}).has_value());
}

// ---- EAN-13 ----

TEST(Ean13Tool, CheckDigit) {
    EXPECT_EQ(Ean13Tool::check_digit("400638133393"), 1);
    EXPECT_EQ(Ean13Tool::check_digit("590123412345"), 7);
}

TEST(Ean13Tool, Validate) {
    EXPECT_EQ(Ean13Tool::validate("4006381333931")["valid"], true);
    EXPECT_EQ(Ean13Tool::validate("400-6381-33393-1")["ean13"], "4006381333931");

    auto bad = Ean13Tool::validate("4006381333932");
    EXPECT_EQ(bad["valid"], false);
    EXPECT_EQ(bad["error"], "invalid check digit. Expected 1, got 2");

    EXPECT_EQ(Ean13Tool::validate("400638133393")["error"], "EAN-13 must be exactly 13 characters");
    EXPECT_EQ(Ean13Tool::validate("40063813339A1")["error"], "EAN-13 must contain only digits");
}

TEST(Ean13Tool, Generate) {
    Ean13Tool tool(seeded());
    auto out = tool.execute({{"operation", "generate"}, {"count", 5}});
    ASSERT_EQ(out.size(), 5u);
    for (const auto& code : out) {
        EXPECT_EQ(Ean13Tool::validate(code.get<std::string>())["valid"], true) << code;
    }
}

// ---- ISBN ----

TEST(IsbnTool, Isbn10CheckDigit) {
    EXPECT_EQ(IsbnTool::isbn10_check_digit("030640615"), '2');
    EXPECT_EQ(IsbnTool::isbn10_check_digit("080442957"), 'X');
}

TEST(IsbnTool, AutoDetectsFormat) {
    auto r10 = IsbnTool::validate("0-306-40615-2", "auto");
    EXPECT_EQ(r10["valid"], true);
    EXPECT_EQ(r10["format"], "ISBN10");
    EXPECT_EQ(r10["isbn"], "0306406152");

    auto r13 = IsbnTool::validate("978-0-306-40615-7", "auto");
    EXPECT_EQ(r13["valid"], true);
    EXPECT_EQ(r13["format"], "ISBN13");

    EXPECT_EQ(IsbnTool::validate("080442957X", "auto")["valid"], true);
}

TEST(IsbnTool, InvalidInputs) {
    EXPECT_EQ(IsbnTool::validate("0-306-40615-3", "auto")["error"],
              "invalid check digit. Expected 2, got 3");
    EXPECT_EQ(IsbnTool::validate("12345", "auto")["error"],
              "unable to auto-detect ISBN format (must be 10 or 13 digits)");
    EXPECT_EQ(IsbnTool::validate("9780306406157", "isbn10")["error"],
              "ISBN-10 must be exactly 10 characters");
    EXPECT_EQ(IsbnTool::validate("03064061Z2", "isbn10")["error"],
              "ISBN-10 must contain only digits (except last character)");
}

TEST(IsbnTool, GenerateBothFormats) {
    IsbnTool tool(seeded());
    auto isbn13 = tool.execute({{"operation", "generate"}, {"count", 10}});
    for (const auto& v : isbn13) {
        std::string s = v.get<std::string>();
        EXPECT_EQ(s.size(), 13u);
        EXPECT_TRUE(s.rfind("978", 0) == 0 || s.rfind("979", 0) == 0) << s;
        EXPECT_EQ(IsbnTool::validate(s, "isbn13")["valid"], true) << s;
    }
    auto isbn10 = tool.execute({{"operation", "generate"}, {"format", "isbn10"}, {"count", 10}});
    for (const auto& v : isbn10) {
        EXPECT_EQ(IsbnTool::validate(v.get<std::string>(), "isbn10")["valid"], true) << v;
    }
}

// ---- Credit cards ----

TEST(CreditCardTool, Luhn) {
    EXPECT_TRUE(CreditCardTool::luhn_valid("4532015112830366"));
    EXPECT_FALSE(CreditCardTool::luhn_valid("4532015112830367"));
    EXPECT_EQ(CreditCardTool::luhn_check_digit("453201511283036"), 6);
}

TEST(CreditCardTool, DetectType) {
    EXPECT_EQ(CreditCardTool::detect_type("4532015112830366"), "visa");
    EXPECT_EQ(CreditCardTool::detect_type("5555555555554444"), "mastercard");
    EXPECT_EQ(CreditCardTool::detect_type("2221000000000009"), "mastercard");
    EXPECT_EQ(CreditCardTool::detect_type("378282246310005"), "amex");
    EXPECT_EQ(CreditCardTool::detect_type("6011111111111117"), "discover");
    EXPECT_EQ(CreditCardTool::detect_type("30569309025904"), "diners");
    EXPECT_EQ(CreditCardTool::detect_type("3530111333300000"), "jcb");
    EXPECT_EQ(CreditCardTool::detect_type("9999999999999995"), "unknown");
}

TEST(CreditCardTool, Validate) {
    auto ok = CreditCardTool::validate("4532 0151 1283 0366");
    EXPECT_EQ(ok["valid"], true);
    EXPECT_EQ(ok["card"], "4532015112830366");
    EXPECT_EQ(ok["type"], "visa");

    EXPECT_EQ(CreditCardTool::validate("4532015112830367")["error"], "invalid check digit");
    EXPECT_EQ(CreditCardTool::validate("4532-abcd")["error"],
              "credit card number must contain only digits");
    EXPECT_EQ(CreditCardTool::validate("4111")["error"],
              "credit card number must be between 13 and 19 digits");
}

TEST(CreditCardTool, GenerateByType) {
    CreditCardTool tool(seeded());
    for (const char* type : {"visa", "mastercard", "amex", "discover", "diners", "jcb"}) {
        auto out = tool.execute({{"operation", "generate"}, {"card-type", type}, {"count", 3}});
        ASSERT_EQ(out.size(), 3u);
        for (const auto& v : out) {
            auto r = CreditCardTool::validate(v.get<std::string>());
            EXPECT_EQ(r["valid"], true) << v;
            EXPECT_EQ(r["type"], type) << v;
        }
    }
}

TEST(CreditCardTool, UnknownTypeRejectedBySchema) {
    auto registry = std::make_shared<ToolRegistry>();
    registry->register_tool(std::make_shared<CreditCardTool>(seeded()));
    Dispatcher d(registry);
    auto r = d.call("creditcard", {{"operation", "generate"}, {"card-type", "unionpay"}});
    ASSERT_TRUE(std::holds_alternative<JsonRpcError>(r));
    EXPECT_EQ(std::get<JsonRpcError>(r).code, error::InvalidParams);
}
