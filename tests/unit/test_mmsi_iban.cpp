#include <gtest/gtest.h>
#include "mcpipboy/error.hpp"
#include "mcpipboy/tools/iban.hpp"
#include "mcpipboy/tools/mmsi.hpp"
#include <algorithm>

using namespace mcpipboy;
using namespace mcpipboy::tools;

namespace {

std::shared_ptr<RandomSource> seeded(uint64_t seed = 99) {
    return std::make_shared<Mt19937Random>(seed);
}

} // namespace

// ---- MMSI ----

TEST(MmsiTool, ValidateShipStation) {
    auto r = MmsiTool::validate("232 123 456");
    EXPECT_EQ(r["valid"], true);
    EXPECT_EQ(r["mmsi"], "232123456");
    EXPECT_EQ(r["input"], "232 123 456");
    EXPECT_EQ(r["mid"], 232);
    EXPECT_EQ(r["country_name"], "United Kingdom");
    EXPECT_EQ(r["type"], "Ship Station");
}

TEST(MmsiTool, ValidateUsStations) {
    EXPECT_EQ(MmsiTool::validate("366123456")["type"], "US Ship Station (Other)");
    EXPECT_EQ(MmsiTool::validate("366123000")["type"], "US Ship Station (International/Inmarsat)");
    EXPECT_EQ(MmsiTool::validate("366912345")["type"], "US Federal MMSI");
    EXPECT_EQ(MmsiTool::validate("368000001")["type"], "US Ship Station (Regular)");
    EXPECT_EQ(MmsiTool::validate("368000001")["country_name"], "United States");
}

TEST(MmsiTool, ValidateSpecialDevices) {
    auto sart = MmsiTool::validate("970123456");
    EXPECT_EQ(sart["type"], "AIS-SART");
    EXPECT_EQ(sart["country_name"], "Unknown (MID: 970)");
    EXPECT_EQ(MmsiTool::validate("111232001")["type"], "SAR Aircraft");
    EXPECT_EQ(MmsiTool::validate("992351000")["type"], "Navigational Aid");
    EXPECT_EQ(MmsiTool::validate("812345678")["type"], "Handheld VHF");
}

TEST(MmsiTool, InvalidInputs) {
    EXPECT_EQ(MmsiTool::validate("23212345")["error"], "MMSI number must be exactly 9 digits");
    EXPECT_EQ(MmsiTool::validate("23212345X")["error"], "MMSI number must contain only digits");
    EXPECT_EQ(MmsiTool::validate("012345678")["error"],
              "MMSI number must be between 100000000 and 999999999");
    EXPECT_EQ(MmsiTool::validate("012345678")["valid"], false);
}

TEST(MmsiTool, Classify) {
    EXPECT_EQ(MmsiTool::classify(36699999), "US Coast Guard Group Ship Station");
    EXPECT_EQ(MmsiTool::classify(2320001), "Coast Station");
    EXPECT_EQ(MmsiTool::classify(982320001), "Craft Associated with Parent Ship");
    EXPECT_EQ(MmsiTool::classify(12), "Unknown");
}

TEST(MmsiTool, StationTypesListed) {
    auto types = MmsiTool::station_types();
    EXPECT_EQ(types.size(), 18u);
    EXPECT_EQ(types.front(), "us-coast-guard-ship");
    EXPECT_EQ(types.back(), "free-form");
    EXPECT_NE(std::find(types.begin(), types.end(), "epirb-ais"), types.end());
}

TEST(MmsiTool, CountryName) {
    EXPECT_EQ(MmsiTool::country_name(211), "Germany");
    EXPECT_EQ(MmsiTool::country_name(1), "Unknown (MID: 1)");
}

TEST(MmsiTool, GenerateForCountry) {
    MmsiTool tool(seeded());
    auto out = tool.execute({{"operation", "generate"}, {"country-code", "gb"}, {"count", 25}});
    ASSERT_EQ(out.size(), 25u);
    for (const auto& v : out) {
        auto r = MmsiTool::validate(v.get<std::string>());
        ASSERT_EQ(r["valid"], true) << v;
        int mid = r["mid"].get<int>();
        EXPECT_GE(mid, 232) << v;
        EXPECT_LE(mid, 235) << v;
    }
}

TEST(MmsiTool, GenerateByType) {
    MmsiTool tool(seeded());
    struct Case { const char* type; const char* display; };
    for (const Case& c : {Case{"sar-aircraft", "SAR Aircraft"}, Case{"ais-sart", "AIS-SART"},
                          Case{"handheld-vhf", "Handheld VHF"},
                          Case{"navigational-aid", "Navigational Aid"},
                          Case{"us-ship-regular", "US Ship Station (Regular)"}}) {
        auto out = tool.execute({{"operation", "generate"}, {"type", c.type}});
        ASSERT_TRUE(out.is_string());
        EXPECT_EQ(MmsiTool::validate(out.get<std::string>())["type"], c.display) << out;
    }
}

TEST(MmsiTool, GenerateErrors) {
    MmsiTool tool(seeded());
    try {
        (void)tool.execute({{"operation", "generate"}, {"country-code", "XX"}});
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_STREQ(e.what(), "invalid country code: XX");
    }
    // the schema would reject this; the tool still refuses it on its own
    EXPECT_THROW((void)tool.execute({{"operation", "generate"}, {"type", "submarine"}}), ExecutionError);
}

TEST(MmsiTool, SchemaEnumeratesTypes) {
    MmsiTool tool(seeded());
    auto schema = tool.input_schema().to_json();
    EXPECT_EQ(schema["properties"]["type"]["enum"].size(), 18u);
    EXPECT_TRUE(tool.validate_params({{"operation", "generate"}, {"type", "submarine"}}).has_value());
}

// ---- IBAN ----

TEST(IbanTool, Mod97) {
    EXPECT_EQ(IbanTool::mod97("GB82WEST12345698765432"), 1);
    EXPECT_EQ(IbanTool::mod97("GB82WEST12345698765433"), 28);
}

TEST(IbanTool, CheckDigits) {
    EXPECT_EQ(IbanTool::check_digits("GB", "WEST12345698765432"), "82");
    EXPECT_EQ(IbanTool::check_digits("DE", "370400440532013000"), "89");
}

TEST(IbanTool, ValidateKnownGood) {
    for (const char* iban : {"GB82WEST12345698765432", "DE89370400440532013000",
                             "FR1420041010050500013M02606", "NO9386011117947"}) {
        EXPECT_EQ(IbanTool::validate(iban)["valid"], true) << iban;
    }
}

TEST(IbanTool, ValidateNormalises) {
    auto r = IbanTool::validate("gb82 west 1234 5698 7654 32");
    EXPECT_EQ(r["valid"], true);
    EXPECT_EQ(r["iban"], "GB82WEST12345698765432");
    EXPECT_EQ(r["country"], "GB");
    EXPECT_EQ(r["input"], "gb82 west 1234 5698 7654 32");
}

TEST(IbanTool, ValidateErrors) {
    EXPECT_EQ(IbanTool::validate("GB82WEST1234")["error"], "IBAN must be between 15 and 34 characters");
    EXPECT_EQ(IbanTool::validate("1282WEST12345698765432")["error"],
              "IBAN must start with 2 letters (country code)");
    EXPECT_EQ(IbanTool::validate("GB82WEST1234569876543!")["error"],
              "IBAN must contain only letters and numbers");
    EXPECT_EQ(IbanTool::validate("GB82WEST12345698765433")["error"], "invalid check digits");
}

TEST(IbanTool, GenerateForCountry) {
    IbanTool tool(seeded());
    auto out = tool.execute({{"operation", "generate"}, {"country-code", "fr"}, {"count", 10}});
    ASSERT_EQ(out.size(), 10u);
    for (const auto& v : out) {
        std::string iban = v.get<std::string>();
        EXPECT_EQ(iban.size(), 27u);
        EXPECT_EQ(iban.substr(0, 2), "FR");
        EXPECT_EQ(IbanTool::validate(iban)["valid"], true) << iban;
    }
}

TEST(IbanTool, GenerateRandomCountry) {
    IbanTool tool(seeded());
    auto out = tool.execute({{"operation", "generate"}, {"count", 30}});
    for (const auto& v : out) {
        std::string iban = v.get<std::string>();
        auto country = std::find_if(iban_countries().begin(), iban_countries().end(),
                                    [&](const IbanCountry& c) { return iban.compare(0, 2, c.code) == 0; });
        ASSERT_NE(country, iban_countries().end()) << iban;
        EXPECT_EQ(iban.size(), static_cast<size_t>(country->length));
        EXPECT_EQ(IbanTool::validate(iban)["valid"], true) << iban;
    }
}

TEST(IbanTool, UnknownCountry) {
    IbanTool tool(seeded());
    try {
        (void)tool.execute({{"operation", "generate"}, {"country-code", "US"}});
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_STREQ(e.what(),
                     "invalid country code: US. Must be a supported ISO 3166-1 alpha-2 country code");
    }
}

TEST(IbanTool, Resources) {
    IbanTool tool(seeded());
    ASSERT_EQ(tool.resources().size(), 3u);
    auto content = tool.read_resource("iban://countries");
    ASSERT_TRUE(content.text.has_value());
    auto body = nlohmann::json::parse(*content.text);
    EXPECT_EQ(body["countries"].size(), iban_countries().size());
}
