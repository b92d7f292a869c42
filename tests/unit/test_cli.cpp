#include <gtest/gtest.h>
#include "mcpipboy/cli.hpp"
#include "mcpipboy/tools/echo.hpp"
#include "mcpipboy/tools/random.hpp"
#include "mcpipboy/tools/time.hpp"
#include "mcpipboy/version.hpp"
#include <sstream>

using namespace mcpipboy;

namespace {

tools::ToolDependencies fixed_deps() {
    // 2025-01-15T10:30:00Z
    auto t = std::chrono::system_clock::time_point{std::chrono::seconds{1736937000}};
    return {std::make_shared<FixedClock>(t), std::make_shared<Mt19937Random>(42)};
}

struct CliRun {
    int code;
    std::string out;
    std::string err;
};

CliRun run(const std::vector<std::string>& args) {
    std::ostringstream out, err;
    int code = run_cli(args, out, err, fixed_deps());
    return {code, out.str(), err.str()};
}

} // namespace

// ---- Global commands ----

TEST(Cli, NoArgumentsPrintsUsageToStderr) {
    auto r = run({});
    EXPECT_EQ(r.code, exit_code::Usage);
    EXPECT_TRUE(r.out.empty());
    EXPECT_NE(r.err.find("Usage:"), std::string::npos);
}

TEST(Cli, Help) {
    for (const char* flag : {"--help", "-h", "help"}) {
        auto r = run({flag});
        EXPECT_EQ(r.code, exit_code::Ok) << flag;
        EXPECT_NE(r.out.find("serve"), std::string::npos);
        EXPECT_NE(r.out.find("uuid"), std::string::npos);
    }
}

TEST(Cli, Version) {
    auto r = run({"--version"});
    EXPECT_EQ(r.code, exit_code::Ok);
    EXPECT_EQ(r.out, "mcpipboy version " + std::string(LIBRARY_VERSION) + "\n");
}

TEST(Cli, UnknownCommand) {
    auto r = run({"teleport"});
    EXPECT_EQ(r.code, exit_code::Usage);
    EXPECT_NE(r.err.find("unknown command \"teleport\""), std::string::npos);
}

TEST(Cli, ToolsListing) {
    auto r = run({"tools"});
    EXPECT_EQ(r.code, exit_code::Ok);
    EXPECT_EQ(r.out.rfind("echo", 0), 0u);
    EXPECT_NE(r.out.find("Echoes back the input message"), std::string::npos);
    EXPECT_NE(r.out.find("iban"), std::string::npos);
}

TEST(Cli, ToolsJson) {
    auto r = run({"tools", "--json"});
    ASSERT_EQ(r.code, exit_code::Ok);
    auto defs = nlohmann::json::parse(r.out);
    ASSERT_EQ(defs.size(), 11u);
    EXPECT_EQ(defs[0]["name"], "echo");
    EXPECT_TRUE(defs[0].contains("inputSchema"));
}

TEST(Cli, ServeRejectsConflictingFilters) {
    auto r = run({"serve", "--enable", "echo", "--disable", "time"});
    EXPECT_EQ(r.code, exit_code::Failure);
    EXPECT_NE(r.err.find("mutually exclusive"), std::string::npos);
}

TEST(Cli, ServeRejectsUnknownTool) {
    auto r = run({"serve", "--enable=warp"});
    EXPECT_EQ(r.code, exit_code::Failure);
    EXPECT_NE(r.err.find("invalid tool: warp"), std::string::npos);
}

TEST(Cli, ServeUnknownFlag) {
    auto r = run({"serve", "--port", "80"});
    EXPECT_EQ(r.code, exit_code::Usage);
}

// ---- Tool commands ----

TEST(Cli, EchoPrintsRawString) {
    auto r = run({"echo", "hello there"});
    EXPECT_EQ(r.code, exit_code::Ok);
    EXPECT_EQ(r.out, "hello there\n");
}

TEST(Cli, VersionTool) {
    auto r = run({"version"});
    EXPECT_EQ(r.code, exit_code::Ok);
    EXPECT_EQ(r.out, std::string(LIBRARY_VERSION) + "\n");
}

TEST(Cli, ValidationResultPrintedAsJson) {
    auto r = run({"imo", "9074729"});
    ASSERT_EQ(r.code, exit_code::Ok);
    auto j = nlohmann::json::parse(r.out);
    EXPECT_EQ(j["valid"], true);
}

TEST(Cli, TimeWithFlags) {
    auto r = run({"time", "--format", "unix", "--timezone=UTC"});
    EXPECT_EQ(r.code, exit_code::Ok);
    EXPECT_EQ(r.out, "1736937000\n");
}

TEST(Cli, GenerateCount) {
    auto r = run({"uuid", "--count", "3"});
    ASSERT_EQ(r.code, exit_code::Ok);
    auto j = nlohmann::json::parse(r.out);
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j.size(), 3u);
}

TEST(Cli, ToolHelp) {
    auto r = run({"random", "--help"});
    EXPECT_EQ(r.code, exit_code::Ok);
    EXPECT_NE(r.out.find("--precision"), std::string::npos);
}

TEST(Cli, MissingRequiredArgument) {
    auto r = run({"echo"});
    EXPECT_EQ(r.code, exit_code::Failure);
    EXPECT_EQ(r.err.rfind("Error: Invalid params: missing required parameter: message", 0), 0u);
}

TEST(Cli, ExecutionErrorExitsWithFailure) {
    auto r = run({"time", "--timezone", "Mars/Olympus"});
    EXPECT_EQ(r.code, exit_code::Failure);
    EXPECT_EQ(r.err.rfind("Error: invalid timezone: Mars/Olympus", 0), 0u);
}

TEST(Cli, BadIntegerFlag) {
    auto r = run({"random", "--count", "many"});
    EXPECT_EQ(r.code, exit_code::Usage);
    EXPECT_NE(r.err.find("invalid value for --count: 'many' is not an integer"), std::string::npos);
}

TEST(Cli, UnknownToolFlag) {
    auto r = run({"echo", "hi", "--loud"});
    EXPECT_EQ(r.code, exit_code::Usage);
    EXPECT_NE(r.err.find("unknown flag for echo: --loud"), std::string::npos);
}

// ---- Argument conversion ----

TEST(ParseToolArguments, PositionalFillsMessageOrInput) {
    tools::EchoTool echo;
    EXPECT_EQ(parse_tool_arguments(echo, {"hi"}), (nlohmann::json{{"message", "hi"}}));

    tools::TimeTool time(std::make_shared<SystemClock>());
    EXPECT_EQ(parse_tool_arguments(time, {"tomorrow"}), (nlohmann::json{{"input", "tomorrow"}}));
}

TEST(ParseToolArguments, TypedValues) {
    tools::RandomTool random(std::make_shared<Mt19937Random>(1));
    auto j = parse_tool_arguments(random, {"--type", "float", "--min=0.5", "--count", "4"});
    EXPECT_EQ(j["type"], "float");
    EXPECT_DOUBLE_EQ(j["min"].get<double>(), 0.5);
    EXPECT_TRUE(j["count"].is_number_integer());
    EXPECT_EQ(j["count"], 4);
}

TEST(ParseToolArguments, SecondPositionalRejected) {
    tools::EchoTool echo;
    EXPECT_THROW((void)parse_tool_arguments(echo, {"a", "b"}), UsageError);
}

TEST(ParseToolArguments, MissingValue) {
    tools::RandomTool random(std::make_shared<Mt19937Random>(1));
    EXPECT_THROW((void)parse_tool_arguments(random, {"--count"}), UsageError);
}
