#include <gtest/gtest.h>
#include "mcpipboy/server.hpp"
#include "mcpipboy/error.hpp"
#include "mcpipboy/tools/builtin_tools.hpp"
#include "mcpipboy/version.hpp"

using namespace mcpipboy;

namespace {

std::shared_ptr<const ToolRegistry> builtin_registry(ToolFilter filter = {}) {
    auto registry = std::make_shared<ToolRegistry>(std::move(filter));
    tools::ToolDependencies deps{
        std::make_shared<FixedClock>(std::chrono::system_clock::time_point{}),
        std::make_shared<Mt19937Random>(7)};
    tools::register_builtin_tools(*registry, deps);
    return registry;
}

class ServerTest : public ::testing::Test {
protected:
    ServerTest() : server_(McpServer::Options{}, builtin_registry()) {}

    /// Feed one line and parse the reply; fails the test when none comes back.
    nlohmann::json call(const std::string& line) {
        auto reply = server_.handle_line(line);
        EXPECT_TRUE(reply.has_value()) << "no reply for " << line;
        if (!reply) return nullptr;
        return nlohmann::json::parse(*reply);
    }

    nlohmann::json call_tool(const nlohmann::json& name, const nlohmann::json& arguments) {
        nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                              {"params", {{"name", name}, {"arguments", arguments}}}};
        return call(req.dump());
    }

    /// The {"result": ...} object carried in a successful tools/call reply.
    static nlohmann::json tool_payload(const nlohmann::json& reply) {
        return nlohmann::json::parse(reply["result"]["content"][0]["text"].get<std::string>());
    }

    McpServer server_;
};

} // namespace

TEST_F(ServerTest, Initialize) {
    auto j = call(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18","capabilities":{},"clientInfo":{"name":"t","version":"1"}}})");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["result"]["protocolVersion"], std::string(PROTOCOL_VERSION));
    EXPECT_EQ(j["result"]["serverInfo"]["name"], "mcpipboy");
    EXPECT_EQ(j["result"]["serverInfo"]["version"], std::string(LIBRARY_VERSION));
    EXPECT_TRUE(j["result"]["capabilities"].contains("tools"));
    EXPECT_TRUE(j["result"]["capabilities"].contains("resources"));
    EXPECT_EQ(server_.session().state(), SessionState::Initialized);
    ASSERT_TRUE(server_.session().client_info().has_value());
    EXPECT_EQ(server_.session().client_info()->name, "t");
}

TEST_F(ServerTest, InitializedNotificationHasNoReply) {
    (void)call(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    EXPECT_FALSE(server_.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    EXPECT_EQ(server_.session().state(), SessionState::Serving);
}

TEST_F(ServerTest, RequestBeforeInitializeIsServed) {
    auto j = call(R"({"jsonrpc":"2.0","id":"a","method":"tools/list"})");
    EXPECT_EQ(j["id"], "a");
    EXPECT_TRUE(j.contains("result"));
    EXPECT_EQ(server_.session().state(), SessionState::Serving);
}

TEST_F(ServerTest, Ping) {
    auto j = call(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
    EXPECT_EQ(j["result"], nlohmann::json::object());
}

TEST_F(ServerTest, ToolsListInRegistrationOrder) {
    auto j = call(R"({"jsonrpc":"2.0","id":3,"method":"tools/list","params":{}})");
    const auto& tools = j["result"]["tools"];
    ASSERT_EQ(tools.size(), 11u);
    EXPECT_EQ(tools[0]["name"], "echo");
    EXPECT_EQ(tools[10]["name"], "iban");
    for (const auto& t : tools) {
        EXPECT_TRUE(t.contains("description"));
        EXPECT_EQ(t["inputSchema"]["type"], "object");
        EXPECT_FALSE(t.contains("outputSchema"));
    }
}

TEST_F(ServerTest, ToolsListHonoursFilter) {
    McpServer filtered(McpServer::Options{}, builtin_registry(ToolFilter::allow_only({"echo"})));
    auto reply = filtered.handle_line(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    ASSERT_TRUE(reply.has_value());
    auto j = nlohmann::json::parse(*reply);
    ASSERT_EQ(j["result"]["tools"].size(), 1u);
    EXPECT_EQ(j["result"]["tools"][0]["name"], "echo");
}

TEST_F(ServerTest, CallEcho) {
    auto j = call_tool("echo", {{"message", "hello world"}});
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["result"]["content"][0]["type"], "text");
    EXPECT_EQ(tool_payload(j)["result"], "hello world");
}

TEST_F(ServerTest, CallVersion) {
    auto j = call_tool("version", nlohmann::json::object());
    EXPECT_EQ(tool_payload(j)["result"], std::string(LIBRARY_VERSION));
}

TEST_F(ServerTest, CallUnknownTool) {
    auto j = call_tool("teleport", nlohmann::json::object());
    EXPECT_EQ(j["error"]["code"], error::MethodNotFound);
    EXPECT_EQ(j["error"]["message"], "Tool not found: teleport");
}

TEST_F(ServerTest, CallWithInvalidParams) {
    auto j = call_tool("echo", nlohmann::json::object());
    EXPECT_EQ(j["error"]["code"], error::InvalidParams);
}

TEST_F(ServerTest, CallWithExecutionError) {
    auto j = call_tool("time", {{"timezone", "Not/AZone"}});
    EXPECT_EQ(j["error"]["code"], error::ToolExecutionError);
    EXPECT_EQ(j["error"]["message"], "invalid timezone: Not/AZone");
}

TEST_F(ServerTest, CallWithoutName) {
    auto j = call(R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"arguments":{}}})");
    EXPECT_EQ(j["id"], 9);
    EXPECT_EQ(j["error"]["code"], error::InvalidParams);
}

TEST_F(ServerTest, CallWithNonObjectArguments) {
    auto j = call(R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"echo","arguments":"hi"}})");
    EXPECT_EQ(j["error"]["code"], error::InvalidParams);
}

TEST_F(ServerTest, UnknownMethod) {
    auto j = call(R"({"jsonrpc":"2.0","id":4,"method":"prompts/list"})");
    EXPECT_EQ(j["error"]["code"], error::MethodNotFound);
    EXPECT_EQ(j["error"]["message"], "Method not found: prompts/list");
}

TEST_F(ServerTest, UnknownNotificationIgnored) {
    EXPECT_FALSE(server_.handle_line(R"({"jsonrpc":"2.0","method":"notifications/cancelled"})").has_value());
}

TEST_F(ServerTest, ResponseIsIgnored) {
    EXPECT_FALSE(server_.handle_line(R"({"jsonrpc":"2.0","id":1,"result":{}})").has_value());
}

TEST_F(ServerTest, IdTypeEchoed) {
    auto j = call(R"({"jsonrpc":"2.0","id":"req-17","method":"ping"})");
    EXPECT_EQ(j["id"], "req-17");
    j = call(R"({"jsonrpc":"2.0","id":0,"method":"ping"})");
    EXPECT_EQ(j["id"], 0);
}

TEST_F(ServerTest, UnparsableLineSkipped) {
    EXPECT_FALSE(server_.handle_line("this is not json").has_value());
    EXPECT_FALSE(server_.handle_line(R"({"jsonrpc":"2.0","id":1,)").has_value());
}

TEST_F(ServerTest, InvalidEnvelopeAnswered) {
    auto j = call(R"({"jsonrpc":"1.0","id":5,"method":"ping"})");
    EXPECT_EQ(j["id"], 5);
    EXPECT_EQ(j["error"]["code"], error::InvalidRequest);
}

TEST_F(ServerTest, NonObjectMessageAnsweredWithNullId) {
    auto j = call("[1,2]");
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["code"], error::InvalidRequest);

    j = call("42");
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["code"], error::InvalidRequest);
}

TEST_F(ServerTest, ResourcesList) {
    auto j = call(R"({"jsonrpc":"2.0","id":6,"method":"resources/list"})");
    const auto& resources = j["result"]["resources"];
    ASSERT_FALSE(resources.empty());
    bool found = false;
    for (const auto& r : resources) {
        EXPECT_EQ(r["mimeType"], "application/json");
        if (r["uri"] == "imo://algorithm") found = true;
    }
    EXPECT_TRUE(found);
}

TEST_F(ServerTest, ResourcesRead) {
    auto j = call(R"({"jsonrpc":"2.0","id":7,"method":"resources/read","params":{"uri":"uuid://namespaces"}})");
    const auto& contents = j["result"]["contents"];
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(contents[0]["uri"], "uuid://namespaces");
    auto body = nlohmann::json::parse(contents[0]["text"].get<std::string>());
    ASSERT_TRUE(body.is_array());
    EXPECT_EQ(body[0]["name"], "DNS");
}

TEST_F(ServerTest, ResourcesReadUnknown) {
    auto j = call(R"({"jsonrpc":"2.0","id":8,"method":"resources/read","params":{"uri":"nope://x"}})");
    EXPECT_EQ(j["error"]["code"], error::ResourceNotFound);
    EXPECT_EQ(j["error"]["data"]["uri"], "nope://x");
}

TEST_F(ServerTest, NotRunningWithoutTransport) {
    EXPECT_FALSE(server_.is_running());
    server_.shutdown();
}
