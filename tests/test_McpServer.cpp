#include <gtest/gtest.h>
#include <sstream>
#include <unistd.h>
#include "bridge/CommandExecutor.h"
#include "mcp/McpServer.h"
#include "tools/ToolRegistry.h"
#include "tools/UlyssesTools.h"
#include "TestHelpers.h"

using namespace std::chrono_literals;

class McpServerTest : public ::testing::Test {
protected:
    TempDir tmp{"mcp"};
    SecureStore store{(tmp.path / "tmp").string()};
    EventLoop loop;
    ActionRegistry actions = ActionRegistry::ulysses();
    RateLimiter limiter{actions, 10, 60000};
    FakeUrlOpener opener;
    CommandDispatcher dispatcher{"ulysses", "ulysses-mcp-callback", opener};
    CallbackCorrelator correlator{store, loop, 100ms, 10ms};
    ReceiverSupervisor supervisor{store, loop, {"/nonexistent/receiver"}, 3, 10ms};
    CommandExecutor executor{actions, limiter, dispatcher, correlator, supervisor, loop};
    ToolRegistry tools;
    McpServer server{tools, store.getRoot().string()};

    void SetUp() override {
        store.writePidMarker(::getpid());
        UlyssesTools::registerAll(tools, executor, actions);
    }

    nlohmann::json call(int id, const std::string& tool, const nlohmann::json& args) {
        auto response = server.handleMessage({{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
                                              {"params", {{"name", tool}, {"arguments", args}}}});
        EXPECT_TRUE(response.has_value());
        return response.value_or(nlohmann::json());
    }
};

TEST_F(McpServerTest, InitializeAdvertisesTools) {
    auto response = server.handleLine(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","clientInfo":{"name":"test"}}})");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["id"], 1);
    EXPECT_EQ((*response)["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ((*response)["result"]["serverInfo"]["name"], "ulysses-bridge");
    EXPECT_TRUE((*response)["result"]["capabilities"].contains("tools"));
}

TEST_F(McpServerTest, NotificationsGetNoResponse) {
    EXPECT_FALSE(server.handleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    EXPECT_FALSE(server.handleLine("   ").has_value());
}

TEST_F(McpServerTest, ToolsListReturnsCatalog) {
    auto response = server.handleMessage({{"jsonrpc", "2.0"}, {"id", "a"}, {"method", "tools/list"}});
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["id"], "a");
    EXPECT_EQ((*response)["result"]["tools"].size(), 23u);
}

TEST_F(McpServerTest, PingAnswersEmptyResult) {
    auto response = server.handleMessage({{"jsonrpc", "2.0"}, {"id", 7}, {"method", "ping"}});
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["result"], nlohmann::json::object());
}

TEST_F(McpServerTest, UnknownMethodIsMethodNotFound) {
    auto response = server.handleMessage({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "resources/list"}});
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["error"]["code"], JsonRpcError::MethodNotFound);
}

TEST_F(McpServerTest, GarbageLineIsParseError) {
    auto response = server.handleLine("{not json");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["error"]["code"], JsonRpcError::ParseError);
    EXPECT_TRUE((*response)["id"].is_null());
}

TEST_F(McpServerTest, UnknownToolIsMethodNotFound) {
    auto response = call(3, "ulysses_format_disk", nlohmann::json::object());
    EXPECT_EQ(response["error"]["code"], JsonRpcError::MethodNotFound);
}

TEST_F(McpServerTest, InvalidArgumentsAreInvalidParams) {
    auto response = call(4, "ulysses_new_sheet", {{"text", ""}});
    EXPECT_EQ(response["error"]["code"], JsonRpcError::InvalidParams);
    EXPECT_NE(response["error"]["message"].get<std::string>().find("text"), std::string::npos);
    EXPECT_TRUE(opener.urls.empty());
}

TEST_F(McpServerTest, RateLimitIsInvalidRequest) {
    for (int i = 0; i < 10; ++i) {
        auto ok = call(10 + i, "ulysses_trash", {{"id", "s"}, {"access_token", "t"}});
        EXPECT_TRUE(ok.contains("result"));
    }
    auto response = call(99, "ulysses_trash", {{"id", "s"}, {"access_token", "t"}});
    EXPECT_EQ(response["error"]["code"], JsonRpcError::InvalidRequest);
}

TEST_F(McpServerTest, TimeoutIsInternalError) {
    auto response = call(5, "ulysses_get_version", nlohmann::json::object());
    EXPECT_EQ(response["error"]["code"], JsonRpcError::InternalError);
    EXPECT_NE(response["error"]["message"].get<std::string>().find("Callback timeout"), std::string::npos);
}

TEST_F(McpServerTest, SuccessfulCallReturnsTextContent) {
    auto response = call(6, "ulysses_open_all", nlohmann::json::object());
    ASSERT_TRUE(response.contains("result"));
    EXPECT_EQ(response["result"]["content"][0]["type"], "text");
    EXPECT_EQ(response["result"]["content"][0]["text"], "Successfully executed open-all");
}

TEST_F(McpServerTest, RunProcessesEachLine) {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
    std::ostringstream out;
    server.run(in, out);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<nlohmann::json> responses;
    while (std::getline(lines, line)) {
        responses.push_back(nlohmann::json::parse(line));
    }
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[1]["id"], 2);
}
