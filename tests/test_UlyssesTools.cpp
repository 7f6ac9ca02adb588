#include <gtest/gtest.h>
#include <set>
#include <unistd.h>
#include "bridge/CommandExecutor.h"
#include "tools/ToolRegistry.h"
#include "tools/UlyssesTools.h"
#include "TestHelpers.h"

using namespace std::chrono_literals;

class UlyssesToolsTest : public ::testing::Test {
protected:
    TempDir tmp{"tools"};
    SecureStore store{(tmp.path / "tmp").string()};
    EventLoop loop;
    ActionRegistry actions = ActionRegistry::ulysses();
    RateLimiter limiter{actions, 10, 60000};
    FakeUrlOpener opener;
    CommandDispatcher dispatcher{"ulysses", "ulysses-mcp-callback", opener};
    CallbackCorrelator correlator{store, loop, 200ms, 10ms};
    ReceiverSupervisor supervisor{store, loop, {"/nonexistent/receiver"}, 3, 10ms};
    CommandExecutor executor{actions, limiter, dispatcher, correlator, supervisor, loop};
    ToolRegistry tools;

    void SetUp() override {
        store.writePidMarker(::getpid());
        UlyssesTools::registerAll(tools, executor, actions);
    }

    std::string textOf(const nlohmann::json& result) {
        return result["content"][0]["text"].get<std::string>();
    }

    void expectInvalid(const std::string& tool, const nlohmann::json& args) {
        try {
            tools.executeTool(tool, args);
            ADD_FAILURE() << tool << " accepted " << args.dump();
        } catch (const BridgeError& e) {
            EXPECT_EQ(e.getKind(), ErrorKind::InvalidInput) << tool;
        }
        EXPECT_TRUE(opener.urls.empty()) << tool;
    }
};

TEST_F(UlyssesToolsTest, RegistersWholeCatalog) {
    EXPECT_EQ(tools.getToolCount(), 23u);
    std::set<std::string> toolActions;
    for (const auto& def : UlyssesTools::definitions()) {
        EXPECT_TRUE(tools.hasTool(def.name));
        EXPECT_NE(actions.find(def.action), nullptr) << def.action;
        toolActions.insert(def.action);
    }
    EXPECT_EQ(toolActions.size(), actions.size());
}

TEST_F(UlyssesToolsTest, SchemasListRequiredFields) {
    auto schemas = tools.listToolSchemas();
    ASSERT_EQ(schemas.size(), 23u);
    EXPECT_EQ(schemas.front()["name"], "ulysses_new_sheet");

    const nlohmann::json* trash = nullptr;
    for (const auto& s : schemas) {
        if (s["name"] == "ulysses_trash") trash = &s;
    }
    ASSERT_NE(trash, nullptr);
    EXPECT_EQ((*trash)["inputSchema"]["type"], "object");
    EXPECT_EQ((*trash)["inputSchema"]["required"], nlohmann::json({"id", "access_token"}));

    auto openAll = tools.getTool("ulysses_open_all")->getSchema();
    EXPECT_FALSE(openAll.contains("required"));
}

TEST_F(UlyssesToolsTest, NewSheetBuildsUrlInFieldOrder) {
    auto result = tools.executeTool("ulysses_new_sheet",
                                    {{"text", "# Title"}, {"group", "/Drafts"}, {"format", "markdown"}});
    EXPECT_EQ(textOf(result), "Successfully executed new-sheet");
    ASSERT_EQ(opener.urls.size(), 1u);
    EXPECT_EQ(opener.urls[0], "ulysses://x-callback-url/new-sheet?text=%23%20Title&group=%2FDrafts&format=markdown");
}

TEST_F(UlyssesToolsTest, OptionalEmptyFieldsAreOmitted) {
    tools.executeTool("ulysses_copy", {{"id", "abc"}, {"targetGroup", ""}, {"index", nullptr}});
    ASSERT_EQ(opener.urls.size(), 1u);
    EXPECT_EQ(opener.urls[0], "ulysses://x-callback-url/copy?id=abc");
}

TEST_F(UlyssesToolsTest, AccessTokenBecomesHyphenatedParameter) {
    tools.executeTool("ulysses_trash", {{"id", "abc"}, {"access_token", "tok"}});
    ASSERT_EQ(opener.urls.size(), 1u);
    EXPECT_EQ(opener.urls[0], "ulysses://x-callback-url/trash?id=abc&access-token=tok");
}

TEST_F(UlyssesToolsTest, ValidationHappensBeforeDispatch) {
    expectInvalid("ulysses_new_sheet", nlohmann::json::object());
    expectInvalid("ulysses_new_sheet", {{"text", "   "}});
    expectInvalid("ulysses_new_sheet", {{"text", "x"}, {"format", "Markdown"}});
    expectInvalid("ulysses_new_group", {{"name", std::string(256, 'g')}});
    expectInvalid("ulysses_trash", {{"id", "abc"}});
    expectInvalid("ulysses_set_sheet_title", {{"sheet", "s"}, {"title", "t"}, {"type", "heading7"},
                                              {"access_token", "tok"}});
    expectInvalid("ulysses_authorize", {{"appname", std::string(101, 'a')}});
    expectInvalid("ulysses_insert", {{"id", "s"}, {"text", "t"}, {"position", "middle"}});
}

TEST_F(UlyssesToolsTest, LengthLimitIsInclusive) {
    EXPECT_NO_THROW(tools.executeTool("ulysses_new_group", {{"name", std::string(255, 'g')}}));
}

TEST_F(UlyssesToolsTest, ResponseToolReturnsPrettyJson) {
    opener.onOpen = [this](const std::string& url) {
        std::string id = callbackIdFromUrl(url);
        store.writeArtifact(id, {{"callbackId", id}, {"isError", false}, {"data", {{"apiVersion", "2"}}}});
    };
    auto result = tools.executeTool("ulysses_get_version", nlohmann::json::object());
    EXPECT_EQ(nlohmann::json::parse(textOf(result)), nlohmann::json({{"apiVersion", "2"}}));
    EXPECT_NE(textOf(result).find('\n'), std::string::npos);
}

TEST_F(UlyssesToolsTest, AuthorizeAppendsSecurityNote) {
    opener.onOpen = [this](const std::string& url) {
        std::string id = callbackIdFromUrl(url);
        store.writeArtifact(id, {{"callbackId", id}, {"isError", false}, {"data", {{"access-token", "abc"}}}});
    };
    auto text = textOf(tools.executeTool("ulysses_authorize", {{"appname", "Test"}}));
    EXPECT_NE(text.find("\"access-token\": \"abc\""), std::string::npos);
    EXPECT_NE(text.find(UlyssesTools::kAuthorizeSecurityNote), std::string::npos);
}

TEST_F(UlyssesToolsTest, UnknownToolThrowsOutOfRange) {
    EXPECT_FALSE(tools.hasTool("ulysses_format_disk"));
    EXPECT_EQ(tools.getTool("ulysses_format_disk"), nullptr);
    EXPECT_THROW(tools.executeTool("ulysses_format_disk", {}), std::out_of_range);
}
