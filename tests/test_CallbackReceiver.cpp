#include <gtest/gtest.h>
#include <fstream>
#include <optional>
#include <unistd.h>
#include "core/BridgeError.h"
#include "core/ConfigManager.h"
#include "receiver/CallbackReceiver.h"
#include "TestHelpers.h"

using namespace std::chrono_literals;

class CallbackReceiverTest : public ::testing::Test {
protected:
    TempDir tmp{"receiver"};
    SecureStore store{(tmp.path / "tmp").string()};
    CallbackReceiver receiver{store, "ulysses-mcp-callback"};

    void expectRejected(const std::string& url) {
        try {
            CallbackReceiver::parse(url, "ulysses-mcp-callback");
            ADD_FAILURE() << "accepted " << url;
        } catch (const BridgeError& e) {
            EXPECT_EQ(e.getKind(), ErrorKind::InvalidInput) << url;
        }
    }
};

TEST_F(CallbackReceiverTest, ParsesSuccessCallback) {
    auto cb = CallbackReceiver::parse(
        "ulysses-mcp-callback://x-callback-url/x-success?callbackId=get-version-1-abc&apiVersion=2&buildNumber=54000",
        "ulysses-mcp-callback");
    EXPECT_EQ(cb.callbackId, "get-version-1-abc");
    EXPECT_FALSE(cb.isError);
    EXPECT_EQ(cb.data, nlohmann::json({{"apiVersion", "2"}, {"buildNumber", "54000"}}));
}

TEST_F(CallbackReceiverTest, ParsesErrorCallbackAndDecodesValues) {
    auto cb = CallbackReceiver::parse(
        "ULYSSES-MCP-CALLBACK://x-callback-url/x-error?callbackId=read-sheet-2-x&errorCode=4&errorMessage=Access%20denied%2C%20sorry",
        "ulysses-mcp-callback");
    EXPECT_TRUE(cb.isError);
    EXPECT_EQ(cb.data["errorCode"], "4");
    EXPECT_EQ(cb.data["errorMessage"], "Access denied, sorry");
    EXPECT_FALSE(cb.data.contains("callbackId"));
}

TEST_F(CallbackReceiverTest, RejectsMalformedUrls) {
    expectRejected("https://x-callback-url/x-success?callbackId=abc");
    expectRejected("ulysses-mcp-callback://elsewhere/x-success?callbackId=abc");
    expectRejected("ulysses-mcp-callback://x-callback-url/x-cancel?callbackId=abc");
    expectRejected("ulysses-mcp-callback://x-callback-url/x-success?apiVersion=2");
    expectRejected("ulysses-mcp-callback://x-callback-url/x-success?callbackId=..%2F..%2Fetc");
}

TEST_F(CallbackReceiverTest, HandleUrlWritesArtifact) {
    std::string id = receiver.handleUrl(
        "ulysses-mcp-callback://x-callback-url/x-success?callbackId=new-group-3-q&targetId=G1");
    EXPECT_EQ(id, "new-group-3-q");
    ASSERT_TRUE(store.artifactExists(id));

    auto artifact = store.readArtifact(id);
    EXPECT_EQ(artifact["callbackId"], id);
    EXPECT_EQ(artifact["isError"], false);
    EXPECT_EQ(artifact["data"]["targetId"], "G1");
}

TEST_F(CallbackReceiverTest, DaemonOwnsAndReleasesMarker) {
    EventLoop loop;
    int ticks = 0;
    bool started = receiver.runDaemon(loop, 50ms, 1h, [&] {
        if (store.readPidMarker() == std::optional<pid_t>(::getpid())) ++ticks;
        return ticks >= 2;
    });
    EXPECT_TRUE(started);
    EXPECT_GE(ticks, 2);
    EXPECT_FALSE(store.readPidMarker().has_value());
    EXPECT_EQ(loop.activeTimers(), 0u);
}

TEST_F(CallbackReceiverTest, DaemonDefersToLiveReceiver) {
    // the parent process is alive and is not us
    store.writePidMarker(::getppid());
    EventLoop loop;
    bool started = receiver.runDaemon(loop, 50ms, 1h, [] { return true; });
    EXPECT_FALSE(started);
    EXPECT_EQ(store.readPidMarker(), std::optional<pid_t>(::getppid()));
}

TEST(CallbackReceiverDesktopEntry, RegistersCallbackScheme) {
    std::ifstream in(ULYSSES_BRIDGE_DESKTOP_ENTRY);
    ASSERT_TRUE(in.is_open()) << ULYSSES_BRIDGE_DESKTOP_ENTRY;

    std::string line;
    std::string exec;
    std::string mimeType;
    while (std::getline(in, line)) {
        if (line.rfind("Exec=", 0) == 0) exec = line.substr(5);
        if (line.rfind("MimeType=", 0) == 0) mimeType = line.substr(9);
    }

    EXPECT_EQ(mimeType, "x-scheme-handler/" + Config::defaults().callback.scheme + ";");
    ASSERT_GE(exec.size(), 3u);
    EXPECT_EQ(exec.substr(exec.size() - 3), " %u");
    EXPECT_NE(exec.find("ulysses-bridge-receiver"), std::string::npos);
    EXPECT_EQ(exec.find("--daemon"), std::string::npos);
}
