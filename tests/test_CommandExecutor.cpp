#include <gtest/gtest.h>
#include <fstream>
#include <unistd.h>
#include "audit/AuditLogger.h"
#include "bridge/CommandExecutor.h"
#include "TestHelpers.h"

using namespace std::chrono_literals;

class CommandExecutorTest : public ::testing::Test {
protected:
    TempDir tmp{"executor"};
    SecureStore store{(tmp.path / "tmp").string()};
    EventLoop loop;
    ActionRegistry registry = ActionRegistry::ulysses();
    RateLimiter limiter{registry, 10, 60000};
    FakeUrlOpener opener;
    CommandDispatcher dispatcher{"ulysses", "ulysses-mcp-callback", opener};
    CallbackCorrelator correlator{store, loop, 200ms, 10ms};
    ReceiverSupervisor supervisor{store, loop, {"/nonexistent/receiver"}, 3, 10ms};
    AuditLogger audit{(tmp.path / "audit.jsonl").string()};
    CommandExecutor executor{registry, limiter, dispatcher, correlator, supervisor, loop, &audit};

    void SetUp() override {
        // this test process stands in for a running receiver
        store.writePidMarker(::getpid());
    }

    // Simulates Ulysses plus the receiver answering every dispatched request.
    void answerWith(const nlohmann::json& data, bool isError = false) {
        opener.onOpen = [this, data, isError](const std::string& url) {
            std::string id = callbackIdFromUrl(url);
            if (id.empty()) return;
            loop.setTimeout(20ms, [this, id, data, isError] {
                store.writeArtifact(id, {{"callbackId", id}, {"isError", isError}, {"data", data}});
            });
        };
    }

    ErrorKind failureKind(const std::string& action, const ParamList& params = {}) {
        try {
            executor.executeBlocking(action, params);
        } catch (const BridgeError& e) {
            return e.getKind();
        }
        ADD_FAILURE() << "expected BridgeError for " << action;
        return ErrorKind::Internal;
    }

    std::vector<nlohmann::json> auditEvents() {
        std::vector<nlohmann::json> events;
        std::ifstream in(tmp.path / "audit.jsonl");
        std::string line;
        while (std::getline(in, line)) {
            events.push_back(nlohmann::json::parse(line));
        }
        return events;
    }
};

TEST_F(CommandExecutorTest, PlainActionResolvesWithoutCorrelation) {
    auto result = executor.executeBlocking("new-sheet", {{"text", "Hello"}});

    EXPECT_EQ(result, nlohmann::json({{"message", "Successfully executed new-sheet"}}));
    ASSERT_EQ(opener.urls.size(), 1u);
    EXPECT_EQ(opener.urls[0], "ulysses://x-callback-url/new-sheet?text=Hello");
    EXPECT_EQ(opener.urls[0].find("x-success"), std::string::npos);
    EXPECT_EQ(correlator.pendingCount(), 0u);
    EXPECT_EQ(loop.activeTimers(), 0u);
}

TEST_F(CommandExecutorTest, UnknownActionFailsBeforeAnyUrl) {
    EXPECT_EQ(failureKind("format-disk"), ErrorKind::InvalidInput);
    EXPECT_TRUE(opener.urls.empty());
}

TEST_F(CommandExecutorTest, ResponseActionReturnsCallbackData) {
    nlohmann::json data = {{"apiVersion", "2"}, {"buildNumber", "54000"}};
    answerWith(data);

    auto result = executor.executeBlocking("get-version");

    EXPECT_EQ(result, data);
    ASSERT_EQ(opener.urls.size(), 1u);
    std::string id = callbackIdFromUrl(opener.urls[0]);
    EXPECT_EQ(id.rfind("get-version-", 0), 0u);
    EXPECT_FALSE(fs::exists(store.pathFor(id)));
    EXPECT_EQ(correlator.pendingCount(), 0u);
}

TEST_F(CommandExecutorTest, ExternalErrorIsPropagated) {
    answerWith({{"errorCode", "4"}, {"errorMessage", "Access denied"}}, true);
    try {
        executor.executeBlocking("read-sheet", {{"id", "abc"}, {"access-token", "t"}});
        FAIL();
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.getKind(), ErrorKind::ExternalError);
        EXPECT_STREQ(e.what(), "Access denied");
    }
}

TEST_F(CommandExecutorTest, SilentApplicationTimesOut) {
    EXPECT_EQ(failureKind("get-version"), ErrorKind::CallbackTimeout);
    EXPECT_EQ(correlator.pendingCount(), 0u);
    EXPECT_EQ(loop.activeTimers(), 0u);
}

TEST_F(CommandExecutorTest, DispatchFailureCancelsPendingWait) {
    opener.fail = true;
    EXPECT_EQ(failureKind("get-version"), ErrorKind::InvocationFailure);
    EXPECT_EQ(correlator.pendingCount(), 0u);
    EXPECT_EQ(loop.activeTimers(), 0u);
}

TEST_F(CommandExecutorTest, DispatchFailureOnPlainAction) {
    opener.fail = true;
    EXPECT_EQ(failureKind("open-all"), ErrorKind::InvocationFailure);
}

TEST_F(CommandExecutorTest, EleventhTrashIsRateLimited) {
    for (int i = 0; i < 10; ++i) {
        EXPECT_NO_THROW(executor.executeBlocking("trash", {{"id", "s" + std::to_string(i)}, {"access-token", "t"}}));
    }
    EXPECT_EQ(failureKind("trash", {{"id", "s10"}, {"access-token", "t"}}), ErrorKind::RateLimited);
    EXPECT_EQ(opener.urls.size(), 10u);
}

TEST_F(CommandExecutorTest, ReceiverStartFailureIsReported) {
    store.removePidMarker();
    EXPECT_EQ(failureKind("get-version"), ErrorKind::HelperStartFailure);
    EXPECT_TRUE(opener.urls.empty());
}

TEST_F(CommandExecutorTest, AsyncExecuteCompletesFromLoop) {
    answerWith({{"items", "[]"}});
    int calls = 0;
    nlohmann::json received;
    executor.execute(
        "get-root-items", {{"access-token", "t"}},
        [&](const nlohmann::json& r) {
            ++calls;
            received = r;
        },
        [&](const BridgeError&) { ++calls; });

    EXPECT_EQ(calls, 0);
    loop.runUntil([&] { return calls > 0; });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(received["items"], "[]");
}

TEST_F(CommandExecutorTest, AuditsDestructiveOperationsWithoutSecrets) {
    executor.executeBlocking("trash", {{"id", "sheet1"}, {"access-token", "secret-token-value"}});

    auto events = auditEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["event_type"], "destructive_operation");
    EXPECT_EQ(events[0]["action"], "trash");
    EXPECT_EQ(events[0]["success"], true);
    EXPECT_EQ(events[0]["details"]["access-token"], "<redacted>");
    EXPECT_EQ(events[0]["details"]["id"], "sheet1");
}

TEST_F(CommandExecutorTest, AuditsRateLimitViolation) {
    for (int i = 0; i < 11; ++i) {
        try {
            executor.executeBlocking("remove-note", {{"id", "s"}, {"index", "0"}, {"access-token", "t"}});
        } catch (const BridgeError&) {
        }
    }
    auto events = auditEvents();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back()["event_type"], "rate_limit_violation");
    EXPECT_EQ(events.back()["success"], false);
}

TEST_F(CommandExecutorTest, AuditsAuthorization) {
    answerWith({{"access-token", "granted"}});
    executor.executeBlocking("authorize", {{"appname", "Test Client"}});

    auto events = auditEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["event_type"], "authorization");
    EXPECT_EQ(events[0]["details"]["appname"], "Test Client");
}
