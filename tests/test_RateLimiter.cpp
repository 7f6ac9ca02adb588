#include <gtest/gtest.h>
#include "bridge/RateLimiter.h"
#include "core/BridgeError.h"

class RateLimiterTest : public ::testing::Test {
protected:
    ActionRegistry registry = ActionRegistry::ulysses();
    int64_t now = 1000000;
    RateLimiter limiter{registry, 10, 60000, [this]() { return now; }};
};

TEST_F(RateLimiterTest, NonDestructiveActionsAreNeverCounted) {
    for (int i = 0; i < 50; ++i) {
        EXPECT_NO_THROW(limiter.checkAndConsume("new-sheet"));
    }
    EXPECT_EQ(limiter.window("new-sheet"), nullptr);
}

TEST_F(RateLimiterTest, EleventhCallInWindowFails) {
    for (int i = 0; i < 10; ++i) {
        EXPECT_NO_THROW(limiter.checkAndConsume("trash")) << "call " << i + 1;
    }
    try {
        limiter.checkAndConsume("trash");
        FAIL() << "expected RateLimited";
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.getKind(), ErrorKind::RateLimited);
    }
    // rejected calls do not touch the window
    ASSERT_NE(limiter.window("trash"), nullptr);
    EXPECT_EQ(limiter.window("trash")->count, 10);
}

TEST_F(RateLimiterTest, WindowsAreKeyedPerAction) {
    for (int i = 0; i < 10; ++i) limiter.checkAndConsume("trash");
    EXPECT_NO_THROW(limiter.checkAndConsume("move"));
    EXPECT_THROW(limiter.checkAndConsume("trash"), BridgeError);
}

TEST_F(RateLimiterTest, FirstCallOpensFreshWindow) {
    limiter.checkAndConsume("remove-note");
    const auto* w = limiter.window("remove-note");
    ASSERT_NE(w, nullptr);
    EXPECT_EQ(w->count, 1);
    EXPECT_EQ(w->resetAt, now + 60000);
}

TEST_F(RateLimiterTest, CallAtResetBoundaryStartsNewWindow) {
    for (int i = 0; i < 10; ++i) limiter.checkAndConsume("trash");
    int64_t resetAt = limiter.window("trash")->resetAt;

    now = resetAt - 1;
    EXPECT_THROW(limiter.checkAndConsume("trash"), BridgeError);

    now = resetAt;
    EXPECT_NO_THROW(limiter.checkAndConsume("trash"));
    EXPECT_EQ(limiter.window("trash")->count, 1);
    EXPECT_EQ(limiter.window("trash")->resetAt, resetAt + 60000);
}

TEST_F(RateLimiterTest, CallAfterResetSucceeds) {
    for (int i = 0; i < 10; ++i) limiter.checkAndConsume("move");
    now = limiter.window("move")->resetAt + 1;
    EXPECT_NO_THROW(limiter.checkAndConsume("move"));
    EXPECT_EQ(limiter.window("move")->count, 1);
}
