#include <gtest/gtest.h>
#include <core/wait.hpp>
#include <core/errors.hpp>
#include "fakes.hpp"

using std::chrono::seconds;

TEST(WaitContext, SleepsPollInterval) {
    FakeClock clock;
    WaitOptions opts{seconds(60), seconds(5), nullptr, nullptr};
    WaitContext ctx(clock, opts);

    EXPECT_TRUE(ctx.suspend());
    ASSERT_EQ(clock.sleeps.size(), 1u);
    EXPECT_EQ(clock.sleeps[0], seconds(5));
    EXPECT_EQ(ctx.elapsed_secs(), 5);
    EXPECT_EQ(ctx.remaining_secs(), 55);
}

TEST(WaitContext, LastSleepClampedToDeadline) {
    FakeClock clock;
    WaitOptions opts{seconds(12), seconds(5), nullptr, nullptr};
    WaitContext ctx(clock, opts);

    ctx.suspend();
    ctx.suspend();
    ctx.suspend();
    ASSERT_EQ(clock.sleeps.size(), 3u);
    EXPECT_EQ(clock.sleeps[2], seconds(2));
    EXPECT_TRUE(ctx.expired());
}

TEST(WaitContext, NoSleepPastDeadline) {
    FakeClock clock;
    WaitOptions opts{seconds(5), seconds(5), nullptr, nullptr};
    WaitContext ctx(clock, opts);
    clock.advance(seconds(10));

    EXPECT_TRUE(ctx.suspend());
    EXPECT_TRUE(clock.sleeps.empty());
    EXPECT_EQ(ctx.remaining_secs(), 0);
}

TEST(WaitContext, WallClockStepDoesNotMoveDeadline) {
    FakeClock clock;
    WaitOptions opts{seconds(60), seconds(5), nullptr, nullptr};
    WaitContext ctx(clock, opts);

    clock.step_wall_clock(seconds(3600));
    EXPECT_FALSE(ctx.expired());
    EXPECT_EQ(ctx.remaining_secs(), 60);

    clock.step_wall_clock(seconds(-7200));
    ctx.suspend();
    EXPECT_EQ(ctx.elapsed_secs(), 5);
    EXPECT_EQ(ctx.remaining_secs(), 55);
}

TEST(WaitContext, NonPositivePollIntervalRejected) {
    FakeClock clock;
    WaitOptions zero{seconds(60), seconds(0), nullptr, nullptr};
    WaitOptions negative{seconds(60), seconds(-5), nullptr, nullptr};
    EXPECT_THROW(WaitContext(clock, zero), ConfigurationError);
    EXPECT_THROW(WaitContext(clock, negative), ConfigurationError);
    EXPECT_TRUE(clock.sleeps.empty());
}

TEST(WaitContext, CancelledTokenStopsSuspend) {
    FakeClock clock;
    CancelToken token;
    token.cancel();
    WaitOptions opts{seconds(60), seconds(5), &token, nullptr};
    WaitContext ctx(clock, opts);

    EXPECT_TRUE(ctx.cancelled());
    EXPECT_FALSE(ctx.suspend());
    EXPECT_TRUE(clock.sleeps.empty());
}

TEST(WaitContext, ReportForwardsToCallback) {
    FakeClock clock;
    std::vector<std::string> msgs;
    WaitOptions opts;
    opts.cb = [&](const std::string& m) { msgs.push_back(m); };
    WaitContext ctx(clock, opts);

    ctx.report("hello");
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "hello");
}

TEST(CancelToken, WaitForReturnsImmediatelyWhenCancelled) {
    CancelToken token;
    EXPECT_FALSE(token.wait_for(std::chrono::milliseconds(1)));
    token.cancel();
    EXPECT_TRUE(token.wait_for(std::chrono::milliseconds(1000)));
}

TEST(SystemClock, CancelledSleepReturnsFalse) {
    SystemClock clock;
    CancelToken token;
    token.cancel();
    EXPECT_FALSE(clock.sleep_for(seconds(30), &token));
}
