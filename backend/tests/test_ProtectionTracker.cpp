#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "auth/ProtectionTracker.hpp"

using namespace std::chrono_literals;

class ProtectionTrackerTest : public ::testing::Test {
protected:
    FakeClock time;
    ProtectionTracker tracker{ 5, 30s, time.clock() };
};

TEST_F(ProtectionTrackerTest, UnknownUserIsClear) {
    auto s = tracker.checkStatus("nobody");
    EXPECT_FALSE(s.frozen);
    EXPECT_EQ(tracker.failedAttempts("nobody"), 0);
}

TEST_F(ProtectionTrackerTest, FreezesExactlyAtThreshold) {
    for (int i = 1; i < 5; ++i) {
        EXPECT_FALSE(tracker.recordFailure("alice").frozen);
        EXPECT_EQ(tracker.failedAttempts("alice"), i);
    }

    auto s = tracker.recordFailure("alice");
    EXPECT_TRUE(s.frozen);
    EXPECT_EQ(s.remaining_seconds, 30);
    EXPECT_EQ(tracker.failedAttempts("alice"), 0);
}

TEST_F(ProtectionTrackerTest, FailuresWhileFrozenAreNotCounted) {
    for (int i = 0; i < 5; ++i) tracker.recordFailure("alice");

    time.advance(10s);
    auto s = tracker.recordFailure("alice");
    EXPECT_TRUE(s.frozen);
    EXPECT_EQ(s.remaining_seconds, 20);
    EXPECT_EQ(tracker.failedAttempts("alice"), 0);

    // The freeze was not extended
    time.advance(20s);
    EXPECT_FALSE(tracker.checkStatus("alice").frozen);
}

TEST_F(ProtectionTrackerTest, RemainingSecondsRoundUp) {
    for (int i = 0; i < 5; ++i) tracker.recordFailure("alice");

    time.now += 29500ms;
    auto s = tracker.checkStatus("alice");
    EXPECT_TRUE(s.frozen);
    EXPECT_EQ(s.remaining_seconds, 1);
}

TEST_F(ProtectionTrackerTest, ExpiryIsLazyAndRestartsCount) {
    for (int i = 0; i < 5; ++i) tracker.recordFailure("alice");

    time.advance(30s);
    EXPECT_FALSE(tracker.checkStatus("alice").frozen);

    EXPECT_FALSE(tracker.recordFailure("alice").frozen);
    EXPECT_EQ(tracker.failedAttempts("alice"), 1);
}

TEST_F(ProtectionTrackerTest, FailureAfterExpiryWithoutCheckStartsAtOne) {
    for (int i = 0; i < 5; ++i) tracker.recordFailure("alice");

    time.advance(45s);
    EXPECT_FALSE(tracker.recordFailure("alice").frozen);
    EXPECT_EQ(tracker.failedAttempts("alice"), 1);
}

TEST_F(ProtectionTrackerTest, SuccessResetsCounter) {
    for (int i = 0; i < 3; ++i) tracker.recordFailure("alice");
    tracker.recordSuccess("alice");
    EXPECT_EQ(tracker.failedAttempts("alice"), 0);

    for (int i = 0; i < 4; ++i)
        EXPECT_FALSE(tracker.recordFailure("alice").frozen);

    EXPECT_TRUE(tracker.recordFailure("alice").frozen);
}

TEST_F(ProtectionTrackerTest, UsernamesAreIndependent) {
    for (int i = 0; i < 5; ++i) tracker.recordFailure("alice");
    tracker.recordFailure("bob");

    EXPECT_TRUE(tracker.checkStatus("alice").frozen);
    EXPECT_FALSE(tracker.checkStatus("bob").frozen);
    EXPECT_EQ(tracker.failedAttempts("bob"), 1);

    tracker.recordSuccess("bob");
    EXPECT_TRUE(tracker.checkStatus("alice").frozen);
}

TEST_F(ProtectionTrackerTest, UsernamesAreCaseSensitive) {
    for (int i = 0; i < 5; ++i) tracker.recordFailure("alice");
    EXPECT_FALSE(tracker.checkStatus("Alice").frozen);
}

TEST(ProtectionTrackerConfigTest, RejectsBadParameters) {
    EXPECT_THROW(ProtectionTracker(0, std::chrono::seconds(30)), std::invalid_argument);
    EXPECT_THROW(ProtectionTracker(5, std::chrono::seconds(-1)), std::invalid_argument);
}

TEST(ProtectionTrackerConfigTest, CustomThreshold) {
    FakeClock time;
    ProtectionTracker tracker(2, std::chrono::seconds(5), time.clock());

    EXPECT_FALSE(tracker.recordFailure("u").frozen);
    auto s = tracker.recordFailure("u");
    EXPECT_TRUE(s.frozen);
    EXPECT_EQ(s.remaining_seconds, 5);
}

TEST_F(ProtectionTrackerTest, EntriesAreReclaimed) {
    tracker.recordFailure("alice");
    tracker.recordFailure("ghost");
    EXPECT_EQ(tracker.trackedCount(), 2u);

    tracker.recordSuccess("alice");
    EXPECT_EQ(tracker.trackedCount(), 1u);

    for (int i = 0; i < 4; ++i) tracker.recordFailure("ghost");
    time.advance(30s);
    EXPECT_FALSE(tracker.checkStatus("ghost").frozen);
    EXPECT_EQ(tracker.trackedCount(), 0u);

    // Looking up a name never seen does not create an entry
    tracker.checkStatus("nobody");
    EXPECT_EQ(tracker.trackedCount(), 0u);
}
