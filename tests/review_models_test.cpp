#include "source/review_models.hpp"

#include <gtest/gtest.h>

using namespace rev::source;
using namespace std::chrono;

TEST(FormatAge, PicksTheLargestUnit)
{
    auto now = system_clock::now();
    EXPECT_EQ(FormatAge(now, now), "just now");
    EXPECT_EQ(FormatAge(now - minutes(1), now), "1 minute ago");
    EXPECT_EQ(FormatAge(now - hours(5), now), "5 hours ago");
    EXPECT_EQ(FormatAge(now - hours(24 * 3), now), "3 days ago");
    EXPECT_EQ(FormatAge(now + hours(1), now), "just now");
}

TEST(ParseTimestamp, ReadsIsoUtc)
{
    auto ts = ParseTimestamp("1970-01-02T00:00:00Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(duration_cast<seconds>(ts->time_since_epoch()).count(), 86400);
    EXPECT_FALSE(ParseTimestamp("yesterday").has_value());
}

TEST(CurrentStateOf, ClassifiesChecks)
{
    EXPECT_EQ(CurrentStateOf(CheckRun{"1", "build", "completed", "success"}), CurrentState::Success);
    EXPECT_EQ(CurrentStateOf(CheckRun{"2", "build", "in progress", "unknown"}), CurrentState::Pending);
    EXPECT_EQ(CurrentStateOf(CheckRun{"3", "build", "completed", "timed out"}), CurrentState::Failure);
    EXPECT_EQ(CurrentStateOf(CheckRun{"4", "build", "completed", "stale"}), CurrentState::Expired);
    EXPECT_EQ(CurrentStateOf(StatusContext{"5", "error", std::nullopt, "ci"}), CurrentState::Failure);
    EXPECT_EQ(CurrentStateOf(StatusContext{"6", "expected", std::nullopt, "ci"}), CurrentState::Pending);
}
