#include <gtest/gtest.h>

#include "core/day_metrics.h"
#include "test_support.h"

namespace {

constexpr int kDailyMax = 11 * 60;
constexpr int kNightMax = 450;

core::DayComputation compute(std::optional<std::time_t> in, std::optional<std::time_t> out,
                             int planned, int brk, bool enforce = false, bool night = false) {
    return core::calculate_day_metrics(in, out, planned, brk, kDailyMax, kNightMax, enforce, night);
}

} // namespace

TEST(DayMetricsTest, NineHourSpanWithHourBreakMatchesPlan) {
    auto result = compute(test::utc(2026, 2, 1, 9, 0), test::utc(2026, 2, 1, 18, 0), 540, 60);
    EXPECT_EQ(result.status, core::DayStatus::Ok);
    EXPECT_EQ(result.gross_minutes, 540);
    EXPECT_EQ(result.worked_minutes_net, 480);
    EXPECT_EQ(result.overtime_minutes, 0);
}

TEST(DayMetricsTest, OvertimeBeyondPlannedMinutes) {
    auto result = compute(test::utc(2026, 2, 1, 8, 0), test::utc(2026, 2, 1, 19, 0), 540, 60);
    EXPECT_EQ(result.status, core::DayStatus::Ok);
    EXPECT_EQ(result.worked_minutes_net, 600);
    EXPECT_EQ(result.overtime_minutes, 60);
}

TEST(DayMetricsTest, ShortSpanClampsToZero) {
    auto result = compute(test::utc(2026, 2, 1, 9, 0), test::utc(2026, 2, 1, 9, 30), 540, 60);
    EXPECT_EQ(result.status, core::DayStatus::Ok);
    EXPECT_EQ(result.worked_minutes_net, 0);
    EXPECT_EQ(result.overtime_minutes, 0);
}

TEST(DayMetricsTest, OutBeforeInGivesZeroGross) {
    auto result = compute(test::utc(2026, 2, 1, 18, 0), test::utc(2026, 2, 1, 9, 0), 540, 60);
    EXPECT_EQ(result.status, core::DayStatus::Ok);
    EXPECT_EQ(result.gross_minutes, 0);
    EXPECT_EQ(result.worked_minutes_net, 0);
}

TEST(DayMetricsTest, MissingOutIsIncompleteWithZeroMinutes) {
    auto result = compute(test::utc(2026, 2, 1, 9, 0), std::nullopt, 540, 60, true, true);
    EXPECT_EQ(result.status, core::DayStatus::Incomplete);
    EXPECT_EQ(result.gross_minutes, 0);
    EXPECT_EQ(result.worked_minutes_net, 0);
    EXPECT_EQ(result.overtime_minutes, 0);
    EXPECT_EQ(result.effective_break_minutes, 60);
    EXPECT_EQ(result.legal_min_break_minutes, 0);
    EXPECT_FALSE(result.min_break_not_met);
    EXPECT_FALSE(result.daily_max_exceeded);
    EXPECT_FALSE(result.night_work_exceeded);
}

TEST(DayMetricsTest, MissingInIsIncomplete) {
    auto result = compute(std::nullopt, test::utc(2026, 2, 1, 18, 0), 540, -10);
    EXPECT_EQ(result.status, core::DayStatus::Incomplete);
    EXPECT_EQ(result.effective_break_minutes, 0);
}

TEST(DayMetricsTest, MinimumBreakEnforcedForEightHours) {
    auto result = compute(test::utc(2026, 2, 1, 9, 0), test::utc(2026, 2, 1, 17, 0), 540, 30, true);
    EXPECT_EQ(result.status, core::DayStatus::Ok);
    EXPECT_EQ(result.gross_minutes, 480);
    EXPECT_EQ(result.legal_min_break_minutes, 60);
    EXPECT_EQ(result.effective_break_minutes, 60);
    EXPECT_TRUE(result.min_break_not_met);
    EXPECT_EQ(result.worked_minutes_net, 420);
}

TEST(DayMetricsTest, MinimumBreakIgnoredWhenNotEnforced) {
    auto result = compute(test::utc(2026, 2, 7, 6, 0), test::utc(2026, 2, 7, 11, 0), 540, 0);
    EXPECT_EQ(result.worked_minutes_net, 300);
    EXPECT_EQ(result.effective_break_minutes, 0);
    EXPECT_FALSE(result.min_break_not_met);
}

TEST(DayMetricsTest, LegalBreakBuckets) {
    EXPECT_EQ(core::legal_min_break_minutes(0), 0);
    EXPECT_EQ(core::legal_min_break_minutes(1), 15);
    EXPECT_EQ(core::legal_min_break_minutes(240), 15);
    EXPECT_EQ(core::legal_min_break_minutes(241), 30);
    EXPECT_EQ(core::legal_min_break_minutes(450), 30);
    EXPECT_EQ(core::legal_min_break_minutes(451), 60);
}

TEST(DayMetricsTest, DailyMaxComparesGrossMinutes) {
    auto at_limit = compute(test::utc(2026, 2, 1, 6, 0), test::utc(2026, 2, 1, 17, 0), 540, 60);
    EXPECT_FALSE(at_limit.daily_max_exceeded);

    auto over = compute(test::utc(2026, 2, 1, 6, 0), test::utc(2026, 2, 1, 17, 1), 540, 60);
    EXPECT_TRUE(over.daily_max_exceeded);
}

TEST(DayMetricsTest, NightWorkLimitOnlyForNightShift) {
    const std::time_t in = test::utc(2026, 2, 1, 20, 0);
    const std::time_t out = test::utc(2026, 2, 2, 4, 20);   // 500 分钟

    EXPECT_TRUE(compute(in, out, 450, 30, false, true).night_work_exceeded);
    EXPECT_FALSE(compute(in, out, 450, 30, false, false).night_work_exceeded);
}
