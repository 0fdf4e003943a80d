#include <gtest/gtest.h>

#include "core/day_flags.h"
#include "core/rule_resolver.h"
#include "test_support.h"

namespace {

db::DepartmentShift make_shift(int64_t id, int start, int end, int brk) {
    db::DepartmentShift shift;
    shift.shift_id = id;
    shift.department_id = 1;
    shift.name = "shift-" + std::to_string(id);
    shift.start_minute_local = start;
    shift.end_minute_local = end;
    shift.break_minutes = brk;
    return shift;
}

db::WeeklyRule make_weekly(int weekday, bool workday, int planned, int brk) {
    db::WeeklyRule rule;
    rule.department_id = 1;
    rule.weekday = weekday;
    rule.is_workday = workday;
    rule.planned_minutes = planned;
    rule.break_minutes = brk;
    return rule;
}

} // namespace

TEST(RuleResolverTest, ShiftPlannedMinutes) {
    EXPECT_EQ(core::shift_planned_minutes(make_shift(1, 10 * 60, 18 * 60, 60)), 420);
    EXPECT_EQ(core::shift_planned_minutes(make_shift(2, 22 * 60, 6 * 60, 30)), 450);
    EXPECT_EQ(core::shift_planned_minutes(make_shift(3, 9 * 60, 9 * 60, 60)), 1380);
}

TEST(RuleResolverTest, WorkRuleWhenNothingElseApplies) {
    auto rule = core::resolve_day_rule(540, 60, 10, nullptr, nullptr, "", nullptr);
    EXPECT_EQ(rule.source, db::RuleSource::WorkRule);
    EXPECT_EQ(rule.planned_minutes, 480);
    EXPECT_EQ(rule.break_minutes, 60);
    EXPECT_EQ(rule.grace_minutes, 10);
    EXPECT_TRUE(rule.is_workday);
    EXPECT_TRUE(rule.flags.empty());
}

TEST(RuleResolverTest, WeeklyRuleOffDay) {
    auto sunday = make_weekly(6, false, 0, 0);
    auto rule = core::resolve_day_rule(540, 60, 0, &sunday, nullptr, "", nullptr);
    EXPECT_EQ(rule.source, db::RuleSource::Weekly);
    EXPECT_FALSE(rule.is_workday);
    EXPECT_EQ(rule.planned_minutes, 0);
}

TEST(RuleResolverTest, ShiftBeatsWeeklyAndReportsConflict) {
    auto monday = make_weekly(0, true, 540, 60);
    auto shift = make_shift(10, 9 * 60, 17 * 60, 30);
    auto rule = core::resolve_day_rule(540, 60, 0, &monday, &shift, "", nullptr);
    EXPECT_EQ(rule.source, db::RuleSource::Shift);
    EXPECT_EQ(rule.planned_minutes, 450);
    EXPECT_EQ(rule.break_minutes, 30);
    EXPECT_TRUE(rule.shift_weekly_conflict);
}

TEST(RuleResolverTest, MatchingShiftAndWeeklyIsNotAConflict) {
    auto monday = make_weekly(0, true, 540, 60);
    auto shift = make_shift(10, 9 * 60, 18 * 60, 60);
    auto rule = core::resolve_day_rule(540, 60, 0, &monday, &shift, "", nullptr);
    EXPECT_FALSE(rule.shift_weekly_conflict);
}

TEST(RuleResolverTest, ForcedWeeklyWithoutWeeklyRuleIsInvalid) {
    auto rule = core::resolve_day_rule(540, 60, 0, nullptr, nullptr, "WEEKLY", nullptr);
    EXPECT_EQ(rule.source, db::RuleSource::WorkRule);
    EXPECT_EQ(rule.flags, std::vector<std::string>{core::flags::RULE_OVERRIDE_INVALID});
}

TEST(RuleResolverTest, UnknownForcedSourceIsInvalid) {
    auto shift = make_shift(10, 10 * 60, 18 * 60, 60);
    auto rule = core::resolve_day_rule(540, 60, 0, nullptr, &shift, "bogus", nullptr);
    EXPECT_EQ(rule.source, db::RuleSource::Shift);
    EXPECT_EQ(rule.flags, std::vector<std::string>{core::flags::RULE_OVERRIDE_INVALID});
}

TEST(RuleResolverTest, ForcedWeeklyIsNormalized) {
    auto monday = make_weekly(0, true, 600, 60);
    auto shift = make_shift(10, 10 * 60, 18 * 60, 60);
    auto rule = core::resolve_day_rule(540, 60, 0, &monday, &shift, " weekly ", nullptr);
    EXPECT_EQ(rule.source, db::RuleSource::Weekly);
    EXPECT_EQ(rule.planned_minutes, 540);
    EXPECT_EQ(rule.flags, std::vector<std::string>{core::flags::RULE_SOURCE_MANUAL_OVERRIDE});
}

TEST(RuleResolverTest, ForcedShiftUsesOverrideShift) {
    auto day_shift = make_shift(10, 10 * 60, 18 * 60, 60);
    auto forced_shift = make_shift(11, 22 * 60, 6 * 60, 30);
    auto rule = core::resolve_day_rule(540, 60, 0, nullptr, &day_shift, "SHIFT", &forced_shift);
    EXPECT_EQ(rule.source, db::RuleSource::Shift);
    EXPECT_EQ(rule.planned_minutes, 450);
    EXPECT_EQ(rule.break_minutes, 30);
    EXPECT_EQ(rule.flags, std::vector<std::string>{core::flags::RULE_SOURCE_MANUAL_OVERRIDE});
}

TEST(RuleResolverTest, ForcedShiftWithoutAnyShiftIsInvalid) {
    auto rule = core::resolve_day_rule(540, 60, 0, nullptr, nullptr, "SHIFT", nullptr);
    EXPECT_EQ(rule.source, db::RuleSource::WorkRule);
    EXPECT_EQ(rule.flags, std::vector<std::string>{core::flags::RULE_OVERRIDE_INVALID});
}

TEST(RuleResolverTest, ForcedWorkRule) {
    auto shift = make_shift(10, 10 * 60, 18 * 60, 60);
    auto rule = core::resolve_day_rule(540, 60, 0, nullptr, &shift, "WORK_RULE", nullptr);
    EXPECT_EQ(rule.source, db::RuleSource::WorkRule);
    EXPECT_EQ(rule.planned_minutes, 480);
    EXPECT_EQ(rule.flags, std::vector<std::string>{core::flags::RULE_SOURCE_MANUAL_OVERRIDE});
}

TEST(RuleResolverTest, AutoMeansNoOverride) {
    auto rule = core::resolve_day_rule(540, 60, 0, nullptr, nullptr, "auto", nullptr);
    EXPECT_EQ(rule.source, db::RuleSource::WorkRule);
    EXPECT_TRUE(rule.flags.empty());
}
