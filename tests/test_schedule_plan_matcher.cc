#include <gtest/gtest.h>

#include "core/schedule_plan_matcher.h"
#include "test_support.h"

namespace {

db::SchedulePlan make_plan(int64_t id, db::PlanTarget target, std::set<int64_t> employees = {}) {
    db::SchedulePlan plan;
    plan.plan_id = id;
    plan.department_id = 1;
    plan.target_type = target;
    plan.target_employee_ids = std::move(employees);
    plan.start_date = test::date(2026, 2, 1);
    plan.end_date = test::date(2026, 2, 28);
    return plan;
}

} // namespace

TEST(SchedulePlanMatcherTest, TargetScopes) {
    EXPECT_TRUE(core::plan_applies_to_employee(make_plan(1, db::PlanTarget::WholeDepartment), 7));
    EXPECT_TRUE(core::plan_applies_to_employee(make_plan(1, db::PlanTarget::OnlyEmployee, {7}), 7));
    EXPECT_FALSE(core::plan_applies_to_employee(make_plan(1, db::PlanTarget::OnlyEmployee, {8}), 7));
    EXPECT_FALSE(core::plan_applies_to_employee(make_plan(1, db::PlanTarget::DepartmentExcept, {7}), 7));
    EXPECT_TRUE(core::plan_applies_to_employee(make_plan(1, db::PlanTarget::DepartmentExcept, {8}), 7));
}

TEST(SchedulePlanMatcherTest, MostSpecificTargetWins) {
    std::vector<db::SchedulePlan> plans = {
        make_plan(1, db::PlanTarget::WholeDepartment),
        make_plan(2, db::PlanTarget::OnlyEmployee, {7}),
        make_plan(3, db::PlanTarget::DepartmentExcept, {8}),
    };
    auto best = core::resolve_best_plan_for_day(plans, 7, test::date(2026, 2, 10));
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->plan_id, 2);

    best = core::resolve_best_plan_for_day(plans, 9, test::date(2026, 2, 10));
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->plan_id, 3);
}

TEST(SchedulePlanMatcherTest, TieBreakByStartDateThenUpdatedAtThenId) {
    auto early = make_plan(1, db::PlanTarget::WholeDepartment);
    auto late = make_plan(2, db::PlanTarget::WholeDepartment);
    late.start_date = test::date(2026, 2, 5);
    EXPECT_EQ(core::resolve_best_plan_for_day({late, early}, 7, test::date(2026, 2, 10))->plan_id, 2);

    auto newer = make_plan(3, db::PlanTarget::WholeDepartment);
    auto older = make_plan(4, db::PlanTarget::WholeDepartment);
    newer.updated_at = 2000;
    older.updated_at = 1000;
    EXPECT_EQ(core::resolve_best_plan_for_day({older, newer}, 7, test::date(2026, 2, 10))->plan_id, 3);

    auto low = make_plan(5, db::PlanTarget::WholeDepartment);
    auto high = make_plan(6, db::PlanTarget::WholeDepartment);
    EXPECT_EQ(core::resolve_best_plan_for_day({high, low}, 7, test::date(2026, 2, 10))->plan_id, 6);
}

TEST(SchedulePlanMatcherTest, DateRangeIsInclusive) {
    std::vector<db::SchedulePlan> plans = {make_plan(1, db::PlanTarget::WholeDepartment)};
    EXPECT_TRUE(core::resolve_best_plan_for_day(plans, 7, test::date(2026, 2, 1)).has_value());
    EXPECT_TRUE(core::resolve_best_plan_for_day(plans, 7, test::date(2026, 2, 28)).has_value());
    EXPECT_FALSE(core::resolve_best_plan_for_day(plans, 7, test::date(2026, 3, 1)).has_value());
    EXPECT_FALSE(core::resolve_best_plan_for_day(plans, 7, test::date(2026, 1, 31)).has_value());
}

TEST(SchedulePlanMatcherTest, InactivePlansAreSkipped) {
    auto specific = make_plan(1, db::PlanTarget::OnlyEmployee, {7});
    specific.is_active = false;
    auto whole = make_plan(2, db::PlanTarget::WholeDepartment);

    auto best = core::resolve_best_plan_for_day({specific, whole}, 7, test::date(2026, 2, 10));
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->plan_id, 2);
}

TEST(SchedulePlanMatcherTest, NoCandidate) {
    std::vector<db::SchedulePlan> plans = {make_plan(1, db::PlanTarget::OnlyEmployee, {8})};
    EXPECT_FALSE(core::resolve_best_plan_for_day(plans, 7, test::date(2026, 2, 10)).has_value());
    EXPECT_FALSE(core::resolve_best_plan_for_day({}, 7, test::date(2026, 2, 10)).has_value());
}
