#include <gtest/gtest.h>

#include "database/attendance_dao.h"
#include "database/database_manager.h"
#include "database/employee_dao.h"
#include "database/labor_profile_dao.h"
#include "database/leave_dao.h"
#include "database/manual_override_dao.h"
#include "database/row_codec.h"
#include "database/rule_dao.h"
#include "database/schedule_plan_dao.h"
#include "service/monthly_service.h"
#include "service/sqlite_attendance_source.h"
#include "test_support.h"

using test::date;
using test::utc;

namespace {

class SqliteAttendanceSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db::DatabaseManager::instance().open(":memory:"));

        db::Department department;
        department.name = "Uretim";
        department.region_id = 10;
        department_id_ = employee_dao_.add_department(department);
        ASSERT_GT(department_id_, 0);

        db::Employee employee;
        employee.full_name = "Ayse Yilmaz";
        employee.department_id = department_id_;
        employee.contract_weekly_minutes = 2400;
        employee_id_ = employee_dao_.add_employee(employee);
        ASSERT_GT(employee_id_, 0);
    }

    void TearDown() override {
        db::DatabaseManager::instance().close();
    }

    int64_t add_event(db::EventType type, std::time_t ts) {
        return attendance_dao_.add_event(test::make_event(-1, employee_id_, type, ts));
    }

    db::EmployeeDao employee_dao_;
    db::AttendanceDao attendance_dao_;
    service::SqliteAttendanceSource source_;
    int64_t department_id_ = -1;
    int64_t employee_id_ = -1;
};

} // namespace

TEST(RowCodecTest, DateText) {
    EXPECT_EQ(db::format_date(date(2026, 2, 9)), "2026-02-09");
    EXPECT_EQ(db::parse_date("2026-02-09"), date(2026, 2, 9));
    EXPECT_FALSE(db::parse_date("2026-2-9").has_value());
    EXPECT_FALSE(db::parse_date("2026-02-30").has_value());
    EXPECT_FALSE(db::parse_date("").has_value());
}

TEST(RowCodecTest, MinuteOfDayText) {
    EXPECT_EQ(db::format_minute_of_day(22 * 60 + 5), "22:05");
    EXPECT_EQ(db::parse_minute_of_day("06:30"), 390);
    EXPECT_FALSE(db::parse_minute_of_day("25:00").has_value());
    EXPECT_FALSE(db::parse_minute_of_day("10:00x").has_value());
}

TEST(RowCodecTest, EventFlagsText) {
    std::set<std::string> flags = {"NIGHT_SHIFT", "IS_NIGHT_SHIFT"};
    EXPECT_EQ(db::join_event_flags(flags), "IS_NIGHT_SHIFT,NIGHT_SHIFT");
    EXPECT_EQ(db::split_event_flags("IS_NIGHT_SHIFT,NIGHT_SHIFT"), flags);
    EXPECT_TRUE(db::split_event_flags("").empty());
}

TEST_F(SqliteAttendanceSourceTest, EmployeeLookup) {
    auto employee = source_.fetch_employee(employee_id_);
    ASSERT_TRUE(employee.has_value());
    EXPECT_EQ(employee->full_name, "Ayse Yilmaz");
    EXPECT_EQ(employee->department_id, department_id_);
    EXPECT_EQ(employee->contract_weekly_minutes, 2400);
    EXPECT_FALSE(employee->shift_id.has_value());
    EXPECT_TRUE(employee->is_active);

    EXPECT_FALSE(source_.fetch_employee(employee_id_ + 100).has_value());
}

TEST_F(SqliteAttendanceSourceTest, EmployeePatchWritesOnlyGivenFields) {
    db::EmployeePatch patch;
    patch.full_name = "Ayse Demir";
    patch.is_active = false;
    ASSERT_TRUE(employee_dao_.update_employee(employee_id_, patch));

    auto employee = employee_dao_.get_employee_by_id(employee_id_);
    ASSERT_TRUE(employee.has_value());
    EXPECT_EQ(employee->full_name, "Ayse Demir");
    EXPECT_FALSE(employee->is_active);
    EXPECT_EQ(employee->department_id, department_id_);
    EXPECT_EQ(employee->contract_weekly_minutes, 2400);

    db::EmployeePatch clear_contract;
    clear_contract.contract_weekly_minutes = std::optional<int>();
    ASSERT_TRUE(employee_dao_.update_employee(employee_id_, clear_contract));
    employee = employee_dao_.get_employee_by_id(employee_id_);
    ASSERT_TRUE(employee.has_value());
    EXPECT_FALSE(employee->contract_weekly_minutes.has_value());
    EXPECT_EQ(employee->full_name, "Ayse Demir");
    EXPECT_EQ(employee->department_id, department_id_);
}

TEST_F(SqliteAttendanceSourceTest, EmployeePatchRejectsEmptyOrUnknown) {
    EXPECT_FALSE(employee_dao_.update_employee(employee_id_, db::EmployeePatch{}));

    db::EmployeePatch patch;
    patch.contract_weekly_minutes = 1800;
    EXPECT_FALSE(employee_dao_.update_employee(employee_id_ + 100, patch));

    db::EmployeePatch blank_name;
    blank_name.full_name = "";
    EXPECT_FALSE(employee_dao_.update_employee(employee_id_, blank_name));

    auto employee = employee_dao_.get_employee_by_id(employee_id_);
    ASSERT_TRUE(employee.has_value());
    EXPECT_EQ(employee->full_name, "Ayse Yilmaz");
    EXPECT_EQ(employee->contract_weekly_minutes, 2400);
}

TEST_F(SqliteAttendanceSourceTest, DepartmentsAndEmployeesFilter) {
    db::Department other;
    other.name = "Depo";
    other.region_id = 20;
    const int64_t other_id = employee_dao_.add_department(other);

    db::Employee inactive;
    inactive.full_name = "Mehmet Kaya";
    inactive.department_id = department_id_;
    inactive.is_active = false;
    ASSERT_GT(employee_dao_.add_employee(inactive), 0);

    auto all = source_.fetch_departments(std::nullopt, std::nullopt);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].department_id, department_id_);
    EXPECT_EQ(all[1].department_id, other_id);

    auto by_region = source_.fetch_departments(std::nullopt, 20);
    ASSERT_EQ(by_region.size(), 1u);
    EXPECT_EQ(by_region[0].name, "Depo");

    EXPECT_EQ(source_.fetch_department_employees(department_id_, false).size(), 1u);
    EXPECT_EQ(source_.fetch_department_employees(department_id_, true).size(), 2u);
}

TEST_F(SqliteAttendanceSourceTest, EventsHalfOpenRangeWithoutDeleted) {
    db::AttendanceEvent flagged = test::make_event(-1, employee_id_, db::EventType::In, utc(2026, 2, 2, 6, 0));
    flagged.lat = 41.0082;
    flagged.flags = {"IS_NIGHT_SHIFT"};
    flagged.source = db::EventSource::Manual;
    flagged.created_by_admin = true;
    const int64_t in_id = attendance_dao_.add_event(flagged);
    const int64_t deleted_id = add_event(db::EventType::Out, utc(2026, 2, 2, 10, 0));
    const int64_t out_id = add_event(db::EventType::Out, utc(2026, 2, 2, 15, 0));
    add_event(db::EventType::In, utc(2026, 2, 3, 6, 0));
    ASSERT_TRUE(attendance_dao_.soft_delete_event(deleted_id, utc(2026, 2, 2, 18, 0)));

    auto events = source_.fetch_events(employee_id_, utc(2026, 2, 2, 0, 0), utc(2026, 2, 3, 6, 0));
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].event_id, in_id);
    EXPECT_EQ(events[0].lat, 41.0082);
    EXPECT_FALSE(events[0].lon.has_value());
    EXPECT_EQ(events[0].flags, std::set<std::string>{"IS_NIGHT_SHIFT"});
    EXPECT_EQ(events[0].source, db::EventSource::Manual);
    EXPECT_TRUE(events[0].created_by_admin);
    EXPECT_EQ(events[1].event_id, out_id);
    EXPECT_EQ(events[1].type, db::EventType::Out);

    auto deleted = attendance_dao_.get_event(deleted_id);
    ASSERT_TRUE(deleted.has_value());
    EXPECT_TRUE(deleted->deleted_at.has_value());
}

TEST_F(SqliteAttendanceSourceTest, ApprovedLeavesOverlappingRange) {
    db::LeaveDao leave_dao;
    db::Leave leave;
    leave.employee_id = employee_id_;
    leave.start_date = date(2026, 1, 30);
    leave.end_date = date(2026, 2, 3);
    leave.type = db::LeaveType::Sick;
    leave.status = db::LeaveStatus::Approved;
    const int64_t approved_id = leave_dao.add_leave(leave);

    leave.start_date = date(2026, 2, 10);
    leave.end_date = date(2026, 2, 11);
    leave.status = db::LeaveStatus::Pending;
    const int64_t pending_id = leave_dao.add_leave(leave);

    leave.start_date = date(2026, 3, 2);
    leave.end_date = date(2026, 3, 2);
    leave.status = db::LeaveStatus::Approved;
    ASSERT_GT(leave_dao.add_leave(leave), 0);

    leave.start_date = date(2026, 2, 5);
    leave.end_date = date(2026, 2, 4);
    EXPECT_EQ(leave_dao.add_leave(leave), -1);

    auto leaves = source_.fetch_approved_leaves(employee_id_, date(2026, 2, 1), date(2026, 2, 28));
    ASSERT_EQ(leaves.size(), 1u);
    EXPECT_EQ(leaves[0].leave_id, approved_id);
    EXPECT_EQ(leaves[0].type, db::LeaveType::Sick);

    ASSERT_TRUE(leave_dao.update_status(pending_id, db::LeaveStatus::Approved));
    EXPECT_EQ(source_.fetch_approved_leaves(employee_id_, date(2026, 2, 1), date(2026, 2, 28)).size(), 2u);
}

TEST_F(SqliteAttendanceSourceTest, OverrideUpsertKeepsOneRowPerDay) {
    db::ManualOverrideDao override_dao;
    db::ManualDayOverride row;
    row.employee_id = employee_id_;
    row.day_date = date(2026, 2, 4);
    row.is_absent = true;
    row.note = "rapor yok";
    const int64_t first_id = override_dao.upsert_override(row);
    ASSERT_GT(first_id, 0);

    row.is_absent = false;
    row.in_ts = utc(2026, 2, 4, 6, 0);
    row.out_ts = utc(2026, 2, 4, 15, 0);
    row.rule_source_override = "WEEKLY";
    EXPECT_EQ(override_dao.upsert_override(row), first_id);

    auto rows = source_.fetch_manual_overrides(employee_id_, date(2026, 2, 1), date(2026, 2, 28));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_FALSE(rows[0].is_absent);
    EXPECT_EQ(rows[0].in_ts, row.in_ts);
    EXPECT_EQ(rows[0].out_ts, row.out_ts);
    EXPECT_EQ(rows[0].rule_source_override, "WEEKLY");
    EXPECT_FALSE(rows[0].rule_shift_id_override.has_value());

    ASSERT_TRUE(override_dao.delete_override(employee_id_, date(2026, 2, 4)));
    EXPECT_TRUE(source_.fetch_manual_overrides(employee_id_, date(2026, 2, 1), date(2026, 2, 28)).empty());
}

TEST_F(SqliteAttendanceSourceTest, RulesAndShifts) {
    db::RuleDao rule_dao;
    EXPECT_FALSE(source_.fetch_work_rule(department_id_).has_value());

    db::WorkRule rule;
    rule.department_id = department_id_;
    rule.daily_minutes_planned = 510;
    rule.break_minutes = 30;
    rule.grace_minutes = 10;
    ASSERT_TRUE(rule_dao.upsert_work_rule(rule));
    rule.daily_minutes_planned = 540;
    ASSERT_TRUE(rule_dao.upsert_work_rule(rule));
    auto stored = source_.fetch_work_rule(department_id_);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->daily_minutes_planned, 540);
    EXPECT_EQ(stored->grace_minutes, 10);

    db::WeeklyRule sunday;
    sunday.department_id = department_id_;
    sunday.weekday = 6;
    sunday.is_workday = false;
    sunday.planned_minutes = 0;
    sunday.break_minutes = 0;
    ASSERT_TRUE(rule_dao.upsert_weekly_rule(sunday));
    sunday.weekday = 7;
    EXPECT_FALSE(rule_dao.upsert_weekly_rule(sunday));
    auto weekly = source_.fetch_weekly_rules(department_id_);
    ASSERT_EQ(weekly.size(), 1u);
    EXPECT_EQ(weekly[0].weekday, 6);
    EXPECT_FALSE(weekly[0].is_workday);

    db::DepartmentShift night;
    night.department_id = department_id_;
    night.name = "Gece";
    night.start_minute_local = 22 * 60;
    night.end_minute_local = 6 * 60;
    night.break_minutes = 30;
    const int64_t shift_id = rule_dao.add_shift(night);
    ASSERT_GT(shift_id, 0);
    ASSERT_TRUE(rule_dao.set_shift_active(shift_id, false));

    auto shifts = source_.fetch_department_shifts(department_id_);
    ASSERT_EQ(shifts.size(), 1u);
    EXPECT_EQ(shifts[0].start_minute_local, 22 * 60);
    EXPECT_EQ(shifts[0].end_minute_local, 6 * 60);
    EXPECT_FALSE(shifts[0].is_active);
}

TEST_F(SqliteAttendanceSourceTest, ActiveSchedulePlansWithTargets) {
    db::SchedulePlanDao plan_dao;
    db::SchedulePlan plan;
    plan.department_id = department_id_;
    plan.target_type = db::PlanTarget::OnlyEmployee;
    plan.target_employee_ids = {employee_id_};
    plan.daily_minutes_planned = 600;
    plan.start_date = date(2026, 2, 2);
    plan.end_date = date(2026, 2, 6);
    plan.updated_at = utc(2026, 1, 20, 9, 0);
    const int64_t plan_id = plan_dao.add_plan(plan);
    ASSERT_GT(plan_id, 0);

    plan.target_type = db::PlanTarget::WholeDepartment;
    plan.target_employee_ids.clear();
    const int64_t disabled_id = plan_dao.add_plan(plan);
    ASSERT_TRUE(plan_dao.set_plan_active(disabled_id, false));

    auto plans = source_.fetch_active_schedule_plans(department_id_, date(2026, 2, 1), date(2026, 2, 28));
    ASSERT_EQ(plans.size(), 1u);
    EXPECT_EQ(plans[0].plan_id, plan_id);
    EXPECT_EQ(plans[0].target_type, db::PlanTarget::OnlyEmployee);
    EXPECT_EQ(plans[0].target_employee_ids, std::set<int64_t>{employee_id_});
    EXPECT_EQ(plans[0].daily_minutes_planned, 600);
    EXPECT_FALSE(plans[0].break_minutes.has_value());
    EXPECT_EQ(plans[0].updated_at, utc(2026, 1, 20, 9, 0));

    EXPECT_TRUE(source_.fetch_active_schedule_plans(department_id_, date(2026, 3, 1), date(2026, 3, 31)).empty());
}

TEST_F(SqliteAttendanceSourceTest, LaborProfile) {
    EXPECT_FALSE(source_.fetch_labor_profile().has_value());

    db::LaborProfileDao profile_dao;
    db::LaborProfile profile;
    profile.name = "TR_STRICT";
    profile.enforce_min_break_rules = true;
    profile.overtime_annual_cap_minutes = 6000;
    profile.overtime_rounding_mode = db::OvertimeRounding::RoundUp30Min;
    ASSERT_GT(profile_dao.add_profile(profile), 0);

    auto stored = source_.fetch_labor_profile();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->name, "TR_STRICT");
    EXPECT_TRUE(stored->enforce_min_break_rules);
    EXPECT_EQ(stored->overtime_annual_cap_minutes, 6000);
    EXPECT_EQ(stored->overtime_rounding_mode, db::OvertimeRounding::RoundUp30Min);
    EXPECT_DOUBLE_EQ(stored->overtime_premium, 1.5);
}

TEST_F(SqliteAttendanceSourceTest, MonthlyReportFromDatabase) {
    add_event(db::EventType::In, utc(2026, 2, 10, 20, 30));
    add_event(db::EventType::Out, utc(2026, 2, 10, 22, 15));
    add_event(db::EventType::In, utc(2026, 2, 11, 5, 0));
    add_event(db::EventType::Out, utc(2026, 2, 11, 16, 0));

    core::LocalCalendar calendar("Europe/Istanbul");
    service::MonthlyService service(source_, calendar);
    auto report = service.compute_employee_month(employee_id_, 2026, 2);
    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->days.size(), 28u);

    const auto& crossing = report->days[9];
    EXPECT_EQ(crossing.day, date(2026, 2, 10));
    EXPECT_EQ(crossing.check_out, utc(2026, 2, 10, 22, 15));
    EXPECT_TRUE(test::has_flag(crossing.flags, "CROSS_MIDNIGHT_CHECKOUT"));

    const auto& next = report->days[10];
    EXPECT_EQ(next.status, core::DayStatus::Ok);
    EXPECT_EQ(next.check_in, utc(2026, 2, 11, 5, 0));
    EXPECT_EQ(next.worked_minutes, 600);
}
