#include <gtest/gtest.h>

#include <sstream>

#include "core/day_flags.h"
#include "service/monthly_service.h"
#include "service/report_printer.h"
#include "test_support.h"

using test::date;
using test::has_flag;
using test::make_event;
using test::utc;

namespace {

class MonthlyServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        db::Department production;
        production.department_id = 1;
        production.name = "Uretim";
        production.region_id = 10;
        db::Department warehouse;
        warehouse.department_id = 2;
        warehouse.name = "Depo";
        warehouse.region_id = 20;
        source_.departments = {warehouse, production};

        db::Employee employee;
        employee.employee_id = 1;
        employee.full_name = "Ayse Yilmaz";
        employee.department_id = 1;
        source_.employees.push_back(employee);

        db::WorkRule rule;
        rule.department_id = 1;
        rule.daily_minutes_planned = 540;
        rule.break_minutes = 60;
        source_.work_rules[1] = rule;
    }

    void add_event(int64_t employee_id, db::EventType type, std::time_t ts) {
        source_.events.push_back(make_event(next_event_id_++, employee_id, type, ts));
    }

    test::FakeAttendanceSource source_;
    core::LocalCalendar calendar_{"Europe/Istanbul"};
    service::MonthlyService service_{source_, calendar_};
    int64_t next_event_id_ = 1;
};

} // namespace

TEST_F(MonthlyServiceTest, UnknownEmployee) {
    EXPECT_FALSE(service_.compute_employee_month(99, 2026, 2).has_value());
}

TEST_F(MonthlyServiceTest, InvalidPeriod) {
    EXPECT_FALSE(service_.compute_employee_month(1, 2026, 0).has_value());
    EXPECT_FALSE(service_.compute_employee_month(1, 2026, 13).has_value());
    EXPECT_TRUE(service_.compute_department_month_summary(std::nullopt, std::nullopt, 2026, 13, false).empty());
}

TEST_F(MonthlyServiceTest, MonthCoversEveryDayAndOverlappingWeeks) {
    add_event(1, db::EventType::In, utc(2026, 2, 2, 5, 0));
    add_event(1, db::EventType::Out, utc(2026, 2, 2, 16, 0));

    auto report = service_.compute_employee_month(1, 2026, 2);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->employee_id, 1);
    ASSERT_EQ(report->days.size(), 28u);
    EXPECT_EQ(report->days.front().day, date(2026, 2, 1));
    EXPECT_EQ(report->days.back().day, date(2026, 2, 28));

    ASSERT_EQ(report->weekly_totals.size(), 5u);
    EXPECT_EQ(report->weekly_totals.front().week_start, date(2026, 1, 26));
    EXPECT_EQ(report->weekly_totals.back().week_start, date(2026, 2, 23));

    EXPECT_EQ(report->days[1].worked_minutes, 600);
    EXPECT_EQ(report->days[1].plan_overtime_minutes, 120);
    EXPECT_EQ(report->days[1].legal_overtime_minutes, 120);
    EXPECT_EQ(report->days[1].legal_extra_work_minutes, 0);

    EXPECT_EQ(report->totals.worked_minutes, 600);
    EXPECT_EQ(report->totals.plan_overtime_minutes, 120);
    EXPECT_EQ(report->totals.legal_overtime_minutes, 120);
    EXPECT_EQ(report->totals.legal_extra_work_minutes, 0);
    EXPECT_EQ(report->totals.incomplete_days, 27);

    EXPECT_EQ(report->weekly_totals[1].worked_minutes, 600);
    EXPECT_EQ(report->weekly_totals[1].overtime_minutes, 120);
    EXPECT_EQ(report->annual_overtime_used_minutes, 120);
    EXPECT_FALSE(report->annual_overtime_cap_exceeded);
}

TEST_F(MonthlyServiceTest, EmployeeShiftOvertime) {
    db::DepartmentShift shift;
    shift.shift_id = 10;
    shift.department_id = 1;
    shift.name = "Stant 10-18";
    shift.start_minute_local = 10 * 60;
    shift.end_minute_local = 18 * 60;
    shift.break_minutes = 60;
    source_.shifts.push_back(shift);
    source_.employees[0].shift_id = 10;

    add_event(1, db::EventType::In, utc(2026, 2, 2, 7, 0));
    add_event(1, db::EventType::Out, utc(2026, 2, 2, 16, 0));

    auto report = service_.compute_employee_month(1, 2026, 2);
    ASSERT_TRUE(report.has_value());
    const auto& day = report->days[1];
    EXPECT_EQ(day.status, core::DayStatus::Ok);
    EXPECT_EQ(day.shift_id, 10);
    EXPECT_EQ(day.plan_overtime_minutes, 60);
}

TEST_F(MonthlyServiceTest, AnnualCapCountsEarlierMonths) {
    db::LaborProfile profile;
    profile.overtime_annual_cap_minutes = 60;
    source_.labor_profile = profile;

    add_event(1, db::EventType::In, utc(2026, 1, 5, 5, 0));
    add_event(1, db::EventType::Out, utc(2026, 1, 5, 16, 0));

    auto report = service_.compute_employee_month(1, 2026, 2);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->annual_overtime_used_minutes, 120);
    EXPECT_EQ(report->annual_overtime_remaining_minutes, 0);
    EXPECT_TRUE(report->annual_overtime_cap_exceeded);
    EXPECT_EQ(report->totals.plan_overtime_minutes, 0);

    for (const auto& week : report->weekly_totals) {
        EXPECT_TRUE(has_flag(week.flags, core::flags::ANNUAL_OVERTIME_CAP_EXCEEDED));
    }
    for (const auto& day : report->days) {
        EXPECT_TRUE(has_flag(day.flags, core::flags::ANNUAL_OVERTIME_CAP_EXCEEDED));
    }
}

TEST_F(MonthlyServiceTest, OvertimeRoundingAppliesToWeeks) {
    db::LaborProfile profile;
    profile.overtime_rounding_mode = db::OvertimeRounding::RoundUp30Min;
    source_.labor_profile = profile;

    add_event(1, db::EventType::In, utc(2026, 2, 3, 5, 50));
    add_event(1, db::EventType::Out, utc(2026, 2, 3, 15, 0));

    auto report = service_.compute_employee_month(1, 2026, 2);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->totals.plan_overtime_minutes, 10);
    EXPECT_EQ(report->weekly_totals[1].overtime_minutes, 30);
    EXPECT_EQ(report->annual_overtime_used_minutes, 30);
}

TEST_F(MonthlyServiceTest, ContractHoursProduceExtraWork) {
    source_.employees[0].contract_weekly_minutes = 40 * 60;
    // 周一至周五每天 08:00-18:48 本地，净 588 分钟，合计 2940
    for (int day = 2; day <= 6; ++day) {
        add_event(1, db::EventType::In, utc(2026, 2, day, 5, 0));
        add_event(1, db::EventType::Out, utc(2026, 2, day, 15, 48));
    }

    auto report = service_.compute_employee_month(1, 2026, 2);
    ASSERT_TRUE(report.has_value());
    const auto& week = report->weekly_totals[1];
    EXPECT_EQ(week.worked_minutes, 2940);
    EXPECT_EQ(week.extra_work_minutes, 300);
    EXPECT_EQ(week.legal_overtime_minutes, 240);
}

TEST_F(MonthlyServiceTest, ManualOverrideShowsInReport) {
    db::ManualDayOverride row;
    row.override_id = 1;
    row.employee_id = 1;
    row.day_date = date(2026, 2, 4);
    row.in_ts = utc(2026, 2, 4, 6, 0);
    row.out_ts = utc(2026, 2, 4, 15, 0);
    source_.overrides.push_back(row);

    auto report = service_.compute_employee_month(1, 2026, 2);
    ASSERT_TRUE(report.has_value());
    const auto& day = report->days[3];
    EXPECT_EQ(day.day, date(2026, 2, 4));
    EXPECT_EQ(day.check_in, row.in_ts);
    EXPECT_EQ(day.check_out, row.out_ts);
    EXPECT_TRUE(has_flag(day.flags, core::flags::MANUAL_OVERRIDE));
}

TEST_F(MonthlyServiceTest, RepeatedComputationPrintsIdenticalReport) {
    add_event(1, db::EventType::In, utc(2026, 2, 10, 20, 30));
    add_event(1, db::EventType::Out, utc(2026, 2, 10, 22, 15));
    add_event(1, db::EventType::In, utc(2026, 2, 12, 6, 0));
    source_.events.back().lat = 41.0082;

    std::ostringstream first;
    std::ostringstream second;
    service::print_monthly_report(first, *service_.compute_employee_month(1, 2026, 2));
    service::print_monthly_report(second, *service_.compute_employee_month(1, 2026, 2));
    EXPECT_EQ(first.str(), second.str());
    EXPECT_NE(first.str().find("2026-02-10T22:15:00Z"), std::string::npos);
    EXPECT_NE(first.str().find("41.008200"), std::string::npos);
}

TEST_F(MonthlyServiceTest, DepartmentSummary) {
    db::Employee inactive;
    inactive.employee_id = 2;
    inactive.full_name = "Mehmet Kaya";
    inactive.department_id = 1;
    inactive.is_active = false;
    source_.employees.push_back(inactive);

    add_event(1, db::EventType::In, utc(2026, 2, 2, 5, 0));
    add_event(1, db::EventType::Out, utc(2026, 2, 2, 16, 0));
    add_event(2, db::EventType::In, utc(2026, 2, 3, 6, 0));
    add_event(2, db::EventType::Out, utc(2026, 2, 3, 15, 0));

    auto active_only = service_.compute_department_month_summary(std::nullopt, std::nullopt, 2026, 2, false);
    ASSERT_EQ(active_only.size(), 2u);
    EXPECT_EQ(active_only[0].department_id, 1);
    EXPECT_EQ(active_only[0].department_name, "Uretim");
    EXPECT_EQ(active_only[0].employee_count, 1);
    EXPECT_EQ(active_only[0].worked_minutes, 600);
    EXPECT_EQ(active_only[0].plan_overtime_minutes, 120);
    EXPECT_EQ(active_only[0].overtime_minutes, active_only[0].legal_overtime_minutes);
    EXPECT_EQ(active_only[1].department_id, 2);
    EXPECT_EQ(active_only[1].employee_count, 0);
    EXPECT_EQ(active_only[1].worked_minutes, 0);

    auto with_inactive = service_.compute_department_month_summary(1, std::nullopt, 2026, 2, true);
    ASSERT_EQ(with_inactive.size(), 1u);
    EXPECT_EQ(with_inactive[0].employee_count, 2);
    EXPECT_EQ(with_inactive[0].worked_minutes, 1080);

    auto by_region = service_.compute_department_month_summary(std::nullopt, 20, 2026, 2, false);
    ASSERT_EQ(by_region.size(), 1u);
    EXPECT_EQ(by_region[0].department_name, "Depo");
}

TEST(ReportPrinterTest, FormatUtc) {
    EXPECT_EQ(service::format_utc(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(service::format_utc(utc(2026, 2, 10, 20, 30)), "2026-02-10T20:30:00Z");
}

TEST(ReportPrinterTest, DepartmentSummaryLines) {
    core::DepartmentMonthlySummary item;
    item.department_id = 3;
    item.department_name = "Kalite";
    item.worked_minutes = 960;
    item.employee_count = 2;

    std::ostringstream out;
    service::print_department_summaries(out, {item});
    EXPECT_NE(out.str().find("3\tKalite\t-\t960\t0\t0\t0\t0\t2\n"), std::string::npos);
}
