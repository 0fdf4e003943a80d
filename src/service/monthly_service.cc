/**
 * @file monthly_service.cc
 * @brief 月度考勤统计实现
 */

#include "service/monthly_service.h"
#include "core/day_record_builder.h"
#include "core/week_aggregator.h"

#include <iostream>

namespace service {

namespace bg = boost::gregorian;

namespace {

// boost::gregorian::date 支持的年份范围
constexpr int kMinYear = 1400;
constexpr int kMaxYear = 9999;

bool valid_period(int year, int month) {
    return month >= 1 && month <= 12 && year >= kMinYear && year <= kMaxYear;
}

} // namespace

MonthlyService::MonthlyService(AttendanceSource& source, const core::LocalCalendar& calendar)
    : source_(source), calendar_(calendar) {}

std::optional<core::MonthlyReport> MonthlyService::compute_employee_month(int64_t employee_id,
                                                                          int year, int month) {
    if (!valid_period(year, month)) {
        std::cerr << "Invalid report period: " << year << "-" << month << std::endl;
        return std::nullopt;
    }
    auto employee = source_.fetch_employee(employee_id);
    if (!employee) {
        std::cerr << "Employee not found: " << employee_id << std::endl;
        return std::nullopt;
    }
    return build_month_report(*employee, year, month);
}

core::MonthlyReport MonthlyService::build_month_report(const db::Employee& employee, int year, int month) {
    const bg::date month_start(year, month, 1);
    const bg::date month_end = month_start.end_of_month();
    const bg::date year_start(year, 1, 1);

    core::DayBuildInputs inputs;
    inputs.employee = employee;
    inputs.labor_profile = source_.fetch_labor_profile().value_or(db::LaborProfile());
    if (employee.department_id) {
        const int64_t department_id = *employee.department_id;
        if (auto rule = source_.fetch_work_rule(department_id)) {
            inputs.work_rule = *rule;
        }
        inputs.work_rule.department_id = department_id;
        inputs.weekly_rules = source_.fetch_weekly_rules(department_id);
        inputs.shifts = source_.fetch_department_shifts(department_id);
        inputs.plans = source_.fetch_active_schedule_plans(department_id, year_start, month_end);
    }
    const auto bounds = calendar_.utc_bounds(year_start, month_end);
    inputs.events = source_.fetch_events(employee.employee_id, bounds.first, bounds.second);
    inputs.leaves = source_.fetch_approved_leaves(employee.employee_id, year_start, month_end);
    inputs.overrides = source_.fetch_manual_overrides(employee.employee_id, year_start, month_end);

    core::DayRecordBuilder builder(calendar_, inputs);
    std::vector<core::DayRecord> year_days = builder.build(year_start, month_end);
    core::apply_daily_legal_breakdown(year_days);

    const db::LaborProfile& profile = inputs.labor_profile;
    std::vector<core::WeekSummary> year_weeks = core::build_weekly_summaries(
        year_days, employee.contract_weekly_minutes, profile.weekly_normal_minutes,
        profile.overtime_rounding_mode);
    const core::AnnualCapUsage usage =
        core::mark_annual_overtime_cap(year_weeks, profile.overtime_annual_cap_minutes);

    core::MonthlyReport report;
    report.employee_id = employee.employee_id;
    report.year = year;
    report.month = month;
    report.labor_profile = profile;
    report.annual_overtime_used_minutes = usage.used_minutes;
    report.annual_overtime_remaining_minutes = usage.remaining_minutes;
    report.annual_overtime_cap_exceeded = usage.exceeded;

    for (const auto& week : year_weeks) {
        if (week.week_end >= month_start && week.week_start <= month_end) {
            report.weekly_totals.push_back(week);
        }
    }

    for (const auto& day : year_days) {
        if (day.day < month_start) continue;
        report.days.push_back(day);
    }
    core::propagate_annual_cap_flag(report.weekly_totals, report.days);

    for (const auto& day : report.days) {
        if (day.status == core::DayStatus::Incomplete) {
            ++report.totals.incomplete_days;
        }
        report.totals.worked_minutes += day.worked_minutes;
        report.totals.plan_overtime_minutes += day.plan_overtime_minutes;
        report.totals.legal_extra_work_minutes += day.legal_extra_work_minutes;
        report.totals.legal_overtime_minutes += day.legal_overtime_minutes;
    }
    return report;
}

std::vector<core::DepartmentMonthlySummary> MonthlyService::compute_department_month_summary(
        std::optional<int64_t> department_id,
        std::optional<int64_t> region_id,
        int year,
        int month,
        bool include_inactive) {
    std::vector<core::DepartmentMonthlySummary> summaries;
    if (!valid_period(year, month)) {
        std::cerr << "Invalid report period: " << year << "-" << month << std::endl;
        return summaries;
    }

    for (const auto& department : source_.fetch_departments(department_id, region_id)) {
        core::DepartmentMonthlySummary item;
        item.department_id = department.department_id;
        item.department_name = department.name;
        item.region_id = department.region_id;

        const auto employees = source_.fetch_department_employees(department.department_id, include_inactive);
        for (const auto& employee : employees) {
            const core::MonthlyReport report = build_month_report(employee, year, month);
            item.worked_minutes += report.totals.worked_minutes;
            item.plan_overtime_minutes += report.totals.plan_overtime_minutes;
            item.legal_extra_work_minutes += report.totals.legal_extra_work_minutes;
            item.legal_overtime_minutes += report.totals.legal_overtime_minutes;
        }
        item.overtime_minutes = item.legal_overtime_minutes;
        item.employee_count = static_cast<int>(employees.size());
        summaries.push_back(item);
    }
    return summaries;
}

} // namespace service
