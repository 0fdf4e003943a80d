/**
 * @file report_printer.cc
 * @brief 报表文本输出实现
 */

#include "service/report_printer.h"

#include <iomanip>
#include <sstream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace service {

namespace {

const char* kEmpty = "-";

std::string join_flags(const std::vector<std::string>& flags) {
    if (flags.empty()) return kEmpty;
    std::string text;
    for (const auto& flag : flags) {
        if (!text.empty()) text += ",";
        text += flag;
    }
    return text;
}

std::string format_time(const std::optional<std::time_t>& ts) {
    return ts ? format_utc(*ts) : kEmpty;
}

std::string format_coord(const std::optional<double>& value) {
    if (!value) return kEmpty;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << *value;
    return oss.str();
}

template <typename T>
std::string format_optional(const std::optional<T>& value) {
    if (!value) return kEmpty;
    std::ostringstream oss;
    oss << *value;
    return oss.str();
}

} // namespace

std::string format_utc(std::time_t ts_utc) {
    return boost::posix_time::to_iso_extended_string(boost::posix_time::from_time_t(ts_utc)) + "Z";
}

void print_monthly_report(std::ostream& out, const core::MonthlyReport& report) {
    const db::LaborProfile& profile = report.labor_profile;
    out << "employee\t" << report.employee_id << "\n"
        << "period\t" << report.year << "-" << std::setw(2) << std::setfill('0') << report.month
        << std::setfill(' ') << "\n"
        << "labor_profile\t" << profile.name
        << "\tweekly_normal=" << profile.weekly_normal_minutes
        << "\tdaily_max=" << profile.daily_max_minutes
        << "\tannual_cap=" << profile.overtime_annual_cap_minutes
        << "\trounding=" << db::to_string(profile.overtime_rounding_mode) << "\n";

    out << "date\tstatus\tcheck_in\tcheck_out\tin_lat\tin_lon\tout_lat\tout_lon\tworked\tplan_ot"
           "\tlegal_extra\tlegal_ot\tmissing\trule\tplanned\tbreak\tgrace\tleave\tshift\tflags\n";
    for (const auto& day : report.days) {
        out << boost::gregorian::to_iso_extended_string(day.day) << "\t"
            << core::to_string(day.status) << "\t"
            << format_time(day.check_in) << "\t"
            << format_time(day.check_out) << "\t"
            << format_coord(day.check_in_lat) << "\t"
            << format_coord(day.check_in_lon) << "\t"
            << format_coord(day.check_out_lat) << "\t"
            << format_coord(day.check_out_lon) << "\t"
            << day.worked_minutes << "\t"
            << day.plan_overtime_minutes << "\t"
            << day.legal_extra_work_minutes << "\t"
            << day.legal_overtime_minutes << "\t"
            << day.missing_minutes << "\t"
            << db::to_string(day.rule_source) << "\t"
            << day.applied_planned_minutes << "\t"
            << day.applied_break_minutes << "\t"
            << day.grace_minutes << "\t"
            << (day.leave_type ? db::to_string(*day.leave_type) : kEmpty) << "\t"
            << (day.shift_name ? *day.shift_name + "#" + format_optional(day.shift_id) : std::string(kEmpty)) << "\t"
            << join_flags(day.flags) << "\n";
    }

    out << "week_start\tweek_end\tworked\tnormal\textra_work\tovertime\tlegal_ot\tflags\n";
    for (const auto& week : report.weekly_totals) {
        out << boost::gregorian::to_iso_extended_string(week.week_start) << "\t"
            << boost::gregorian::to_iso_extended_string(week.week_end) << "\t"
            << week.worked_minutes << "\t"
            << week.normal_minutes << "\t"
            << week.extra_work_minutes << "\t"
            << week.overtime_minutes << "\t"
            << week.legal_overtime_minutes << "\t"
            << join_flags(week.flags) << "\n";
    }

    const core::MonthlyTotals& totals = report.totals;
    out << "totals\tworked=" << totals.worked_minutes
        << "\tplan_ot=" << totals.plan_overtime_minutes
        << "\tlegal_extra=" << totals.legal_extra_work_minutes
        << "\tlegal_ot=" << totals.legal_overtime_minutes
        << "\tincomplete_days=" << totals.incomplete_days << "\n"
        << "annual_overtime\tused=" << report.annual_overtime_used_minutes
        << "\tremaining=" << report.annual_overtime_remaining_minutes
        << "\texceeded=" << (report.annual_overtime_cap_exceeded ? "yes" : "no") << "\n";
}

void print_department_summaries(std::ostream& out,
                                const std::vector<core::DepartmentMonthlySummary>& summaries) {
    out << "department\tname\tregion\tworked\tovertime\tplan_ot\tlegal_extra\tlegal_ot\temployees\n";
    for (const auto& item : summaries) {
        out << item.department_id << "\t"
            << item.department_name << "\t"
            << format_optional(item.region_id) << "\t"
            << item.worked_minutes << "\t"
            << item.overtime_minutes << "\t"
            << item.plan_overtime_minutes << "\t"
            << item.legal_extra_work_minutes << "\t"
            << item.legal_overtime_minutes << "\t"
            << item.employee_count << "\n";
    }
}

} // namespace service
