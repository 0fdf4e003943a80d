/**
 * @file report_types.h
 * @brief 计算结果结构体：日记录、周汇总、月报、部门汇总
 * @details 每次调用重新计算，不落库。
 */

#ifndef REPORT_TYPES_H
#define REPORT_TYPES_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <ctime>

#include "database/database_types.h"

namespace core {

enum class DayStatus { Ok, Incomplete, Leave, Off };

const char* to_string(DayStatus status);

/**
 * @brief 单日考勤记录 (范围内每个日历日恰好一条)
 */
struct DayRecord {
    db::Date day;
    DayStatus status = DayStatus::Incomplete;
    std::optional<std::time_t> check_in;
    std::optional<std::time_t> check_out;
    std::optional<double> check_in_lat;
    std::optional<double> check_in_lon;
    std::optional<double> check_out_lat;
    std::optional<double> check_out_lon;
    int worked_minutes = 0;               // 净工时
    int plan_overtime_minutes = 0;        // 超出当日计划的分钟数
    int legal_extra_work_minutes = 0;
    int legal_overtime_minutes = 0;
    int missing_minutes = 0;
    db::RuleSource rule_source = db::RuleSource::WorkRule;
    int applied_planned_minutes = 0;
    int applied_break_minutes = 0;
    int grace_minutes = 0;                // 迟到宽限 (只展示，不参与计算)
    std::optional<db::LeaveType> leave_type;
    std::optional<int64_t> shift_id;
    std::optional<std::string> shift_name;
    std::vector<std::string> flags;       // 已排序、无重复
};

/**
 * @brief ISO 周汇总 (周一开始)
 */
struct WeekSummary {
    db::Date week_start;
    db::Date week_end;
    int worked_minutes = 0;
    int normal_minutes = 0;
    int extra_work_minutes = 0;           // 合同工时与法定工时之间的部分
    int overtime_minutes = 0;             // 计划加班合计 (按舍入模式处理)，计入年度上限
    int legal_overtime_minutes = 0;       // 超出法定每周工时的部分
    std::vector<std::string> flags;
};

struct MonthlyTotals {
    int worked_minutes = 0;
    int plan_overtime_minutes = 0;
    int legal_extra_work_minutes = 0;
    int legal_overtime_minutes = 0;
    int incomplete_days = 0;
};

/**
 * @brief 员工月报
 */
struct MonthlyReport {
    int64_t employee_id = -1;
    int year = 0;
    int month = 0;
    std::vector<DayRecord> days;
    MonthlyTotals totals;
    std::vector<WeekSummary> weekly_totals;
    int annual_overtime_used_minutes = 0;
    int annual_overtime_remaining_minutes = 0;
    bool annual_overtime_cap_exceeded = false;
    db::LaborProfile labor_profile;
};

/**
 * @brief 部门月度汇总
 */
struct DepartmentMonthlySummary {
    int64_t department_id = -1;
    std::string department_name;
    std::optional<int64_t> region_id;
    int worked_minutes = 0;
    int overtime_minutes = 0;
    int plan_overtime_minutes = 0;
    int legal_extra_work_minutes = 0;
    int legal_overtime_minutes = 0;
    int employee_count = 0;
};

} // namespace core

#endif // REPORT_TYPES_H
