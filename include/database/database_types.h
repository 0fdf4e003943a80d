#ifndef DATABASE_TYPES_H
#define DATABASE_TYPES_H

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>
#include <ctime>
#include <boost/date_time/gregorian/gregorian_types.hpp>

#include "config.h"

namespace db {

using Date = boost::gregorian::date;

enum class EventType { In = 1, Out = 2 };

enum class EventSource { Device, Manual };

enum class PlanTarget { WholeDepartment, DepartmentExcept, OnlyEmployee };

enum class LeaveType { Annual, Sick, Unpaid, Excuse, PublicHoliday };

enum class LeaveStatus { Pending, Approved, Rejected };

enum class RuleSource { Shift, Weekly, WorkRule };

enum class OvertimeRounding { Off, RoundUp30Min };

// 枚举 <-> 数据库文本
const char* to_string(EventSource value);
const char* to_string(PlanTarget value);
const char* to_string(LeaveType value);
const char* to_string(LeaveStatus value);
const char* to_string(RuleSource value);
const char* to_string(OvertimeRounding value);

std::optional<EventSource> parse_event_source(const std::string& text);
std::optional<PlanTarget> parse_plan_target(const std::string& text);
std::optional<LeaveType> parse_leave_type(const std::string& text);
std::optional<LeaveStatus> parse_leave_status(const std::string& text);
std::optional<RuleSource> parse_rule_source(const std::string& text);
std::optional<OvertimeRounding> parse_overtime_rounding(const std::string& text);

/**
 * @brief 部门
 */
struct Department {
    int64_t department_id = -1;
    std::string name;
    std::optional<int64_t> region_id;
};

/**
 * @brief 员工
 */
struct Employee {
    int64_t employee_id = -1;
    std::string full_name;
    std::optional<int64_t> department_id;
    std::optional<int64_t> shift_id;                  // 默认班次
    std::optional<int> contract_weekly_minutes;       // 合同每周工时上限
    bool is_active = true;
};

/**
 * @brief 员工部分更新，只写入给出的字段
 * @details 可空列用两层 optional: 外层为空表示不修改，内层为空表示置为 NULL
 */
struct EmployeePatch {
    std::optional<std::string> full_name;
    std::optional<std::optional<int64_t>> department_id;
    std::optional<std::optional<int64_t>> shift_id;
    std::optional<std::optional<int>> contract_weekly_minutes;
    std::optional<bool> is_active;

    bool empty() const {
        return !full_name && !department_id && !shift_id && !contract_weekly_minutes && !is_active;
    }
};

/**
 * @brief 部门默认工作规则 (计划时长为毛时长)
 */
struct WorkRule {
    int64_t department_id = -1;
    int daily_minutes_planned = Config::WorkRule::DAILY_MINUTES_PLANNED;
    int break_minutes = Config::WorkRule::BREAK_MINUTES;
    int grace_minutes = Config::WorkRule::GRACE_MINUTES;
};

/**
 * @brief 部门按星期的工作规则，覆盖同一星期几的 WorkRule
 */
struct WeeklyRule {
    int64_t department_id = -1;
    int weekday = 0;                    // 0=周一 .. 6=周日
    bool is_workday = true;
    int planned_minutes = Config::WorkRule::DAILY_MINUTES_PLANNED;
    int break_minutes = Config::WorkRule::BREAK_MINUTES;
};

/**
 * @brief 部门班次，end <= start 表示跨零点
 */
struct DepartmentShift {
    int64_t shift_id = -1;
    int64_t department_id = -1;
    std::string name;
    int start_minute_local = 0;         // 本地时间，零点起分钟数
    int end_minute_local = 0;
    int break_minutes = Config::WorkRule::BREAK_MINUTES;
    bool is_active = true;
};

/**
 * @brief 排班计划 (临时覆盖部门规则)
 */
struct SchedulePlan {
    int64_t plan_id = -1;
    int64_t department_id = -1;
    PlanTarget target_type = PlanTarget::WholeDepartment;
    std::set<int64_t> target_employee_ids;
    std::optional<int64_t> shift_id;
    std::optional<int> daily_minutes_planned;
    std::optional<int> break_minutes;
    std::optional<int> grace_minutes;
    Date start_date;
    Date end_date;
    bool is_locked = false;
    bool is_active = true;
    std::time_t updated_at = 0;
};

/**
 * @brief 人工日覆盖：缺勤标记或手工指定签到/签退
 */
struct ManualDayOverride {
    int64_t override_id = -1;
    int64_t employee_id = -1;
    Date day_date;
    std::optional<std::time_t> in_ts;
    std::optional<std::time_t> out_ts;
    bool is_absent = false;
    std::string rule_source_override;           // 空 = 自动 (SHIFT / WEEKLY / WORK_RULE)
    std::optional<int64_t> rule_shift_id_override;
    std::string note;
    std::string created_by = "admin";
};

/**
 * @brief 打卡事件
 */
struct AttendanceEvent {
    int64_t event_id = -1;
    int64_t employee_id = -1;
    EventType type = EventType::In;
    std::time_t ts_utc = 0;
    std::optional<double> lat;
    std::optional<double> lon;
    std::set<std::string> flags;                // 值为 true 的事件标记，如 IS_NIGHT_SHIFT
    std::optional<int64_t> shift_id;            // 打卡时声明的班次
    EventSource source = EventSource::Device;
    bool created_by_admin = false;
    std::optional<std::time_t> deleted_at;      // 软删除
};

/**
 * @brief 请假
 */
struct Leave {
    int64_t leave_id = -1;
    int64_t employee_id = -1;
    Date start_date;
    Date end_date;
    LeaveType type = LeaveType::Annual;
    LeaveStatus status = LeaveStatus::Approved;
    std::string note;
};

/**
 * @brief 劳动法合规参数
 */
struct LaborProfile {
    int64_t profile_id = 0;
    std::string name = Config::Default::LABOR_PROFILE_NAME;
    int weekly_normal_minutes = Config::Labor::WEEKLY_NORMAL_MINUTES;
    int daily_max_minutes = Config::Labor::DAILY_MAX_MINUTES;
    bool enforce_min_break_rules = Config::Labor::ENFORCE_MIN_BREAK;
    int night_work_max_minutes = Config::Labor::NIGHT_WORK_MAX_MINUTES;
    bool night_work_exceptions_note_enabled = Config::Labor::NIGHT_WORK_EXCEPTIONS_NOTE_ENABLED;
    int overtime_annual_cap_minutes = Config::Labor::OVERTIME_ANNUAL_CAP_MINUTES;
    double overtime_premium = Config::Labor::OVERTIME_PREMIUM;
    double extra_work_premium = Config::Labor::EXTRA_WORK_PREMIUM;
    OvertimeRounding overtime_rounding_mode = OvertimeRounding::Off;
};

} // namespace db

#endif // DATABASE_TYPES_H
