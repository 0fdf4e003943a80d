/**
 * @file database_types.cc
 * @brief 枚举与数据库文本之间的转换
 */

#include "database/database_types.h"

namespace db {

const char* to_string(EventSource value) {
    switch (value) {
        case EventSource::Device: return "DEVICE";
        case EventSource::Manual: return "MANUAL";
    }
    return "DEVICE";
}

const char* to_string(PlanTarget value) {
    switch (value) {
        case PlanTarget::WholeDepartment: return "WHOLE_DEPARTMENT";
        case PlanTarget::DepartmentExcept: return "DEPARTMENT_EXCEPT";
        case PlanTarget::OnlyEmployee: return "ONLY_EMPLOYEE";
    }
    return "WHOLE_DEPARTMENT";
}

const char* to_string(LeaveType value) {
    switch (value) {
        case LeaveType::Annual: return "ANNUAL";
        case LeaveType::Sick: return "SICK";
        case LeaveType::Unpaid: return "UNPAID";
        case LeaveType::Excuse: return "EXCUSE";
        case LeaveType::PublicHoliday: return "PUBLIC_HOLIDAY";
    }
    return "ANNUAL";
}

const char* to_string(LeaveStatus value) {
    switch (value) {
        case LeaveStatus::Pending: return "PENDING";
        case LeaveStatus::Approved: return "APPROVED";
        case LeaveStatus::Rejected: return "REJECTED";
    }
    return "PENDING";
}

const char* to_string(RuleSource value) {
    switch (value) {
        case RuleSource::Shift: return "SHIFT";
        case RuleSource::Weekly: return "WEEKLY";
        case RuleSource::WorkRule: return "WORK_RULE";
    }
    return "WORK_RULE";
}

const char* to_string(OvertimeRounding value) {
    switch (value) {
        case OvertimeRounding::Off: return "OFF";
        case OvertimeRounding::RoundUp30Min: return "ROUND_UP_30MIN";
    }
    return "OFF";
}

std::optional<EventSource> parse_event_source(const std::string& text) {
    if (text == "DEVICE") return EventSource::Device;
    if (text == "MANUAL") return EventSource::Manual;
    return std::nullopt;
}

std::optional<PlanTarget> parse_plan_target(const std::string& text) {
    // 兼容旧库中的 DEPARTMENT / DEPARTMENT_EXCEPT_EMPLOYEE
    if (text == "WHOLE_DEPARTMENT" || text == "DEPARTMENT") return PlanTarget::WholeDepartment;
    if (text == "DEPARTMENT_EXCEPT" || text == "DEPARTMENT_EXCEPT_EMPLOYEE") return PlanTarget::DepartmentExcept;
    if (text == "ONLY_EMPLOYEE") return PlanTarget::OnlyEmployee;
    return std::nullopt;
}

std::optional<LeaveType> parse_leave_type(const std::string& text) {
    if (text == "ANNUAL") return LeaveType::Annual;
    if (text == "SICK") return LeaveType::Sick;
    if (text == "UNPAID") return LeaveType::Unpaid;
    if (text == "EXCUSE") return LeaveType::Excuse;
    if (text == "PUBLIC_HOLIDAY") return LeaveType::PublicHoliday;
    return std::nullopt;
}

std::optional<LeaveStatus> parse_leave_status(const std::string& text) {
    if (text == "PENDING") return LeaveStatus::Pending;
    if (text == "APPROVED") return LeaveStatus::Approved;
    if (text == "REJECTED") return LeaveStatus::Rejected;
    return std::nullopt;
}

std::optional<RuleSource> parse_rule_source(const std::string& text) {
    if (text == "SHIFT") return RuleSource::Shift;
    if (text == "WEEKLY") return RuleSource::Weekly;
    if (text == "WORK_RULE") return RuleSource::WorkRule;
    return std::nullopt;
}

std::optional<OvertimeRounding> parse_overtime_rounding(const std::string& text) {
    if (text == "OFF") return OvertimeRounding::Off;
    if (text == "ROUND_UP_30MIN" || text == "REG_HALF_HOUR") return OvertimeRounding::RoundUp30Min;
    return std::nullopt;
}

} // namespace db
