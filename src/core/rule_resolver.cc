/**
 * @file rule_resolver.cc
 * @brief 当日规则来源解析实现
 */

#include "core/rule_resolver.h"
#include "core/day_flags.h"

#include <algorithm>
#include <cctype>

namespace core {

namespace {

constexpr int kMinutesPerDay = 24 * 60;

std::string normalize_source(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    std::string value = text.substr(first, last - first + 1);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value == "AUTO" ? "" : value;
}

void apply_shift(RuleResolution& result, const db::DepartmentShift& shift) {
    result.source = db::RuleSource::Shift;
    result.planned_minutes = shift_planned_minutes(shift);
    result.break_minutes = std::max(0, shift.break_minutes);
    result.is_workday = true;
}

} // namespace

int shift_planned_minutes(const db::DepartmentShift& shift) {
    int gross = shift.end_minute_local - shift.start_minute_local;
    if (gross <= 0) {
        gross += kMinutesPerDay;
    }
    return std::max(0, gross - std::max(0, shift.break_minutes));
}

int rule_planned_minutes(int planned_minutes, int break_minutes) {
    return std::max(0, std::max(0, planned_minutes) - std::max(0, break_minutes));
}

RuleResolution resolve_day_rule(int base_planned,
                                int base_break,
                                int base_grace,
                                const db::WeeklyRule* weekly_rule,
                                const db::DepartmentShift* day_shift,
                                const std::string& override_source,
                                const db::DepartmentShift* override_shift) {
    RuleResolution result;
    result.grace_minutes = std::max(0, base_grace);

    const int work_rule_planned = rule_planned_minutes(base_planned, base_break);
    const int work_rule_break = std::max(0, base_break);

    // 星期规则分支的取值，没有星期规则时退回部门默认规则
    int weekly_planned = work_rule_planned;
    int weekly_break = work_rule_break;
    bool weekly_is_workday = true;
    if (weekly_rule != nullptr) {
        weekly_break = std::max(0, weekly_rule->break_minutes);
        weekly_planned = rule_planned_minutes(weekly_rule->planned_minutes, weekly_rule->break_minutes);
        weekly_is_workday = weekly_rule->is_workday;
    }

    if (day_shift != nullptr && weekly_rule != nullptr) {
        result.shift_weekly_conflict =
            !weekly_rule->is_workday ||
            weekly_planned != shift_planned_minutes(*day_shift) ||
            weekly_break != std::max(0, day_shift->break_minutes);
    }

    if (day_shift != nullptr) {
        apply_shift(result, *day_shift);
    } else if (weekly_rule != nullptr) {
        result.source = db::RuleSource::Weekly;
        result.planned_minutes = weekly_planned;
        result.break_minutes = weekly_break;
        result.is_workday = weekly_is_workday;
    } else {
        result.source = db::RuleSource::WorkRule;
        result.planned_minutes = work_rule_planned;
        result.break_minutes = work_rule_break;
        result.is_workday = true;
    }

    const std::string forced = normalize_source(override_source);
    if (forced.empty()) {
        return result;
    }

    const auto forced_source = db::parse_rule_source(forced);
    if (!forced_source) {
        result.flags.push_back(flags::RULE_OVERRIDE_INVALID);
        return result;
    }

    switch (*forced_source) {
        case db::RuleSource::Shift: {
            const db::DepartmentShift* selected = override_shift != nullptr ? override_shift : day_shift;
            if (selected == nullptr) {
                result.flags.push_back(flags::RULE_OVERRIDE_INVALID);
                return result;
            }
            apply_shift(result, *selected);
            break;
        }
        case db::RuleSource::Weekly:
            if (weekly_rule == nullptr) {
                result.flags.push_back(flags::RULE_OVERRIDE_INVALID);
                return result;
            }
            result.source = db::RuleSource::Weekly;
            result.planned_minutes = weekly_planned;
            result.break_minutes = weekly_break;
            result.is_workday = weekly_is_workday;
            break;
        case db::RuleSource::WorkRule:
            result.source = db::RuleSource::WorkRule;
            result.planned_minutes = work_rule_planned;
            result.break_minutes = work_rule_break;
            result.is_workday = true;
            break;
    }
    result.flags.push_back(flags::RULE_SOURCE_MANUAL_OVERRIDE);
    return result;
}

} // namespace core
