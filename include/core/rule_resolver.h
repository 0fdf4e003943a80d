/**
 * @file rule_resolver.h
 * @brief 当日规则来源解析：班次 > 星期规则 > 部门默认规则，可被人工覆盖强制指定
 */

#ifndef RULE_RESOLVER_H
#define RULE_RESOLVER_H

#include <string>
#include <vector>

#include "database/database_types.h"

namespace core {

/**
 * @brief 班次净计划时长 (end <= start 时加 24 小时，再扣除休息)
 */
int shift_planned_minutes(const db::DepartmentShift& shift);

/**
 * @brief 规则净计划时长：WorkRule / WeeklyRule 存的是毛时长
 */
int rule_planned_minutes(int planned_minutes, int break_minutes);

struct RuleResolution {
    db::RuleSource source = db::RuleSource::WorkRule;
    int planned_minutes = 0;        // 净时长
    int break_minutes = 0;
    bool is_workday = true;
    int grace_minutes = 0;
    std::vector<std::string> flags; // RULE_OVERRIDE_INVALID / RULE_SOURCE_MANUAL_OVERRIDE
    bool shift_weekly_conflict = false;
};

/**
 * @brief 解析当日生效规则
 * @param base_planned 基础计划毛时长 (计划值优先，否则 WorkRule)
 * @param base_break 基础休息时长
 * @param base_grace 基础宽限时长
 * @param weekly_rule 当天星期对应的规则，可为空
 * @param day_shift 当天班次，可为空
 * @param override_source 人工覆盖指定的来源，空串或 "AUTO" 表示不指定
 * @param override_shift 人工覆盖指定的班次，可为空
 */
RuleResolution resolve_day_rule(int base_planned,
                                int base_break,
                                int base_grace,
                                const db::WeeklyRule* weekly_rule,
                                const db::DepartmentShift* day_shift,
                                const std::string& override_source,
                                const db::DepartmentShift* override_shift);

} // namespace core

#endif // RULE_RESOLVER_H
