/**
 * @file schedule_plan_matcher.h
 * @brief 排班计划匹配：为员工的某一天选出唯一生效的计划
 */

#ifndef SCHEDULE_PLAN_MATCHER_H
#define SCHEDULE_PLAN_MATCHER_H

#include <vector>
#include <optional>
#include <cstdint>

#include "database/database_types.h"

namespace core {

// 计划的目标范围是否包含该员工 (不检查日期)
bool plan_applies_to_employee(const db::SchedulePlan& plan, int64_t employee_id);

/**
 * @brief 选出某天生效的计划
 * @details 候选条件：start_date <= day <= end_date 且目标匹配。
 *          排序优先级 (均为降序)：目标精确度 ONLY_EMPLOYEE > DEPARTMENT_EXCEPT > WHOLE_DEPARTMENT，
 *          start_date，updated_at，plan_id。
 * @return 没有匹配时返回 std::nullopt
 */
std::optional<db::SchedulePlan> resolve_best_plan_for_day(const std::vector<db::SchedulePlan>& plans,
                                                          int64_t employee_id,
                                                          const db::Date& day);

} // namespace core

#endif // SCHEDULE_PLAN_MATCHER_H
