/**
 * @file schedule_plan_matcher.cc
 * @brief 排班计划匹配实现
 */

#include "core/schedule_plan_matcher.h"

#include <algorithm>
#include <tuple>

namespace core {

namespace {

int target_priority(db::PlanTarget target) {
    switch (target) {
        case db::PlanTarget::OnlyEmployee:     return 300;
        case db::PlanTarget::DepartmentExcept: return 200;
        case db::PlanTarget::WholeDepartment:  return 100;
    }
    return 0;
}

} // namespace

bool plan_applies_to_employee(const db::SchedulePlan& plan, int64_t employee_id) {
    const bool listed = plan.target_employee_ids.count(employee_id) > 0;
    switch (plan.target_type) {
        case db::PlanTarget::OnlyEmployee:
            return listed;
        case db::PlanTarget::DepartmentExcept:
            return !listed;
        case db::PlanTarget::WholeDepartment:
            return true;
    }
    return true;
}

std::optional<db::SchedulePlan> resolve_best_plan_for_day(const std::vector<db::SchedulePlan>& plans,
                                                          int64_t employee_id,
                                                          const db::Date& day) {
    const db::SchedulePlan* best = nullptr;
    for (const auto& plan : plans) {
        if (!plan.is_active) continue;
        if (day < plan.start_date || day > plan.end_date) continue;
        if (!plan_applies_to_employee(plan, employee_id)) continue;

        if (best == nullptr ||
            std::make_tuple(target_priority(plan.target_type), plan.start_date, plan.updated_at, plan.plan_id) >
            std::make_tuple(target_priority(best->target_type), best->start_date, best->updated_at, best->plan_id)) {
            best = &plan;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

} // namespace core
