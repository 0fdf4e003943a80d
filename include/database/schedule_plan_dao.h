#ifndef SCHEDULE_PLAN_DAO_H
#define SCHEDULE_PLAN_DAO_H

#include "database/database_types.h"
#include <vector>

namespace db {

class SchedulePlanDao {
public:
    // 写入计划及其目标员工 (同一事务)，返回 plan_id，失败返回 -1
    int64_t add_plan(const SchedulePlan& plan);

    bool set_plan_active(int64_t plan_id, bool is_active);

    // 与 [start, end] 有交集的启用计划，按 plan_id 升序
    std::vector<SchedulePlan> get_active_plans(int64_t department_id, const Date& start, const Date& end);
};

} // namespace db

#endif // SCHEDULE_PLAN_DAO_H
