#ifndef RULE_DAO_H
#define RULE_DAO_H

#include "database/database_types.h"
#include <optional>
#include <vector>

namespace db {

/**
 * @brief 部门工作规则、星期规则与班次
 */
class RuleDao {
public:
    // 每个部门一条，存在则覆盖
    bool upsert_work_rule(const WorkRule& rule);
    std::optional<WorkRule> get_work_rule(int64_t department_id);

    // 每个部门每个星期几一条，存在则覆盖
    bool upsert_weekly_rule(const WeeklyRule& rule);
    std::vector<WeeklyRule> get_weekly_rules(int64_t department_id);

    // 添加班次，返回 shift_id，失败返回 -1
    int64_t add_shift(const DepartmentShift& shift);

    bool set_shift_active(int64_t shift_id, bool is_active);

    // 含已停用班次，按 shift_id 升序
    std::vector<DepartmentShift> get_department_shifts(int64_t department_id);
};

} // namespace db

#endif // RULE_DAO_H
