#ifndef EMPLOYEE_DAO_H
#define EMPLOYEE_DAO_H

#include "database/database_types.h"
#include <optional>
#include <vector>

namespace db {

/**
 * @brief 部门与员工主数据
 */
class EmployeeDao {
public:
    // 添加部门，返回生成的 department_id，失败返回 -1
    int64_t add_department(const Department& department);

    // 按 department_id 升序，条件为空时不过滤
    std::vector<Department> get_departments(std::optional<int64_t> department_id,
                                            std::optional<int64_t> region_id);

    // 添加员工，返回生成的 employee_id，失败返回 -1
    int64_t add_employee(const Employee& employee);

    std::optional<Employee> get_employee_by_id(int64_t employee_id);

    // 部门下员工，按 employee_id 升序
    std::vector<Employee> get_department_employees(int64_t department_id, bool include_inactive);

    // 部分更新；空补丁或员工不存在时返回 false
    bool update_employee(int64_t employee_id, const EmployeePatch& patch);
};

} // namespace db

#endif // EMPLOYEE_DAO_H
