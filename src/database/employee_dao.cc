/**
 * @file employee_dao.cc
 * @brief 部门与员工数据访问对象实现
 */

#include "database/employee_dao.h"
#include "database/database_manager.h"
#include "database/row_codec.h"
#include <iostream>

namespace db {

namespace {

const char* kEmployeeColumns =
    "employee_id, full_name, department_id, shift_id, contract_weekly_minutes, is_active";

Employee read_employee(sqlite3_stmt* stmt) {
    Employee e;
    e.employee_id = sqlite3_column_int64(stmt, 0);
    e.full_name = column_text(stmt, 1);
    e.department_id = column_optional_int64(stmt, 2);
    e.shift_id = column_optional_int64(stmt, 3);
    e.contract_weekly_minutes = column_optional_int(stmt, 4);
    e.is_active = sqlite3_column_int(stmt, 5) != 0;
    return e;
}

} // namespace

int64_t EmployeeDao::add_department(const Department& department) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql = "INSERT INTO departments (name, region_id) VALUES (?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    bind_text(stmt, 1, department.name);
    bind_optional_int64(stmt, 2, department.region_id);

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert department failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

std::vector<Department> EmployeeDao::get_departments(std::optional<int64_t> department_id,
                                                     std::optional<int64_t> region_id) {
    std::vector<Department> departments;
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return departments;

    // NULL 参数表示不过滤
    const char* sql =
        "SELECT department_id, name, region_id FROM departments "
        "WHERE (?1 IS NULL OR department_id = ?1) AND (?2 IS NULL OR region_id = ?2) "
        "ORDER BY department_id ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return departments;
    }

    bind_optional_int64(stmt, 1, department_id);
    bind_optional_int64(stmt, 2, region_id);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Department d;
        d.department_id = sqlite3_column_int64(stmt, 0);
        d.name = column_text(stmt, 1);
        d.region_id = column_optional_int64(stmt, 2);
        departments.push_back(d);
    }

    sqlite3_finalize(stmt);
    return departments;
}

int64_t EmployeeDao::add_employee(const Employee& employee) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql =
        "INSERT INTO employees (full_name, department_id, shift_id, contract_weekly_minutes, is_active) "
        "VALUES (?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    bind_text(stmt, 1, employee.full_name);
    bind_optional_int64(stmt, 2, employee.department_id);
    bind_optional_int64(stmt, 3, employee.shift_id);
    bind_optional_int(stmt, 4, employee.contract_weekly_minutes);
    sqlite3_bind_int(stmt, 5, employee.is_active ? 1 : 0);

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert employee failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

std::optional<Employee> EmployeeDao::get_employee_by_id(int64_t employee_id) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const std::string sql = std::string("SELECT ") + kEmployeeColumns + " FROM employees WHERE employee_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, employee_id);

    std::optional<Employee> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_employee(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<Employee> EmployeeDao::get_department_employees(int64_t department_id, bool include_inactive) {
    std::vector<Employee> employees;
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return employees;

    const std::string sql = std::string("SELECT ") + kEmployeeColumns +
        " FROM employees WHERE department_id = ? AND (? = 1 OR is_active = 1) ORDER BY employee_id ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return employees;
    }

    sqlite3_bind_int64(stmt, 1, department_id);
    sqlite3_bind_int(stmt, 2, include_inactive ? 1 : 0);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        employees.push_back(read_employee(stmt));
    }

    sqlite3_finalize(stmt);
    return employees;
}

bool EmployeeDao::update_employee(int64_t employee_id, const EmployeePatch& patch) {
    if (patch.empty()) {
        std::cerr << "Empty employee patch for employee " << employee_id << std::endl;
        return false;
    }
    if (patch.full_name && patch.full_name->empty()) {
        std::cerr << "Employee name must not be empty" << std::endl;
        return false;
    }

    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    // 只拼接补丁中给出的列
    std::string assignments;
    auto add_column = [&assignments](const char* column) {
        if (!assignments.empty()) assignments += ", ";
        assignments += column;
        assignments += "=?";
    };
    if (patch.full_name) add_column("full_name");
    if (patch.department_id) add_column("department_id");
    if (patch.shift_id) add_column("shift_id");
    if (patch.contract_weekly_minutes) add_column("contract_weekly_minutes");
    if (patch.is_active) add_column("is_active");

    const std::string sql = "UPDATE employees SET " + assignments + " WHERE employee_id=?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    int index = 1;
    if (patch.full_name) bind_text(stmt, index++, *patch.full_name);
    if (patch.department_id) bind_optional_int64(stmt, index++, *patch.department_id);
    if (patch.shift_id) bind_optional_int64(stmt, index++, *patch.shift_id);
    if (patch.contract_weekly_minutes) bind_optional_int(stmt, index++, *patch.contract_weekly_minutes);
    if (patch.is_active) sqlite3_bind_int(stmt, index++, *patch.is_active ? 1 : 0);
    sqlite3_bind_int64(stmt, index, employee_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    if (!success) {
        std::cerr << "Update employee failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);
    return success && sqlite3_changes(db) > 0;
}

} // namespace db
