/**
 * @file schedule_plan_dao.cc
 * @brief 排班计划数据访问对象实现
 */

#include "database/schedule_plan_dao.h"
#include "database/database_manager.h"
#include "database/row_codec.h"
#include <iostream>

namespace db {

namespace {

bool insert_plan_employee(sqlite3* db, int64_t plan_id, int64_t employee_id) {
    const char* sql = "INSERT INTO department_schedule_plan_employees (plan_id, employee_id) VALUES (?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    sqlite3_bind_int64(stmt, 1, plan_id);
    sqlite3_bind_int64(stmt, 2, employee_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    if (!success) {
        std::cerr << "Insert plan employee failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);
    return success;
}

void load_plan_employees(sqlite3* db, SchedulePlan& plan) {
    const char* sql = "SELECT employee_id FROM department_schedule_plan_employees WHERE plan_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return;
    }

    sqlite3_bind_int64(stmt, 1, plan.plan_id);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        plan.target_employee_ids.insert(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
}

} // namespace

int64_t SchedulePlanDao::add_plan(const SchedulePlan& plan) {
    DatabaseManager& manager = DatabaseManager::instance();
    sqlite3* db = manager.connection();
    if (!db) return -1;

    const char* sql =
        "INSERT INTO department_schedule_plans (department_id, target_type, shift_id, daily_minutes_planned, "
        "break_minutes, grace_minutes, start_date, end_date, is_locked, is_active, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (!manager.begin_transaction()) return -1;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        manager.rollback_transaction();
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, plan.department_id);
    bind_text(stmt, 2, to_string(plan.target_type));
    bind_optional_int64(stmt, 3, plan.shift_id);
    bind_optional_int(stmt, 4, plan.daily_minutes_planned);
    bind_optional_int(stmt, 5, plan.break_minutes);
    bind_optional_int(stmt, 6, plan.grace_minutes);
    bind_text(stmt, 7, format_date(plan.start_date));
    bind_text(stmt, 8, format_date(plan.end_date));
    sqlite3_bind_int(stmt, 9, plan.is_locked ? 1 : 0);
    sqlite3_bind_int(stmt, 10, plan.is_active ? 1 : 0);
    sqlite3_bind_int64(stmt, 11, static_cast<int64_t>(plan.updated_at));

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert plan failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);

    if (new_id != -1) {
        for (int64_t employee_id : plan.target_employee_ids) {
            if (!insert_plan_employee(db, new_id, employee_id)) {
                new_id = -1;
                break;
            }
        }
    }

    if (new_id == -1) {
        manager.rollback_transaction();
        return -1;
    }
    if (!manager.commit_transaction()) {
        manager.rollback_transaction();
        return -1;
    }
    return new_id;
}

bool SchedulePlanDao::set_plan_active(int64_t plan_id, bool is_active) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "UPDATE department_schedule_plans SET is_active = ? WHERE plan_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    sqlite3_bind_int(stmt, 1, is_active ? 1 : 0);
    sqlite3_bind_int64(stmt, 2, plan_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    sqlite3_finalize(stmt);
    return success && sqlite3_changes(db) > 0;
}

std::vector<SchedulePlan> SchedulePlanDao::get_active_plans(int64_t department_id, const Date& start, const Date& end) {
    std::vector<SchedulePlan> plans;
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return plans;

    // ISO 日期文本按字典序比较即按日期比较
    const char* sql =
        "SELECT plan_id, department_id, target_type, shift_id, daily_minutes_planned, break_minutes, grace_minutes, "
        "start_date, end_date, is_locked, is_active, updated_at FROM department_schedule_plans "
        "WHERE department_id = ? AND is_active = 1 AND start_date <= ? AND end_date >= ? ORDER BY plan_id ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return plans;
    }

    sqlite3_bind_int64(stmt, 1, department_id);
    bind_text(stmt, 2, format_date(end));
    bind_text(stmt, 3, format_date(start));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SchedulePlan p;
        p.plan_id = sqlite3_column_int64(stmt, 0);
        p.department_id = sqlite3_column_int64(stmt, 1);
        const auto target = parse_plan_target(column_text(stmt, 2));
        const auto start_date = parse_date(column_text(stmt, 7));
        const auto end_date = parse_date(column_text(stmt, 8));
        if (!target || !start_date || !end_date) {
            std::cerr << "Skip plan " << p.plan_id << ": bad target or date value" << std::endl;
            continue;
        }
        p.target_type = *target;
        p.shift_id = column_optional_int64(stmt, 3);
        p.daily_minutes_planned = column_optional_int(stmt, 4);
        p.break_minutes = column_optional_int(stmt, 5);
        p.grace_minutes = column_optional_int(stmt, 6);
        p.start_date = *start_date;
        p.end_date = *end_date;
        p.is_locked = sqlite3_column_int(stmt, 9) != 0;
        p.is_active = sqlite3_column_int(stmt, 10) != 0;
        p.updated_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 11));
        plans.push_back(p);
    }
    sqlite3_finalize(stmt);

    for (auto& plan : plans) {
        load_plan_employees(db, plan);
    }
    return plans;
}

} // namespace db
