/**
 * @file rule_dao.cc
 * @brief 部门规则与班次数据访问对象实现
 * @details 班次起止时间以本地 "HH:MM" 文本存储。
 */

#include "database/rule_dao.h"
#include "database/database_manager.h"
#include "database/row_codec.h"
#include <iostream>

namespace db {

bool RuleDao::upsert_work_rule(const WorkRule& rule) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql =
        "INSERT INTO work_rules (department_id, daily_minutes_planned, break_minutes, grace_minutes) "
        "VALUES (?, ?, ?, ?) "
        "ON CONFLICT(department_id) DO UPDATE SET daily_minutes_planned=excluded.daily_minutes_planned, "
        "break_minutes=excluded.break_minutes, grace_minutes=excluded.grace_minutes";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    sqlite3_bind_int64(stmt, 1, rule.department_id);
    sqlite3_bind_int(stmt, 2, rule.daily_minutes_planned);
    sqlite3_bind_int(stmt, 3, rule.break_minutes);
    sqlite3_bind_int(stmt, 4, rule.grace_minutes);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    if (!success) {
        std::cerr << "Save work rule failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);
    return success;
}

std::optional<WorkRule> RuleDao::get_work_rule(int64_t department_id) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const char* sql =
        "SELECT department_id, daily_minutes_planned, break_minutes, grace_minutes FROM work_rules WHERE department_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, department_id);

    std::optional<WorkRule> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        WorkRule r;
        r.department_id = sqlite3_column_int64(stmt, 0);
        r.daily_minutes_planned = sqlite3_column_int(stmt, 1);
        r.break_minutes = sqlite3_column_int(stmt, 2);
        r.grace_minutes = sqlite3_column_int(stmt, 3);
        result = r;
    }

    sqlite3_finalize(stmt);
    return result;
}

bool RuleDao::upsert_weekly_rule(const WeeklyRule& rule) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    if (rule.weekday < 0 || rule.weekday > 6) {
        std::cerr << "Invalid weekday: " << rule.weekday << std::endl;
        return false;
    }

    const char* sql =
        "INSERT INTO department_weekly_rules (department_id, weekday, is_workday, planned_minutes, break_minutes) "
        "VALUES (?, ?, ?, ?, ?) "
        "ON CONFLICT(department_id, weekday) DO UPDATE SET is_workday=excluded.is_workday, "
        "planned_minutes=excluded.planned_minutes, break_minutes=excluded.break_minutes";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    sqlite3_bind_int64(stmt, 1, rule.department_id);
    sqlite3_bind_int(stmt, 2, rule.weekday);
    sqlite3_bind_int(stmt, 3, rule.is_workday ? 1 : 0);
    sqlite3_bind_int(stmt, 4, rule.planned_minutes);
    sqlite3_bind_int(stmt, 5, rule.break_minutes);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    if (!success) {
        std::cerr << "Save weekly rule failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);
    return success;
}

std::vector<WeeklyRule> RuleDao::get_weekly_rules(int64_t department_id) {
    std::vector<WeeklyRule> rules;
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return rules;

    const char* sql =
        "SELECT department_id, weekday, is_workday, planned_minutes, break_minutes "
        "FROM department_weekly_rules WHERE department_id = ? ORDER BY weekday ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return rules;
    }

    sqlite3_bind_int64(stmt, 1, department_id);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        WeeklyRule r;
        r.department_id = sqlite3_column_int64(stmt, 0);
        r.weekday = sqlite3_column_int(stmt, 1);
        r.is_workday = sqlite3_column_int(stmt, 2) != 0;
        r.planned_minutes = sqlite3_column_int(stmt, 3);
        r.break_minutes = sqlite3_column_int(stmt, 4);
        rules.push_back(r);
    }

    sqlite3_finalize(stmt);
    return rules;
}

int64_t RuleDao::add_shift(const DepartmentShift& shift) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql =
        "INSERT INTO department_shifts (department_id, name, start_time_local, end_time_local, break_minutes, is_active) "
        "VALUES (?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, shift.department_id);
    bind_text(stmt, 2, shift.name);
    bind_text(stmt, 3, format_minute_of_day(shift.start_minute_local));
    bind_text(stmt, 4, format_minute_of_day(shift.end_minute_local));
    sqlite3_bind_int(stmt, 5, shift.break_minutes);
    sqlite3_bind_int(stmt, 6, shift.is_active ? 1 : 0);

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert shift failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

bool RuleDao::set_shift_active(int64_t shift_id, bool is_active) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "UPDATE department_shifts SET is_active = ? WHERE shift_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    sqlite3_bind_int(stmt, 1, is_active ? 1 : 0);
    sqlite3_bind_int64(stmt, 2, shift_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    sqlite3_finalize(stmt);
    return success && sqlite3_changes(db) > 0;
}

std::vector<DepartmentShift> RuleDao::get_department_shifts(int64_t department_id) {
    std::vector<DepartmentShift> shifts;
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return shifts;

    const char* sql =
        "SELECT shift_id, department_id, name, start_time_local, end_time_local, break_minutes, is_active "
        "FROM department_shifts WHERE department_id = ? ORDER BY shift_id ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return shifts;
    }

    sqlite3_bind_int64(stmt, 1, department_id);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        DepartmentShift s;
        s.shift_id = sqlite3_column_int64(stmt, 0);
        s.department_id = sqlite3_column_int64(stmt, 1);
        s.name = column_text(stmt, 2);
        const auto start = parse_minute_of_day(column_text(stmt, 3));
        const auto end = parse_minute_of_day(column_text(stmt, 4));
        if (!start || !end) {
            std::cerr << "Skip shift " << s.shift_id << ": bad time value" << std::endl;
            continue;
        }
        s.start_minute_local = *start;
        s.end_minute_local = *end;
        s.break_minutes = sqlite3_column_int(stmt, 5);
        s.is_active = sqlite3_column_int(stmt, 6) != 0;
        shifts.push_back(s);
    }

    sqlite3_finalize(stmt);
    return shifts;
}

} // namespace db
