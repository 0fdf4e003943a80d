/**
 * @file database_manager.cc
 * @brief 数据库连接管理实现
 * @details 负责 SQLite 数据库的打开、关闭、事务处理以及考勤表结构的自动创建。
 *          日期以 ISO 文本 (YYYY-MM-DD) 存储，时间戳为 UTC 秒。
 */

#include "database/database_manager.h"
#include <iostream>

namespace db {

DatabaseManager& DatabaseManager::instance() {
    static DatabaseManager instance;
    return instance;
}

DatabaseManager::DatabaseManager() {}

DatabaseManager::~DatabaseManager() {
    close();
}

bool DatabaseManager::open(const std::string& path) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (db_) {
        return true; // 已经打开
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::cerr << "Can't open database: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // 开启外键约束支持
    if (!execute("PRAGMA foreign_keys = ON;") || !create_tables()) {
        lock.unlock();
        close();
        return false;
    }

    std::cout << "Database opened: " << path << std::endl;
    return true;
}

void DatabaseManager::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool DatabaseManager::execute(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error: " << (err_msg ? err_msg : sqlite3_errmsg(db_)) << "\nSQL: " << sql << std::endl;
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool DatabaseManager::begin_transaction() {
    return execute("BEGIN TRANSACTION;");
}

bool DatabaseManager::commit_transaction() {
    return execute("COMMIT;");
}

bool DatabaseManager::rollback_transaction() {
    return execute("ROLLBACK;");
}

bool DatabaseManager::create_tables() {
    const char* sql_departments =
        "CREATE TABLE IF NOT EXISTS departments ("
        "department_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "name TEXT NOT NULL,"
        "region_id INTEGER"
        ");";

    const char* sql_employees =
        "CREATE TABLE IF NOT EXISTS employees ("
        "employee_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "full_name TEXT NOT NULL,"
        "department_id INTEGER,"
        "shift_id INTEGER,"
        "contract_weekly_minutes INTEGER,"
        "is_active INTEGER NOT NULL DEFAULT 1,"
        "FOREIGN KEY(department_id) REFERENCES departments(department_id) ON DELETE SET NULL"
        ");";

    const char* sql_work_rules =
        "CREATE TABLE IF NOT EXISTS work_rules ("
        "department_id INTEGER PRIMARY KEY,"
        "daily_minutes_planned INTEGER NOT NULL,"
        "break_minutes INTEGER NOT NULL,"
        "grace_minutes INTEGER NOT NULL,"
        "FOREIGN KEY(department_id) REFERENCES departments(department_id) ON DELETE CASCADE"
        ");";

    const char* sql_weekly_rules =
        "CREATE TABLE IF NOT EXISTS department_weekly_rules ("
        "department_id INTEGER NOT NULL,"
        "weekday INTEGER NOT NULL,"
        "is_workday INTEGER NOT NULL DEFAULT 1,"
        "planned_minutes INTEGER NOT NULL,"
        "break_minutes INTEGER NOT NULL,"
        "PRIMARY KEY(department_id, weekday),"
        "FOREIGN KEY(department_id) REFERENCES departments(department_id) ON DELETE CASCADE"
        ");";

    const char* sql_shifts =
        "CREATE TABLE IF NOT EXISTS department_shifts ("
        "shift_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "department_id INTEGER NOT NULL,"
        "name TEXT NOT NULL,"
        "start_time_local TEXT NOT NULL,"
        "end_time_local TEXT NOT NULL,"
        "break_minutes INTEGER NOT NULL,"
        "is_active INTEGER NOT NULL DEFAULT 1,"
        "FOREIGN KEY(department_id) REFERENCES departments(department_id) ON DELETE CASCADE"
        ");";

    const char* sql_plans =
        "CREATE TABLE IF NOT EXISTS department_schedule_plans ("
        "plan_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "department_id INTEGER NOT NULL,"
        "target_type TEXT NOT NULL,"
        "shift_id INTEGER,"
        "daily_minutes_planned INTEGER,"
        "break_minutes INTEGER,"
        "grace_minutes INTEGER,"
        "start_date TEXT NOT NULL,"
        "end_date TEXT NOT NULL,"
        "is_locked INTEGER NOT NULL DEFAULT 0,"
        "is_active INTEGER NOT NULL DEFAULT 1,"
        "updated_at INTEGER NOT NULL DEFAULT 0,"
        "FOREIGN KEY(department_id) REFERENCES departments(department_id) ON DELETE CASCADE"
        ");";

    const char* sql_plan_employees =
        "CREATE TABLE IF NOT EXISTS department_schedule_plan_employees ("
        "plan_id INTEGER NOT NULL,"
        "employee_id INTEGER NOT NULL,"
        "PRIMARY KEY(plan_id, employee_id),"
        "FOREIGN KEY(plan_id) REFERENCES department_schedule_plans(plan_id) ON DELETE CASCADE"
        ");";

    const char* sql_overrides =
        "CREATE TABLE IF NOT EXISTS manual_day_overrides ("
        "override_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "employee_id INTEGER NOT NULL,"
        "day_date TEXT NOT NULL,"
        "in_ts INTEGER,"
        "out_ts INTEGER,"
        "is_absent INTEGER NOT NULL DEFAULT 0,"
        "rule_source_override TEXT,"
        "rule_shift_id_override INTEGER,"
        "note TEXT,"
        "created_by TEXT NOT NULL DEFAULT 'admin',"
        "UNIQUE(employee_id, day_date),"
        "FOREIGN KEY(employee_id) REFERENCES employees(employee_id) ON DELETE CASCADE"
        ");";

    const char* sql_events =
        "CREATE TABLE IF NOT EXISTS attendance_events ("
        "event_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "employee_id INTEGER NOT NULL,"
        "event_type INTEGER NOT NULL,"
        "ts_utc INTEGER NOT NULL,"
        "lat REAL,"
        "lon REAL,"
        "flags TEXT,"
        "shift_id INTEGER,"
        "source TEXT NOT NULL DEFAULT 'DEVICE',"
        "created_by_admin INTEGER NOT NULL DEFAULT 0,"
        "deleted_at INTEGER,"
        "FOREIGN KEY(employee_id) REFERENCES employees(employee_id) ON DELETE CASCADE"
        ");";

    const char* sql_leaves =
        "CREATE TABLE IF NOT EXISTS leaves ("
        "leave_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "employee_id INTEGER NOT NULL,"
        "start_date TEXT NOT NULL,"
        "end_date TEXT NOT NULL,"
        "leave_type TEXT NOT NULL,"
        "status TEXT NOT NULL,"
        "note TEXT,"
        "FOREIGN KEY(employee_id) REFERENCES employees(employee_id) ON DELETE CASCADE"
        ");";

    const char* sql_labor_profiles =
        "CREATE TABLE IF NOT EXISTS labor_profiles ("
        "profile_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "name TEXT NOT NULL,"
        "weekly_normal_minutes INTEGER NOT NULL,"
        "daily_max_minutes INTEGER NOT NULL,"
        "enforce_min_break_rules INTEGER NOT NULL DEFAULT 0,"
        "night_work_max_minutes INTEGER NOT NULL,"
        "night_work_exceptions_note_enabled INTEGER NOT NULL DEFAULT 1,"
        "overtime_annual_cap_minutes INTEGER NOT NULL,"
        "overtime_premium REAL NOT NULL,"
        "extra_work_premium REAL NOT NULL,"
        "overtime_rounding_mode TEXT NOT NULL DEFAULT 'OFF'"
        ");";

    // 索引
    const char* sql_idx_events = "CREATE INDEX IF NOT EXISTS idx_events_employee_ts ON attendance_events(employee_id, ts_utc);";
    const char* sql_idx_leaves = "CREATE INDEX IF NOT EXISTS idx_leaves_employee ON leaves(employee_id, start_date);";
    const char* sql_idx_employees = "CREATE INDEX IF NOT EXISTS idx_employees_department ON employees(department_id);";

    return execute(sql_departments) &&
           execute(sql_employees) &&
           execute(sql_work_rules) &&
           execute(sql_weekly_rules) &&
           execute(sql_shifts) &&
           execute(sql_plans) &&
           execute(sql_plan_employees) &&
           execute(sql_overrides) &&
           execute(sql_events) &&
           execute(sql_leaves) &&
           execute(sql_labor_profiles) &&
           execute(sql_idx_events) &&
           execute(sql_idx_leaves) &&
           execute(sql_idx_employees);
}

} // namespace db
