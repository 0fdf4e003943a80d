/**
 * @file manual_override_dao.cc
 * @brief 人工日覆盖数据访问对象实现
 */

#include "database/manual_override_dao.h"
#include "database/database_manager.h"
#include "database/row_codec.h"
#include <iostream>

namespace db {

namespace {

const char* kOverrideColumns =
    "override_id, employee_id, day_date, in_ts, out_ts, is_absent, rule_source_override, "
    "rule_shift_id_override, note, created_by";

std::optional<ManualDayOverride> read_override(sqlite3_stmt* stmt) {
    ManualDayOverride o;
    o.override_id = sqlite3_column_int64(stmt, 0);
    o.employee_id = sqlite3_column_int64(stmt, 1);
    const auto day = parse_date(column_text(stmt, 2));
    if (!day) {
        std::cerr << "Skip override " << o.override_id << ": bad day_date" << std::endl;
        return std::nullopt;
    }
    o.day_date = *day;
    if (auto in_ts = column_optional_int64(stmt, 3)) o.in_ts = static_cast<std::time_t>(*in_ts);
    if (auto out_ts = column_optional_int64(stmt, 4)) o.out_ts = static_cast<std::time_t>(*out_ts);
    o.is_absent = sqlite3_column_int(stmt, 5) != 0;
    o.rule_source_override = column_text(stmt, 6);
    o.rule_shift_id_override = column_optional_int64(stmt, 7);
    o.note = column_text(stmt, 8);
    o.created_by = column_text(stmt, 9);
    return o;
}

std::optional<int64_t> to_column(const std::optional<std::time_t>& ts) {
    if (!ts) return std::nullopt;
    return static_cast<int64_t>(*ts);
}

} // namespace

int64_t ManualOverrideDao::upsert_override(const ManualDayOverride& row) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql =
        "INSERT INTO manual_day_overrides (employee_id, day_date, in_ts, out_ts, is_absent, rule_source_override, "
        "rule_shift_id_override, note, created_by) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(employee_id, day_date) DO UPDATE SET in_ts=excluded.in_ts, out_ts=excluded.out_ts, "
        "is_absent=excluded.is_absent, rule_source_override=excluded.rule_source_override, "
        "rule_shift_id_override=excluded.rule_shift_id_override, note=excluded.note, created_by=excluded.created_by";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, row.employee_id);
    bind_text(stmt, 2, format_date(row.day_date));
    bind_optional_int64(stmt, 3, to_column(row.in_ts));
    bind_optional_int64(stmt, 4, to_column(row.out_ts));
    sqlite3_bind_int(stmt, 5, row.is_absent ? 1 : 0);
    if (row.rule_source_override.empty()) {
        sqlite3_bind_null(stmt, 6);
    } else {
        bind_text(stmt, 6, row.rule_source_override);
    }
    bind_optional_int64(stmt, 7, row.rule_shift_id_override);
    bind_text(stmt, 8, row.note);
    bind_text(stmt, 9, row.created_by);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    if (!success) {
        std::cerr << "Save override failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);
    if (!success) return -1;

    // 更新路径下 last_insert_rowid 不可靠，回查主键
    auto saved = get_override(row.employee_id, row.day_date);
    return saved ? saved->override_id : -1;
}

bool ManualOverrideDao::delete_override(int64_t employee_id, const Date& day) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "DELETE FROM manual_day_overrides WHERE employee_id = ? AND day_date = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    sqlite3_bind_int64(stmt, 1, employee_id);
    bind_text(stmt, 2, format_date(day));

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    sqlite3_finalize(stmt);
    return success && sqlite3_changes(db) > 0;
}

std::optional<ManualDayOverride> ManualOverrideDao::get_override(int64_t employee_id, const Date& day) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const std::string sql = std::string("SELECT ") + kOverrideColumns +
        " FROM manual_day_overrides WHERE employee_id = ? AND day_date = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, employee_id);
    bind_text(stmt, 2, format_date(day));

    std::optional<ManualDayOverride> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_override(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<ManualDayOverride> ManualOverrideDao::get_overrides(int64_t employee_id, const Date& start, const Date& end) {
    std::vector<ManualDayOverride> rows;
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return rows;

    const std::string sql = std::string("SELECT ") + kOverrideColumns +
        " FROM manual_day_overrides WHERE employee_id = ? AND day_date >= ? AND day_date <= ?"
        " ORDER BY day_date ASC, override_id ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return rows;
    }

    sqlite3_bind_int64(stmt, 1, employee_id);
    bind_text(stmt, 2, format_date(start));
    bind_text(stmt, 3, format_date(end));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        if (auto row = read_override(stmt)) {
            rows.push_back(*row);
        }
    }

    sqlite3_finalize(stmt);
    return rows;
}

} // namespace db
