/**
 * @file labor_profile_dao.cc
 * @brief 劳动法参数数据访问对象实现
 */

#include "database/labor_profile_dao.h"
#include "database/database_manager.h"
#include "database/row_codec.h"
#include <iostream>

namespace db {

int64_t LaborProfileDao::add_profile(const LaborProfile& profile) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql =
        "INSERT INTO labor_profiles (name, weekly_normal_minutes, daily_max_minutes, enforce_min_break_rules, "
        "night_work_max_minutes, night_work_exceptions_note_enabled, overtime_annual_cap_minutes, "
        "overtime_premium, extra_work_premium, overtime_rounding_mode) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    bind_text(stmt, 1, profile.name);
    sqlite3_bind_int(stmt, 2, profile.weekly_normal_minutes);
    sqlite3_bind_int(stmt, 3, profile.daily_max_minutes);
    sqlite3_bind_int(stmt, 4, profile.enforce_min_break_rules ? 1 : 0);
    sqlite3_bind_int(stmt, 5, profile.night_work_max_minutes);
    sqlite3_bind_int(stmt, 6, profile.night_work_exceptions_note_enabled ? 1 : 0);
    sqlite3_bind_int(stmt, 7, profile.overtime_annual_cap_minutes);
    sqlite3_bind_double(stmt, 8, profile.overtime_premium);
    sqlite3_bind_double(stmt, 9, profile.extra_work_premium);
    bind_text(stmt, 10, to_string(profile.overtime_rounding_mode));

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert labor profile failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

std::optional<LaborProfile> LaborProfileDao::get_active_profile() {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const char* sql =
        "SELECT profile_id, name, weekly_normal_minutes, daily_max_minutes, enforce_min_break_rules, "
        "night_work_max_minutes, night_work_exceptions_note_enabled, overtime_annual_cap_minutes, "
        "overtime_premium, extra_work_premium, overtime_rounding_mode FROM labor_profiles "
        "ORDER BY profile_id ASC LIMIT 1";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return std::nullopt;
    }

    std::optional<LaborProfile> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        LaborProfile p;
        p.profile_id = sqlite3_column_int64(stmt, 0);
        p.name = column_text(stmt, 1);
        p.weekly_normal_minutes = sqlite3_column_int(stmt, 2);
        p.daily_max_minutes = sqlite3_column_int(stmt, 3);
        p.enforce_min_break_rules = sqlite3_column_int(stmt, 4) != 0;
        p.night_work_max_minutes = sqlite3_column_int(stmt, 5);
        p.night_work_exceptions_note_enabled = sqlite3_column_int(stmt, 6) != 0;
        p.overtime_annual_cap_minutes = sqlite3_column_int(stmt, 7);
        p.overtime_premium = sqlite3_column_double(stmt, 8);
        p.extra_work_premium = sqlite3_column_double(stmt, 9);
        const std::string mode = column_text(stmt, 10);
        if (auto parsed = parse_overtime_rounding(mode)) {
            p.overtime_rounding_mode = *parsed;
        } else {
            std::cerr << "Unknown overtime rounding mode '" << mode << "', using OFF" << std::endl;
        }
        result = p;
    }

    sqlite3_finalize(stmt);
    return result;
}

} // namespace db
