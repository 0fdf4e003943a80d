/**
 * @file attendance_dao.cc
 * @brief 打卡事件数据访问对象实现
 */

#include "database/attendance_dao.h"
#include "database/database_manager.h"
#include "database/row_codec.h"
#include <iostream>

namespace db {

namespace {

const char* kEventColumns =
    "event_id, employee_id, event_type, ts_utc, lat, lon, flags, shift_id, source, created_by_admin, deleted_at";

std::optional<AttendanceEvent> read_event(sqlite3_stmt* stmt) {
    AttendanceEvent e;
    e.event_id = sqlite3_column_int64(stmt, 0);
    e.employee_id = sqlite3_column_int64(stmt, 1);

    const int type = sqlite3_column_int(stmt, 2);
    if (type != static_cast<int>(EventType::In) && type != static_cast<int>(EventType::Out)) {
        std::cerr << "Skip event " << e.event_id << ": unknown event_type " << type << std::endl;
        return std::nullopt;
    }
    e.type = static_cast<EventType>(type);
    e.ts_utc = static_cast<std::time_t>(sqlite3_column_int64(stmt, 3));
    e.lat = column_optional_double(stmt, 4);
    e.lon = column_optional_double(stmt, 5);
    e.flags = split_event_flags(column_text(stmt, 6));
    e.shift_id = column_optional_int64(stmt, 7);

    const auto source = parse_event_source(column_text(stmt, 8));
    if (!source) {
        std::cerr << "Skip event " << e.event_id << ": unknown source" << std::endl;
        return std::nullopt;
    }
    e.source = *source;
    e.created_by_admin = sqlite3_column_int(stmt, 9) != 0;
    if (auto deleted = column_optional_int64(stmt, 10)) {
        e.deleted_at = static_cast<std::time_t>(*deleted);
    }
    return e;
}

} // namespace

int64_t AttendanceDao::add_event(const AttendanceEvent& event) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql =
        "INSERT INTO attendance_events (employee_id, event_type, ts_utc, lat, lon, flags, shift_id, source, created_by_admin) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, event.employee_id);
    sqlite3_bind_int(stmt, 2, static_cast<int>(event.type));
    sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(event.ts_utc));
    bind_optional_double(stmt, 4, event.lat);
    bind_optional_double(stmt, 5, event.lon);
    bind_text(stmt, 6, join_event_flags(event.flags));
    bind_optional_int64(stmt, 7, event.shift_id);
    bind_text(stmt, 8, to_string(event.source));
    sqlite3_bind_int(stmt, 9, event.created_by_admin ? 1 : 0);

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert event failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

bool AttendanceDao::soft_delete_event(int64_t event_id, std::time_t deleted_at) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "UPDATE attendance_events SET deleted_at = ? WHERE event_id = ? AND deleted_at IS NULL";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(deleted_at));
    sqlite3_bind_int64(stmt, 2, event_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    if (!success) {
        std::cerr << "Delete event failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);
    return success && sqlite3_changes(db) > 0;
}

std::optional<AttendanceEvent> AttendanceDao::get_event(int64_t event_id) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const std::string sql = std::string("SELECT ") + kEventColumns + " FROM attendance_events WHERE event_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, event_id);

    std::optional<AttendanceEvent> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_event(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<AttendanceEvent> AttendanceDao::get_events_by_employee(int64_t employee_id, std::time_t start_time, std::time_t end_time) {
    std::vector<AttendanceEvent> events;
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return events;

    const std::string sql = std::string("SELECT ") + kEventColumns +
        " FROM attendance_events WHERE employee_id = ? AND ts_utc >= ? AND ts_utc < ? AND deleted_at IS NULL"
        " ORDER BY ts_utc ASC, event_id ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return events;
    }

    sqlite3_bind_int64(stmt, 1, employee_id);
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(start_time));
    sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(end_time));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        if (auto event = read_event(stmt)) {
            events.push_back(*event);
        }
    }

    sqlite3_finalize(stmt);
    return events;
}

} // namespace db
