/**
 * @file leave_dao.cc
 * @brief 请假数据访问对象实现
 */

#include "database/leave_dao.h"
#include "database/database_manager.h"
#include "database/row_codec.h"
#include <iostream>

namespace db {

int64_t LeaveDao::add_leave(const Leave& leave) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    if (leave.end_date < leave.start_date) {
        std::cerr << "Leave end date before start date" << std::endl;
        return -1;
    }

    const char* sql =
        "INSERT INTO leaves (employee_id, start_date, end_date, leave_type, status, note) VALUES (?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, leave.employee_id);
    bind_text(stmt, 2, format_date(leave.start_date));
    bind_text(stmt, 3, format_date(leave.end_date));
    bind_text(stmt, 4, to_string(leave.type));
    bind_text(stmt, 5, to_string(leave.status));
    bind_text(stmt, 6, leave.note);

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert leave failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

bool LeaveDao::update_status(int64_t leave_id, LeaveStatus status) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "UPDATE leaves SET status = ? WHERE leave_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }

    bind_text(stmt, 1, to_string(status));
    sqlite3_bind_int64(stmt, 2, leave_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE);
    sqlite3_finalize(stmt);
    return success && sqlite3_changes(db) > 0;
}

std::vector<Leave> LeaveDao::get_approved_leaves(int64_t employee_id, const Date& start, const Date& end) {
    std::vector<Leave> leaves;
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return leaves;

    const char* sql =
        "SELECT leave_id, employee_id, start_date, end_date, leave_type, status, note FROM leaves "
        "WHERE employee_id = ? AND status = 'APPROVED' AND start_date <= ? AND end_date >= ? "
        "ORDER BY start_date ASC, leave_id ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return leaves;
    }

    sqlite3_bind_int64(stmt, 1, employee_id);
    bind_text(stmt, 2, format_date(end));
    bind_text(stmt, 3, format_date(start));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Leave l;
        l.leave_id = sqlite3_column_int64(stmt, 0);
        l.employee_id = sqlite3_column_int64(stmt, 1);
        const auto start_date = parse_date(column_text(stmt, 2));
        const auto end_date = parse_date(column_text(stmt, 3));
        const auto type = parse_leave_type(column_text(stmt, 4));
        const auto status = parse_leave_status(column_text(stmt, 5));
        if (!start_date || !end_date || !type || !status) {
            std::cerr << "Skip leave " << l.leave_id << ": bad date or enum value" << std::endl;
            continue;
        }
        l.start_date = *start_date;
        l.end_date = *end_date;
        l.type = *type;
        l.status = *status;
        l.note = column_text(stmt, 6);
        leaves.push_back(l);
    }

    sqlite3_finalize(stmt);
    return leaves;
}

} // namespace db
