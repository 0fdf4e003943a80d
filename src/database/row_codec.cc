/**
 * @file row_codec.cc
 * @brief DAO 共用列读写辅助实现
 */

#include "database/row_codec.h"

#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace db {

std::string format_date(const Date& day) {
    return boost::gregorian::to_iso_extended_string(day);
}

std::optional<Date> parse_date(const std::string& text) {
    // from_simple_string 接受 "2026-02-10"，格式或取值非法时抛异常
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    try {
        return boost::gregorian::from_simple_string(text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_minute_of_day(int minute_of_day) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d", (minute_of_day / 60) % 24, minute_of_day % 60);
    return buffer;
}

std::optional<int> parse_minute_of_day(const std::string& text) {
    int hour = -1;
    int minute = -1;
    char tail = 0;
    if (std::sscanf(text.c_str(), "%d:%d%c", &hour, &minute, &tail) != 2) {
        return std::nullopt;
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        return std::nullopt;
    }
    return hour * 60 + minute;
}

std::string join_event_flags(const std::set<std::string>& flags) {
    std::string text;
    for (const auto& flag : flags) {
        if (!text.empty()) text += ",";
        text += flag;
    }
    return text;
}

std::set<std::string> split_event_flags(const std::string& text) {
    std::set<std::string> flags;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (!item.empty()) flags.insert(item);
    }
    return flags;
}

void bind_optional_int64(sqlite3_stmt* stmt, int index, const std::optional<int64_t>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_optional_int(sqlite3_stmt* stmt, int index, const std::optional<int>& value) {
    if (value) {
        sqlite3_bind_int(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_optional_double(sqlite3_stmt* stmt, int index, const std::optional<double>& value) {
    if (value) {
        sqlite3_bind_double(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::optional<int64_t> column_optional_int64(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt, index);
}

std::optional<int> column_optional_int(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int(stmt, index);
}

std::optional<double> column_optional_double(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(stmt, index);
}

std::string column_text(sqlite3_stmt* stmt, int index) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
    return text ? text : "";
}

} // namespace db
