/**
 * @file row_codec.h
 * @brief DAO 共用的列读写辅助：可空列、ISO 日期文本、HH:MM 时间文本、事件标记文本
 */

#ifndef ROW_CODEC_H
#define ROW_CODEC_H

#include <sqlite3.h>
#include <string>
#include <set>
#include <optional>
#include <cstdint>

#include "database/database_types.h"

namespace db {

// 日期 <-> "YYYY-MM-DD"，解析失败返回 std::nullopt
std::string format_date(const Date& day);
std::optional<Date> parse_date(const std::string& text);

// 零点起分钟数 <-> "HH:MM"
std::string format_minute_of_day(int minute_of_day);
std::optional<int> parse_minute_of_day(const std::string& text);

// 事件标记 <-> 逗号分隔文本
std::string join_event_flags(const std::set<std::string>& flags);
std::set<std::string> split_event_flags(const std::string& text);

void bind_optional_int64(sqlite3_stmt* stmt, int index, const std::optional<int64_t>& value);
void bind_optional_int(sqlite3_stmt* stmt, int index, const std::optional<int>& value);
void bind_optional_double(sqlite3_stmt* stmt, int index, const std::optional<double>& value);
void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);

std::optional<int64_t> column_optional_int64(sqlite3_stmt* stmt, int index);
std::optional<int> column_optional_int(sqlite3_stmt* stmt, int index);
std::optional<double> column_optional_double(sqlite3_stmt* stmt, int index);
std::string column_text(sqlite3_stmt* stmt, int index);

} // namespace db

#endif // ROW_CODEC_H
