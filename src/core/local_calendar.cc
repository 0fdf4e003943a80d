/**
 * @file local_calendar.cc
 * @brief 考勤本地日历实现 (Boost.DateTime tz_database / posix_time_zone)
 */

#include "core/local_calendar.h"
#include "config.h"

#include <cctype>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <boost/make_shared.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/local_time/local_time.hpp>

namespace core {

namespace bg = boost::gregorian;
namespace bpt = boost::posix_time;
namespace blt = boost::local_time;

namespace {

const bpt::ptime kEpoch(bg::date(1970, 1, 1));

// 未给出切换规则时沿用 glibc 的默认规则
const char* const kDefaultDstRules = "M3.2.0,M11.1.0";

std::string resolve_alias(const std::string& name) {
    for (const auto& alias : Config::TimeZone::ALIASES) {
        if (name == alias.name) {
            return alias.posix_spec;
        }
    }
    return "";
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// 时区缩写: 至少 3 个字母，或 <...> 引用形式 (如 <+03>)
bool parse_abbrev(const std::string& text, size_t& pos, std::string& abbrev) {
    if (pos < text.size() && text[pos] == '<') {
        const auto close = text.find('>', pos);
        if (close == std::string::npos || close - pos - 1 < 3) return false;
        pos = close + 1;
        // Boost 只接受字母缩写，引用形式用占位名代替
        abbrev = "LMT";
        return true;
    }
    const size_t start = pos;
    while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) ++pos;
    if (pos - start < 3) return false;
    abbrev = text.substr(start, pos - start);
    return true;
}

// [+-]hh[:mm[:ss]] -> 秒
bool parse_offset(const std::string& text, size_t& pos, long& seconds) {
    int sign = 1;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        if (text[pos] == '-') sign = -1;
        ++pos;
    }
    long parts[3] = {0, 0, 0};
    for (int i = 0; i < 3; ++i) {
        if (i > 0) {
            if (pos >= text.size() || text[pos] != ':') break;
            ++pos;
        }
        const size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) && pos - start < 2) {
            parts[i] = parts[i] * 10 + (text[pos] - '0');
            ++pos;
        }
        if (pos == start) return false;
    }
    if (parts[0] > 24 || parts[1] > 59 || parts[2] > 59) return false;
    seconds = sign * (parts[0] * 3600 + parts[1] * 60 + parts[2]);
    return true;
}

std::string format_offset(long seconds) {
    const char sign = seconds < 0 ? '-' : '+';
    if (seconds < 0) seconds = -seconds;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%c%02ld:%02ld:%02ld", sign, seconds / 3600,
                  (seconds / 60) % 60, seconds % 60);
    return buf;
}

/**
 * @brief POSIX TZ 串转为 Boost posix_time_zone 格式
 * @details POSIX 偏移以 UTC 以西为正，Boost 相反；POSIX 的夏令时偏移是绝对值，
 *          Boost 需要相对标准时的调整量。没有显式偏移的串视为非法。
 * @return 转换结果，非法时返回空串
 */
std::string posix_to_boost(const std::string& spec) {
    size_t pos = 0;
    std::string std_abbrev;
    long std_offset = 0;
    if (!parse_abbrev(spec, pos, std_abbrev) || !parse_offset(spec, pos, std_offset)) {
        return "";
    }
    std::string result = std_abbrev + format_offset(-std_offset);
    if (pos == spec.size()) {
        return result;
    }

    std::string dst_abbrev;
    if (!parse_abbrev(spec, pos, dst_abbrev)) return "";
    long dst_offset = std_offset - 3600;
    if (pos < spec.size() && spec[pos] != ',') {
        if (!parse_offset(spec, pos, dst_offset)) return "";
    }
    result += dst_abbrev + format_offset(std_offset - dst_offset);

    if (pos == spec.size()) {
        return result + "," + kDefaultDstRules;
    }
    if (spec[pos] != ',') return "";
    const std::string rules = spec.substr(pos + 1);
    const auto comma = rules.find(',');
    if (comma == std::string::npos || comma == 0 || comma + 1 == rules.size() ||
        rules.find(',', comma + 1) != std::string::npos) {
        return "";
    }
    return result + "," + rules;
}

} // namespace

LocalCalendar::LocalCalendar(const std::string& tz_spec, const std::string& zonespec_path) {
    try {
        regions_.load_from_file(zonespec_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load timezone database '" << zonespec_path << "': " << e.what()
                  << std::endl;
    }

    const std::string requested = trim(tz_spec);
    if (!requested.empty() && load_zone(requested)) {
        return;
    }
    if (!requested.empty()) {
        std::cerr << "Invalid attendance timezone '" << requested << "', falling back to "
                  << Config::Default::ATTENDANCE_TIMEZONE << std::endl;
    }
    if (!load_zone(Config::Default::ATTENDANCE_TIMEZONE)) {
        // 默认时区在别名表内，正常不会走到这里
        zone_ = boost::make_shared<blt::posix_time_zone>("UTC+00");
        zone_spec_ = "UTC";
    }
}

bool LocalCalendar::load_zone(const std::string& spec) {
    std::string posix_spec = resolve_alias(spec);
    if (posix_spec.empty()) {
        blt::time_zone_ptr region = regions_.time_zone_from_region(spec);
        if (region) {
            zone_ = region;
            zone_spec_ = spec;
            return true;
        }
        posix_spec = spec;
    }

    const std::string boost_spec = posix_to_boost(posix_spec);
    if (boost_spec.empty()) {
        return false;
    }
    try {
        zone_ = boost::make_shared<blt::posix_time_zone>(boost_spec);
    } catch (const std::exception& e) {
        std::cerr << "Rejected timezone '" << spec << "': " << e.what() << std::endl;
        return false;
    }
    zone_spec_ = spec;
    return true;
}

bg::date LocalCalendar::local_date(std::time_t ts_utc) const {
    blt::local_date_time local(bpt::from_time_t(ts_utc), zone_);
    return local.local_time().date();
}

std::time_t LocalCalendar::to_utc(const bg::date& day, int minute_of_day) const {
    blt::local_date_time local(day, bpt::minutes(minute_of_day), zone_,
                               blt::local_date_time::NOT_DATE_TIME_ON_ERROR);
    bpt::ptime utc;
    if (local.is_not_a_date_time()) {
        // 夏令时切换造成的不存在/重复时刻，按标准时偏移换算
        utc = bpt::ptime(day, bpt::minutes(minute_of_day)) - zone_->base_utc_offset();
    } else {
        utc = local.utc_time();
    }
    return static_cast<std::time_t>((utc - kEpoch).total_seconds());
}

std::pair<std::time_t, std::time_t> LocalCalendar::utc_bounds(const bg::date& start,
                                                              const bg::date& end) const {
    return {to_utc(start, 0), to_utc(end + bg::days(1), 0)};
}

int LocalCalendar::weekday_index(const bg::date& day) {
    // Boost: 0=周日
    return (day.day_of_week().as_number() + 6) % 7;
}

bg::date LocalCalendar::week_start(const bg::date& day) {
    return day - bg::days(weekday_index(day));
}

} // namespace core
