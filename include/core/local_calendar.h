/**
 * @file local_calendar.h
 * @brief 考勤本地日历：UTC 时间戳与本地日期之间的换算
 * @details 时区在构造时注入，每个服务实例持有一份，不使用进程级缓存。
 *          配置变更时重新构造即可。
 */

#ifndef LOCAL_CALENDAR_H
#define LOCAL_CALENDAR_H

#include <string>
#include <utility>
#include <ctime>
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/local_time/local_time_types.hpp>
#include <boost/date_time/local_time/tz_database.hpp>
#include "config.h"

namespace core {

class LocalCalendar {
public:
    /**
     * @param tz_spec 时区名或 POSIX TZ 串 (如 "EST5EDT,M3.2.0,M11.1.0")。
     *                查找顺序: Config::TimeZone::ALIASES，时区库区域名，POSIX 串。
     *                为空或无法识别时回退到 Config::Default::ATTENDANCE_TIMEZONE
     * @param zonespec_path Boost zonespec CSV 路径
     */
    explicit LocalCalendar(const std::string& tz_spec,
                           const std::string& zonespec_path = Config::Path::ZONESPEC);

    // 实际生效的时区配置
    const std::string& zone_spec() const { return zone_spec_; }

    // UTC 时间戳所在的本地日期
    boost::gregorian::date local_date(std::time_t ts_utc) const;

    // 本地日期 + 零点起分钟数 -> UTC 时间戳
    std::time_t to_utc(const boost::gregorian::date& day, int minute_of_day) const;

    // 本地日期区间 [start, end] 对应的 UTC 半开区间 [first, second)
    std::pair<std::time_t, std::time_t> utc_bounds(const boost::gregorian::date& start,
                                                   const boost::gregorian::date& end) const;

    // 0=周一 .. 6=周日
    static int weekday_index(const boost::gregorian::date& day);

    // 所在 ISO 周的周一
    static boost::gregorian::date week_start(const boost::gregorian::date& day);

private:
    bool load_zone(const std::string& spec);

    boost::local_time::tz_database regions_;
    boost::local_time::time_zone_ptr zone_;
    std::string zone_spec_;
};

} // namespace core

#endif // LOCAL_CALENDAR_H
