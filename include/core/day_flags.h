/**
 * @file day_flags.h
 * @brief 日记录标记名称与有序去重累加器
 */

#ifndef DAY_FLAGS_H
#define DAY_FLAGS_H

#include <set>
#include <string>
#include <vector>

namespace core {

namespace flags {
    // 打卡配对
    constexpr const char* MISSING_IN = "MISSING_IN";
    constexpr const char* MISSING_OUT = "MISSING_OUT";
    constexpr const char* OPEN_SHIFT_ACTIVE = "OPEN_SHIFT_ACTIVE";
    constexpr const char* CROSS_MIDNIGHT_CHECKOUT = "CROSS_MIDNIGHT_CHECKOUT";
    constexpr const char* MANUAL_EVENT = "MANUAL_EVENT";

    // 日状态
    constexpr const char* MANUAL_OVERRIDE = "MANUAL_OVERRIDE";
    constexpr const char* ABSENT_MARKED = "ABSENT_MARKED";
    constexpr const char* LEAVE_DAY = "LEAVE_DAY";
    constexpr const char* OFF_DAY = "OFF_DAY";
    constexpr const char* OFF_DAY_WORKED = "OFF_DAY_WORKED";
    constexpr const char* UNDERWORKED = "UNDERWORKED";

    // 规则来源
    constexpr const char* RULE_OVERRIDE_INVALID = "RULE_OVERRIDE_INVALID";
    constexpr const char* RULE_SOURCE_MANUAL_OVERRIDE = "RULE_SOURCE_MANUAL_OVERRIDE";
    constexpr const char* SHIFT_WEEKLY_RULE_OVERRIDE = "SHIFT_WEEKLY_RULE_OVERRIDE";
    constexpr const char* SCHEDULE_PLAN_APPLIED = "SCHEDULE_PLAN_APPLIED";
    constexpr const char* SCHEDULE_PLAN_SHIFT = "SCHEDULE_PLAN_SHIFT";
    constexpr const char* SCHEDULE_PLAN_RULE = "SCHEDULE_PLAN_RULE";
    constexpr const char* SCHEDULE_PLAN_LOCKED = "SCHEDULE_PLAN_LOCKED";
    constexpr const char* PLANNED_SHIFT_VIOLATION = "PLANNED_SHIFT_VIOLATION";

    // 合规 (同时汇总到周)
    constexpr const char* DAILY_MAX_EXCEEDED = "DAILY_MAX_EXCEEDED";
    constexpr const char* MIN_BREAK_NOT_MET = "MIN_BREAK_NOT_MET";
    constexpr const char* NIGHT_WORK_EXCEEDED = "NIGHT_WORK_EXCEEDED";
    constexpr const char* ANNUAL_OVERTIME_CAP_EXCEEDED = "ANNUAL_OVERTIME_CAP_EXCEEDED";

    // 事件自带标记
    constexpr const char* IS_NIGHT_SHIFT = "IS_NIGHT_SHIFT";
    constexpr const char* NIGHT_SHIFT = "NIGHT_SHIFT";

    bool is_compliance_flag(const std::string& flag);
}

/**
 * @brief 标记累加器：插入去重，输出按字典序排序
 */
class FlagSet {
public:
    void add(const std::string& flag) { flags_.insert(flag); }

    void add_all(const std::vector<std::string>& values) {
        flags_.insert(values.begin(), values.end());
    }

    bool contains(const std::string& flag) const { return flags_.count(flag) > 0; }

    std::vector<std::string> sorted() const {
        return std::vector<std::string>(flags_.begin(), flags_.end());
    }

private:
    std::set<std::string> flags_;
};

} // namespace core

#endif // DAY_FLAGS_H
