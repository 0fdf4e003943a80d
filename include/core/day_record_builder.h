/**
 * @file day_record_builder.h
 * @brief 日记录生成：打卡配对、跨零点签退、未闭合班次，以及人工覆盖/请假/休息日优先级
 * @details 输入是一名员工在日期区间内已取出的全部数据，计算过程不访问数据库。
 *          区间内每个日历日输出恰好一条 DayRecord。
 */

#ifndef DAY_RECORD_BUILDER_H
#define DAY_RECORD_BUILDER_H

#include <vector>
#include <map>
#include <set>
#include <optional>

#include "core/local_calendar.h"
#include "core/report_types.h"
#include "core/rule_resolver.h"
#include "database/database_types.h"

namespace core {

/**
 * @brief 构建日记录所需的输入快照
 */
struct DayBuildInputs {
    db::Employee employee;
    db::WorkRule work_rule;
    std::vector<db::WeeklyRule> weekly_rules;
    std::vector<db::DepartmentShift> shifts;        // 含已停用班次
    std::vector<db::SchedulePlan> plans;
    std::vector<db::AttendanceEvent> events;
    std::vector<db::Leave> leaves;
    std::vector<db::ManualDayOverride> overrides;
    db::LaborProfile labor_profile;
};

class DayRecordBuilder {
public:
    DayRecordBuilder(const LocalCalendar& calendar, const DayBuildInputs& inputs);

    /**
     * @brief 生成 [start, end] 内每天的记录
     * @details 可重复调用，每次调用重新配对，结果相同。
     */
    std::vector<DayRecord> build(const db::Date& start, const db::Date& end);

private:
    struct DayEvents {
        std::vector<const db::AttendanceEvent*> ins;
        std::vector<const db::AttendanceEvent*> outs;
    };

    struct EventPair {
        const db::AttendanceEvent* first_in = nullptr;
        const db::AttendanceEvent* last_out = nullptr;
        bool cross_midnight = false;
        bool open_shift = false;
    };

    void index_inputs(const db::Date& start, const db::Date& end);
    EventPair resolve_event_pair(const db::Date& day);
    const db::DepartmentShift* find_shift(const std::optional<int64_t>& shift_id) const;
    const db::DepartmentShift* event_shift(const EventPair& pair) const;

    DayRecord build_override_day(const db::Date& day, const db::ManualDayOverride& override_row,
                                 const RuleResolution& rule, const std::vector<std::string>& rule_flags) const;
    DayRecord build_event_day(const db::Date& day, const EventPair& pair,
                              const RuleResolution& rule, const std::vector<std::string>& rule_flags) const;

    const LocalCalendar& calendar_;
    const DayBuildInputs& inputs_;

    std::map<db::Date, DayEvents> events_by_day_;
    std::map<db::Date, db::LeaveType> leave_by_day_;
    std::map<db::Date, const db::ManualDayOverride*> override_by_day_;
    std::map<int, const db::WeeklyRule*> weekly_rule_by_weekday_;
    std::map<int64_t, const db::DepartmentShift*> shift_by_id_;
    std::set<int64_t> consumed_out_ids_;
};

} // namespace core

#endif // DAY_RECORD_BUILDER_H
