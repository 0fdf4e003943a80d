/**
 * @file day_record_builder.cc
 * @brief 日记录生成实现
 * @details 优先级：人工覆盖 > 已批准请假 > 休息日 (无打卡) > 打卡计算。
 */

#include "core/day_record_builder.h"
#include "core/day_flags.h"
#include "core/day_metrics.h"
#include "core/schedule_plan_matcher.h"

#include <algorithm>

namespace core {

namespace bg = boost::gregorian;

namespace {

bool event_before(const db::AttendanceEvent* lhs, const db::AttendanceEvent* rhs) {
    if (lhs->ts_utc != rhs->ts_utc) return lhs->ts_utc < rhs->ts_utc;
    return lhs->event_id < rhs->event_id;
}

bool carries_night_flag(const db::AttendanceEvent* event) {
    return event != nullptr &&
           (event->flags.count(flags::IS_NIGHT_SHIFT) > 0 || event->flags.count(flags::NIGHT_SHIFT) > 0);
}

void add_compliance_flags(FlagSet& day_flags, const DayComputation& metrics) {
    if (metrics.daily_max_exceeded) day_flags.add(flags::DAILY_MAX_EXCEEDED);
    if (metrics.min_break_not_met) day_flags.add(flags::MIN_BREAK_NOT_MET);
    if (metrics.night_work_exceeded) day_flags.add(flags::NIGHT_WORK_EXCEEDED);
}

// 状态为 OK 的工作日未达计划时长时记缺勤分钟
int underworked_minutes(DayStatus status, bool is_workday, int worked, int planned) {
    if (status == DayStatus::Ok && is_workday && worked < planned) {
        return planned - worked;
    }
    return 0;
}

} // namespace

DayRecordBuilder::DayRecordBuilder(const LocalCalendar& calendar, const DayBuildInputs& inputs)
    : calendar_(calendar), inputs_(inputs) {}

void DayRecordBuilder::index_inputs(const db::Date& start, const db::Date& end) {
    events_by_day_.clear();
    leave_by_day_.clear();
    override_by_day_.clear();
    weekly_rule_by_weekday_.clear();
    shift_by_id_.clear();
    consumed_out_ids_.clear();

    std::vector<const db::AttendanceEvent*> events;
    for (const auto& event : inputs_.events) {
        if (event.deleted_at) continue;
        events.push_back(&event);
    }
    std::sort(events.begin(), events.end(), event_before);
    for (const auto* event : events) {
        DayEvents& bucket = events_by_day_[calendar_.local_date(event->ts_utc)];
        if (event->type == db::EventType::In) {
            bucket.ins.push_back(event);
        } else {
            bucket.outs.push_back(event);
        }
    }

    // 请假重叠时以 (start_date, leave_id) 最早的一条为准
    std::vector<const db::Leave*> leaves;
    for (const auto& leave : inputs_.leaves) {
        if (leave.status != db::LeaveStatus::Approved) continue;
        leaves.push_back(&leave);
    }
    std::sort(leaves.begin(), leaves.end(), [](const db::Leave* lhs, const db::Leave* rhs) {
        if (lhs->start_date != rhs->start_date) return lhs->start_date < rhs->start_date;
        return lhs->leave_id < rhs->leave_id;
    });
    for (const auto* leave : leaves) {
        const bg::date first = std::max(leave->start_date, start);
        const bg::date last = std::min(leave->end_date, end);
        for (bg::date cursor = first; cursor <= last; cursor += bg::days(1)) {
            leave_by_day_.emplace(cursor, leave->type);
        }
    }

    // 同一天多条人工覆盖时取 override_id 最大的
    for (const auto& row : inputs_.overrides) {
        if (row.day_date < start || row.day_date > end) continue;
        auto it = override_by_day_.find(row.day_date);
        if (it == override_by_day_.end() || it->second->override_id < row.override_id) {
            override_by_day_[row.day_date] = &row;
        }
    }

    for (const auto& rule : inputs_.weekly_rules) {
        weekly_rule_by_weekday_[rule.weekday] = &rule;
    }
    for (const auto& shift : inputs_.shifts) {
        shift_by_id_[shift.shift_id] = &shift;
    }
}

const db::DepartmentShift* DayRecordBuilder::find_shift(const std::optional<int64_t>& shift_id) const {
    if (!shift_id) return nullptr;
    auto it = shift_by_id_.find(*shift_id);
    return it == shift_by_id_.end() ? nullptr : it->second;
}

const db::DepartmentShift* DayRecordBuilder::event_shift(const EventPair& pair) const {
    for (const auto* event : {pair.first_in, pair.last_out}) {
        if (event == nullptr) continue;
        if (const auto* shift = find_shift(event->shift_id)) {
            return shift;
        }
    }
    return nullptr;
}

DayRecordBuilder::EventPair DayRecordBuilder::resolve_event_pair(const db::Date& day) {
    EventPair pair;
    static const DayEvents kEmpty;

    auto day_it = events_by_day_.find(day);
    const DayEvents& bucket = day_it == events_by_day_.end() ? kEmpty : day_it->second;

    std::vector<const db::AttendanceEvent*> day_outs;
    for (const auto* event : bucket.outs) {
        if (consumed_out_ids_.count(event->event_id) == 0) {
            day_outs.push_back(event);
        }
    }

    if (!bucket.ins.empty()) {
        pair.first_in = bucket.ins.front();
        for (const auto* event : day_outs) {
            if (event->ts_utc >= pair.first_in->ts_utc) {
                pair.last_out = event;
            }
        }
    } else if (!day_outs.empty()) {
        pair.last_out = day_outs.back();
    }

    // 当天没有签退时，尝试用次日第一次签到之前的签退闭合
    if (pair.first_in != nullptr && pair.last_out == nullptr) {
        auto next_it = events_by_day_.find(day + bg::days(1));
        if (next_it != events_by_day_.end()) {
            const DayEvents& next = next_it->second;
            const db::AttendanceEvent* next_first_in = next.ins.empty() ? nullptr : next.ins.front();
            for (const auto* candidate : next.outs) {
                if (consumed_out_ids_.count(candidate->event_id) > 0) continue;
                if (candidate->ts_utc <= pair.first_in->ts_utc) continue;
                if (next_first_in != nullptr && candidate->ts_utc >= next_first_in->ts_utc) continue;
                pair.last_out = candidate;
                pair.cross_midnight = true;
                consumed_out_ids_.insert(candidate->event_id);
                break;
            }
        }
    }

    // 当天最后一个事件是晚于签退的签到 -> 班次未闭合
    const db::AttendanceEvent* latest = nullptr;
    for (const auto* event : bucket.ins) {
        if (latest == nullptr || event_before(latest, event)) latest = event;
    }
    for (const auto* event : day_outs) {
        if (latest == nullptr || event_before(latest, event)) latest = event;
    }
    if (latest != nullptr && latest->type == db::EventType::In) {
        pair.open_shift = pair.last_out == nullptr || latest->ts_utc > pair.last_out->ts_utc;
    }
    return pair;
}

std::vector<DayRecord> DayRecordBuilder::build(const db::Date& start, const db::Date& end) {
    std::vector<DayRecord> records;
    if (end < start) {
        return records;
    }
    index_inputs(start, end);

    const db::Employee& employee = inputs_.employee;
    for (bg::date day = start; day <= end; day += bg::days(1)) {
        const EventPair pair = resolve_event_pair(day);

        auto override_it = override_by_day_.find(day);
        const db::ManualDayOverride* override_row =
            override_it == override_by_day_.end() ? nullptr : override_it->second;

        const auto plan = resolve_best_plan_for_day(inputs_.plans, employee.employee_id, day);
        auto weekly_it = weekly_rule_by_weekday_.find(LocalCalendar::weekday_index(day));
        const db::WeeklyRule* weekly_rule =
            weekly_it == weekly_rule_by_weekday_.end() ? nullptr : weekly_it->second;

        int base_planned = inputs_.work_rule.daily_minutes_planned;
        int base_break = inputs_.work_rule.break_minutes;
        int base_grace = inputs_.work_rule.grace_minutes;
        if (plan) {
            if (plan->daily_minutes_planned) base_planned = *plan->daily_minutes_planned;
            if (plan->break_minutes) base_break = *plan->break_minutes;
            if (plan->grace_minutes) base_grace = *plan->grace_minutes;
        }

        // 班次优先级：计划班次 > 打卡声明的班次 > 员工默认班次
        const db::DepartmentShift* declared_shift = event_shift(pair);
        const db::DepartmentShift* day_shift = plan ? find_shift(plan->shift_id) : nullptr;
        if (day_shift == nullptr) {
            day_shift = declared_shift != nullptr ? declared_shift : find_shift(employee.shift_id);
        }
        const db::DepartmentShift* override_shift =
            override_row != nullptr ? find_shift(override_row->rule_shift_id_override) : nullptr;

        const RuleResolution rule = resolve_day_rule(
            base_planned, base_break, base_grace, weekly_rule, day_shift,
            override_row != nullptr ? override_row->rule_source_override : std::string(),
            override_shift);

        std::vector<std::string> rule_flags = rule.flags;
        if (plan) {
            rule_flags.push_back(flags::SCHEDULE_PLAN_APPLIED);
            if (plan->shift_id) rule_flags.push_back(flags::SCHEDULE_PLAN_SHIFT);
            if (plan->daily_minutes_planned || plan->break_minutes) rule_flags.push_back(flags::SCHEDULE_PLAN_RULE);
            if (plan->is_locked) {
                rule_flags.push_back(flags::SCHEDULE_PLAN_LOCKED);
                if (plan->shift_id && declared_shift != nullptr && declared_shift->shift_id != *plan->shift_id) {
                    rule_flags.push_back(flags::PLANNED_SHIFT_VIOLATION);
                }
            }
        }

        DayRecord record;
        auto leave_it = leave_by_day_.find(day);
        if (override_row != nullptr) {
            record = build_override_day(day, *override_row, rule, rule_flags);
        } else if (leave_it != leave_by_day_.end()) {
            record.day = day;
            record.status = DayStatus::Leave;
            record.leave_type = leave_it->second;
            record.flags = {flags::LEAVE_DAY};
        } else if (!rule.is_workday && pair.first_in == nullptr && pair.last_out == nullptr) {
            record.day = day;
            record.status = DayStatus::Off;
            record.flags = {flags::OFF_DAY};
        } else {
            record = build_event_day(day, pair, rule, rule_flags);
        }

        record.rule_source = rule.source;
        record.applied_planned_minutes = rule.planned_minutes;
        record.applied_break_minutes = rule.break_minutes;
        record.grace_minutes = rule.grace_minutes;
        if (day_shift != nullptr) {
            record.shift_id = day_shift->shift_id;
            record.shift_name = day_shift->name;
        }
        records.push_back(std::move(record));
    }
    return records;
}

DayRecord DayRecordBuilder::build_override_day(const db::Date& day,
                                               const db::ManualDayOverride& override_row,
                                               const RuleResolution& rule,
                                               const std::vector<std::string>& rule_flags) const {
    DayRecord record;
    record.day = day;

    FlagSet day_flags;
    day_flags.add(flags::MANUAL_OVERRIDE);
    day_flags.add_all(rule_flags);
    if (rule.shift_weekly_conflict) day_flags.add(flags::SHIFT_WEEKLY_RULE_OVERRIDE);

    if (override_row.is_absent) {
        day_flags.add(flags::ABSENT_MARKED);
        day_flags.add(flags::MISSING_IN);
        day_flags.add(flags::MISSING_OUT);
        record.status = DayStatus::Incomplete;
        record.missing_minutes = rule.is_workday ? rule.planned_minutes : 0;
        record.flags = day_flags.sorted();
        return record;
    }

    const db::LaborProfile& profile = inputs_.labor_profile;
    const DayComputation metrics = calculate_day_metrics(
        override_row.in_ts, override_row.out_ts, rule.planned_minutes, rule.break_minutes,
        profile.daily_max_minutes, profile.night_work_max_minutes, profile.enforce_min_break_rules, false);

    if (!override_row.in_ts) day_flags.add(flags::MISSING_IN);
    if (!override_row.out_ts) day_flags.add(flags::MISSING_OUT);

    record.status = metrics.status;
    record.check_in = override_row.in_ts;
    record.check_out = override_row.out_ts;
    record.worked_minutes = metrics.worked_minutes_net;
    record.plan_overtime_minutes = metrics.overtime_minutes;
    record.missing_minutes = underworked_minutes(record.status, rule.is_workday,
                                                 metrics.worked_minutes_net, rule.planned_minutes);
    if (record.missing_minutes > 0) day_flags.add(flags::UNDERWORKED);
    add_compliance_flags(day_flags, metrics);
    record.flags = day_flags.sorted();
    return record;
}

DayRecord DayRecordBuilder::build_event_day(const db::Date& day,
                                            const EventPair& pair,
                                            const RuleResolution& rule,
                                            const std::vector<std::string>& rule_flags) const {
    DayRecord record;
    record.day = day;

    FlagSet day_flags;
    bool manual_event = false;
    for (const auto* event : {pair.first_in, pair.last_out}) {
        if (event == nullptr) continue;
        for (const auto& flag : event->flags) {
            day_flags.add(flag);
        }
        if (event->source == db::EventSource::Manual || event->created_by_admin) {
            manual_event = true;
        }
    }
    if (manual_event) day_flags.add(flags::MANUAL_EVENT);
    if (pair.first_in == nullptr) day_flags.add(flags::MISSING_IN);
    if (pair.last_out == nullptr) day_flags.add(flags::MISSING_OUT);
    day_flags.add_all(rule_flags);
    if (!rule.is_workday) day_flags.add(flags::OFF_DAY_WORKED);
    if (rule.shift_weekly_conflict) day_flags.add(flags::SHIFT_WEEKLY_RULE_OVERRIDE);
    if (pair.cross_midnight) day_flags.add(flags::CROSS_MIDNIGHT_CHECKOUT);
    if (pair.open_shift) {
        day_flags.add(flags::OPEN_SHIFT_ACTIVE);
        day_flags.add(flags::MISSING_OUT);
    }

    std::optional<std::time_t> in_ts;
    std::optional<std::time_t> out_ts;
    if (pair.first_in != nullptr) in_ts = pair.first_in->ts_utc;
    if (pair.last_out != nullptr) out_ts = pair.last_out->ts_utc;

    bool night_shift = carries_night_flag(pair.first_in) || carries_night_flag(pair.last_out);
    if (in_ts && out_ts && calendar_.local_date(*in_ts) != calendar_.local_date(*out_ts)) {
        night_shift = true;
    }

    const db::LaborProfile& profile = inputs_.labor_profile;
    const DayComputation metrics = calculate_day_metrics(
        in_ts, out_ts, rule.planned_minutes, rule.break_minutes,
        profile.daily_max_minutes, profile.night_work_max_minutes, profile.enforce_min_break_rules,
        night_shift);

    record.status = pair.open_shift ? DayStatus::Incomplete : metrics.status;
    record.worked_minutes = metrics.worked_minutes_net;
    record.plan_overtime_minutes = metrics.overtime_minutes;
    record.missing_minutes = underworked_minutes(record.status, rule.is_workday,
                                                 metrics.worked_minutes_net, rule.planned_minutes);
    if (record.missing_minutes > 0) day_flags.add(flags::UNDERWORKED);
    add_compliance_flags(day_flags, metrics);

    if (pair.first_in != nullptr) {
        record.check_in = pair.first_in->ts_utc;
        record.check_in_lat = pair.first_in->lat;
        record.check_in_lon = pair.first_in->lon;
    }
    // 未闭合班次不输出签退
    if (pair.last_out != nullptr && !pair.open_shift) {
        record.check_out = pair.last_out->ts_utc;
        record.check_out_lat = pair.last_out->lat;
        record.check_out_lon = pair.last_out->lon;
    }
    record.flags = day_flags.sorted();
    return record;
}

} // namespace core
