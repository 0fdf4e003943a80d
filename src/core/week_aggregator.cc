/**
 * @file week_aggregator.cc
 * @brief 周汇总与年度加班上限实现
 */

#include "core/week_aggregator.h"
#include "core/day_flags.h"
#include "core/local_calendar.h"

#include <algorithm>
#include <map>
#include <set>

namespace core {

namespace {

struct WeekBucket {
    int worked = 0;
    int plan_overtime = 0;
    FlagSet flags;
};

} // namespace

int round_overtime(int minutes, db::OvertimeRounding mode) {
    if (minutes <= 0 || mode == db::OvertimeRounding::Off) {
        return std::max(0, minutes);
    }
    return ((minutes + 29) / 30) * 30;
}

WeeklyLegalTotals calculate_weekly_legal_totals(int worked_minutes,
                                                std::optional<int> contract_weekly_minutes,
                                                int weekly_normal_minutes,
                                                db::OvertimeRounding mode) {
    const int norm = std::max(0, weekly_normal_minutes);
    const int worked = std::max(0, worked_minutes);
    const int contract = contract_weekly_minutes
        ? std::min(std::max(0, *contract_weekly_minutes), norm)
        : norm;

    WeeklyLegalTotals totals;
    totals.normal_minutes = std::min(worked, contract);
    if (contract < norm) {
        totals.extra_work_minutes = std::min(std::max(0, worked - contract), norm - contract);
    }
    totals.overtime_minutes = round_overtime(std::max(0, worked - norm), mode);
    return totals;
}

std::vector<WeekSummary> build_weekly_summaries(const std::vector<DayRecord>& days,
                                                std::optional<int> contract_weekly_minutes,
                                                int weekly_normal_minutes,
                                                db::OvertimeRounding mode) {
    std::map<db::Date, WeekBucket> buckets;
    for (const auto& day : days) {
        WeekBucket& bucket = buckets[LocalCalendar::week_start(day.day)];
        bucket.worked += day.worked_minutes;
        bucket.plan_overtime += std::max(0, day.plan_overtime_minutes);
        for (const auto& flag : day.flags) {
            if (flags::is_compliance_flag(flag)) {
                bucket.flags.add(flag);
            }
        }
    }

    std::vector<WeekSummary> summaries;
    summaries.reserve(buckets.size());
    for (const auto& entry : buckets) {
        const WeekBucket& bucket = entry.second;
        const WeeklyLegalTotals legal = calculate_weekly_legal_totals(
            bucket.worked, contract_weekly_minutes, weekly_normal_minutes, mode);

        WeekSummary week;
        week.week_start = entry.first;
        week.week_end = entry.first + boost::gregorian::days(6);
        week.worked_minutes = bucket.worked;
        week.normal_minutes = std::max(0, bucket.worked - bucket.plan_overtime);
        week.extra_work_minutes = legal.extra_work_minutes;
        week.overtime_minutes = round_overtime(bucket.plan_overtime, mode);
        week.legal_overtime_minutes = legal.overtime_minutes;
        week.flags = bucket.flags.sorted();
        summaries.push_back(week);
    }
    return summaries;
}

void apply_daily_legal_breakdown(std::vector<DayRecord>& days) {
    for (auto& day : days) {
        day.legal_extra_work_minutes = 0;
        day.legal_overtime_minutes = std::max(0, day.plan_overtime_minutes);
    }
}

AnnualCapUsage mark_annual_overtime_cap(std::vector<WeekSummary>& weeks, int annual_cap_minutes) {
    AnnualCapUsage usage;
    int cumulative = 0;
    for (auto& week : weeks) {
        cumulative += week.overtime_minutes;
        if (cumulative > annual_cap_minutes) {
            FlagSet merged;
            merged.add_all(week.flags);
            merged.add(flags::ANNUAL_OVERTIME_CAP_EXCEEDED);
            week.flags = merged.sorted();
        }
    }
    usage.used_minutes = cumulative;
    usage.remaining_minutes = std::max(0, annual_cap_minutes - cumulative);
    usage.exceeded = cumulative > annual_cap_minutes;
    return usage;
}

void propagate_annual_cap_flag(const std::vector<WeekSummary>& weeks, std::vector<DayRecord>& days) {
    std::set<db::Date> capped_weeks;
    for (const auto& week : weeks) {
        if (std::find(week.flags.begin(), week.flags.end(),
                      std::string(flags::ANNUAL_OVERTIME_CAP_EXCEEDED)) != week.flags.end()) {
            capped_weeks.insert(week.week_start);
        }
    }
    if (capped_weeks.empty()) return;

    for (auto& day : days) {
        if (capped_weeks.count(LocalCalendar::week_start(day.day)) == 0) continue;
        FlagSet merged;
        merged.add_all(day.flags);
        merged.add(flags::ANNUAL_OVERTIME_CAP_EXCEEDED);
        day.flags = merged.sorted();
    }
}

} // namespace core
