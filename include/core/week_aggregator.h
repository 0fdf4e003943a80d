/**
 * @file week_aggregator.h
 * @brief 周汇总、法定周工时拆分与年度加班上限
 * @details 周以周一开始。年度上限按时间顺序累加每周加班，累计值超限的那一周及之后各周都打标记。
 */

#ifndef WEEK_AGGREGATOR_H
#define WEEK_AGGREGATOR_H

#include <vector>
#include <optional>

#include "core/report_types.h"

namespace core {

// OFF: 截断到 >= 0；ROUND_UP_30MIN: 正值向上取整到 30 的倍数
int round_overtime(int minutes, db::OvertimeRounding mode);

struct WeeklyLegalTotals {
    int normal_minutes = 0;
    int extra_work_minutes = 0;   // 合同工时与法定工时之间
    int overtime_minutes = 0;     // 超出法定工时
};

/**
 * @brief 按法定每周工时与合同工时拆分一周的工作时长
 * @param contract_weekly_minutes 合同工时，为空时等于法定工时，超过法定工时按法定工时计
 */
WeeklyLegalTotals calculate_weekly_legal_totals(int worked_minutes,
                                                std::optional<int> contract_weekly_minutes,
                                                int weekly_normal_minutes,
                                                db::OvertimeRounding mode);

/**
 * @brief 把日记录按周汇总，结果按 week_start 升序
 */
std::vector<WeekSummary> build_weekly_summaries(const std::vector<DayRecord>& days,
                                                std::optional<int> contract_weekly_minutes,
                                                int weekly_normal_minutes,
                                                db::OvertimeRounding mode);

struct AnnualCapUsage {
    int used_minutes = 0;
    int remaining_minutes = 0;
    bool exceeded = false;
};

// 日级法定拆分：额外工作记 0，法定加班记当日计划加班
void apply_daily_legal_breakdown(std::vector<DayRecord>& days);

// weeks 须已按时间排序
AnnualCapUsage mark_annual_overtime_cap(std::vector<WeekSummary>& weeks, int annual_cap_minutes);

// 把周上的年度上限标记下推到所属的日记录
void propagate_annual_cap_flag(const std::vector<WeekSummary>& weeks, std::vector<DayRecord>& days);

} // namespace core

#endif // WEEK_AGGREGATOR_H
