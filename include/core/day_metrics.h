/**
 * @file day_metrics.h
 * @brief 单日工时计算 (纯函数)
 * @details 输入一对签到/签退时间与当日生效规则，输出毛工时、净工时、计划加班与合规标记。
 *          合规超限只体现为标记，状态仍为 OK。
 */

#ifndef DAY_METRICS_H
#define DAY_METRICS_H

#include <optional>
#include <ctime>

#include "core/report_types.h"

namespace core {

struct DayComputation {
    DayStatus status = DayStatus::Incomplete;
    int gross_minutes = 0;
    int worked_minutes_net = 0;
    int overtime_minutes = 0;             // 超出计划净时长的部分
    int effective_break_minutes = 0;
    int legal_min_break_minutes = 0;
    bool min_break_not_met = false;
    bool daily_max_exceeded = false;
    bool night_work_exceeded = false;
};

/**
 * @brief 法定最短休息：<=4h 15 分钟，<=7.5h 30 分钟，其余 60 分钟
 */
int legal_min_break_minutes(int gross_minutes);

/**
 * @brief 计算单日工时
 * @param first_in_utc 首次签到，缺失则结果为 INCOMPLETE 且所有分钟数为 0
 * @param last_out_utc 最后签退
 * @param planned_minutes 当日计划净时长
 * @param break_minutes 配置的休息时长
 * @param daily_max_minutes 每日最长工时 (按毛时长比较)
 * @param night_work_max_minutes 夜班最长工时
 * @param enforce_min_break 是否强制法定最短休息
 * @param is_night_shift 是否夜班
 */
DayComputation calculate_day_metrics(std::optional<std::time_t> first_in_utc,
                                     std::optional<std::time_t> last_out_utc,
                                     int planned_minutes,
                                     int break_minutes,
                                     int daily_max_minutes,
                                     int night_work_max_minutes,
                                     bool enforce_min_break,
                                     bool is_night_shift);

} // namespace core

#endif // DAY_METRICS_H
