/**
 * @file day_metrics.cc
 * @brief 单日工时计算实现
 */

#include "core/day_metrics.h"

#include <algorithm>

namespace core {

int legal_min_break_minutes(int gross_minutes) {
    if (gross_minutes <= 0) return 0;
    if (gross_minutes <= 240) return 15;
    if (gross_minutes <= 450) return 30;
    return 60;
}

DayComputation calculate_day_metrics(std::optional<std::time_t> first_in_utc,
                                     std::optional<std::time_t> last_out_utc,
                                     int planned_minutes,
                                     int break_minutes,
                                     int daily_max_minutes,
                                     int night_work_max_minutes,
                                     bool enforce_min_break,
                                     bool is_night_shift) {
    DayComputation result;
    const int configured_break = std::max(0, break_minutes);

    if (!first_in_utc || !last_out_utc) {
        result.status = DayStatus::Incomplete;
        result.effective_break_minutes = configured_break;
        return result;
    }

    const std::time_t elapsed_seconds = *last_out_utc - *first_in_utc;
    const int gross = elapsed_seconds > 0 ? static_cast<int>(elapsed_seconds / 60) : 0;
    const int legal_break = enforce_min_break ? legal_min_break_minutes(gross) : 0;
    const int effective_break = std::max(configured_break, legal_break);

    result.status = DayStatus::Ok;
    result.gross_minutes = gross;
    result.legal_min_break_minutes = legal_break;
    result.effective_break_minutes = effective_break;
    result.min_break_not_met = enforce_min_break && configured_break < legal_break && gross > 0;
    result.worked_minutes_net = std::max(0, gross - effective_break);
    result.overtime_minutes = std::max(0, result.worked_minutes_net - std::max(0, planned_minutes));
    result.daily_max_exceeded = gross > std::max(0, daily_max_minutes);
    result.night_work_exceeded = is_night_shift && gross > std::max(0, night_work_max_minutes);
    return result;
}

} // namespace core
