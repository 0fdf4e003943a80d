/**
 * @file day_flags.cc
 * @brief 标记分类
 */

#include "core/day_flags.h"

namespace core {
namespace flags {

bool is_compliance_flag(const std::string& flag) {
    return flag == DAILY_MAX_EXCEEDED ||
           flag == MIN_BREAK_NOT_MET ||
           flag == NIGHT_WORK_EXCEEDED ||
           flag == ANNUAL_OVERTIME_CAP_EXCEEDED;
}

} // namespace flags
} // namespace core
