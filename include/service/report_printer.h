/**
 * @file report_printer.h
 * @brief 报表文本输出 (制表符分隔)
 * @details 同样的报表总是输出同样的字节，时间统一为 UTC ISO 8601。
 */

#ifndef REPORT_PRINTER_H
#define REPORT_PRINTER_H

#include <ostream>
#include <string>
#include <vector>
#include <ctime>

#include "core/report_types.h"

namespace service {

// 2026-02-10T20:30:00Z
std::string format_utc(std::time_t ts_utc);

void print_monthly_report(std::ostream& out, const core::MonthlyReport& report);

void print_department_summaries(std::ostream& out,
                                const std::vector<core::DepartmentMonthlySummary>& summaries);

} // namespace service

#endif // REPORT_PRINTER_H
