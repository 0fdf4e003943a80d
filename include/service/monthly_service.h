/**
 * @file monthly_service.h
 * @brief 月度考勤统计服务
 * @details 员工月报从当年 1 月 1 日计算到月末，以便统计年度加班上限。
 *          部门汇总对每名员工调用一次员工月报。
 */

#ifndef MONTHLY_SERVICE_H
#define MONTHLY_SERVICE_H

#include <vector>
#include <optional>
#include <cstdint>

#include "core/local_calendar.h"
#include "core/report_types.h"
#include "service/attendance_source.h"

namespace service {

class MonthlyService {
public:
    MonthlyService(AttendanceSource& source, const core::LocalCalendar& calendar);

    /**
     * @brief 计算员工月报
     * @param month 1..12
     * @return 员工不存在或月份非法时返回 std::nullopt
     */
    std::optional<core::MonthlyReport> compute_employee_month(int64_t employee_id, int year, int month);

    /**
     * @brief 部门月度汇总
     * @param department_id 为空表示全部部门
     * @param region_id 为空表示不按区域过滤
     * @param include_inactive 是否统计已停用员工
     */
    std::vector<core::DepartmentMonthlySummary> compute_department_month_summary(
        std::optional<int64_t> department_id,
        std::optional<int64_t> region_id,
        int year,
        int month,
        bool include_inactive);

private:
    core::MonthlyReport build_month_report(const db::Employee& employee, int year, int month);

    AttendanceSource& source_;
    const core::LocalCalendar& calendar_;
};

} // namespace service

#endif // MONTHLY_SERVICE_H
