/**
 * @file attendance_source.h
 * @brief 考勤数据源接口
 * @details 月报计算所需的全部数据都经由此接口读取。实现方负责在一次计算内提供一致的快照。
 */

#ifndef ATTENDANCE_SOURCE_H
#define ATTENDANCE_SOURCE_H

#include <vector>
#include <optional>
#include <cstdint>
#include <ctime>

#include "database/database_types.h"

namespace service {

class AttendanceSource {
public:
    virtual ~AttendanceSource() = default;

    virtual std::optional<db::Employee> fetch_employee(int64_t employee_id) = 0;

    // 按 department_id 升序；两个条件都为空时返回全部部门
    virtual std::vector<db::Department> fetch_departments(std::optional<int64_t> department_id,
                                                          std::optional<int64_t> region_id) = 0;

    // 按 employee_id 升序
    virtual std::vector<db::Employee> fetch_department_employees(int64_t department_id,
                                                                 bool include_inactive) = 0;

    /**
     * @brief 读取打卡事件
     * @details 半开区间 [utc_start, utc_end)，按 (ts_utc, event_id) 排序，不含软删除记录
     */
    virtual std::vector<db::AttendanceEvent> fetch_events(int64_t employee_id,
                                                          std::time_t utc_start,
                                                          std::time_t utc_end) = 0;

    // 与 [start, end] 有交集的已批准请假
    virtual std::vector<db::Leave> fetch_approved_leaves(int64_t employee_id,
                                                         const db::Date& start,
                                                         const db::Date& end) = 0;

    virtual std::vector<db::ManualDayOverride> fetch_manual_overrides(int64_t employee_id,
                                                                      const db::Date& start,
                                                                      const db::Date& end) = 0;

    virtual std::vector<db::WeeklyRule> fetch_weekly_rules(int64_t department_id) = 0;

    // 包含已停用的班次，历史日期可能引用它们
    virtual std::vector<db::DepartmentShift> fetch_department_shifts(int64_t department_id) = 0;

    // 与 [start, end] 有交集的启用计划，含目标员工列表
    virtual std::vector<db::SchedulePlan> fetch_active_schedule_plans(int64_t department_id,
                                                                      const db::Date& start,
                                                                      const db::Date& end) = 0;

    virtual std::optional<db::WorkRule> fetch_work_rule(int64_t department_id) = 0;

    virtual std::optional<db::LaborProfile> fetch_labor_profile() = 0;
};

} // namespace service

#endif // ATTENDANCE_SOURCE_H
