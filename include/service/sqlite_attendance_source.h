/**
 * @file sqlite_attendance_source.h
 * @brief 基于 SQLite DAO 的考勤数据源
 * @details 使用 db::DatabaseManager 单例上已打开的连接。
 */

#ifndef SQLITE_ATTENDANCE_SOURCE_H
#define SQLITE_ATTENDANCE_SOURCE_H

#include "service/attendance_source.h"

namespace service {

class SqliteAttendanceSource : public AttendanceSource {
public:
    std::optional<db::Employee> fetch_employee(int64_t employee_id) override;
    std::vector<db::Department> fetch_departments(std::optional<int64_t> department_id,
                                                  std::optional<int64_t> region_id) override;
    std::vector<db::Employee> fetch_department_employees(int64_t department_id, bool include_inactive) override;
    std::vector<db::AttendanceEvent> fetch_events(int64_t employee_id,
                                                  std::time_t utc_start,
                                                  std::time_t utc_end) override;
    std::vector<db::Leave> fetch_approved_leaves(int64_t employee_id,
                                                 const db::Date& start,
                                                 const db::Date& end) override;
    std::vector<db::ManualDayOverride> fetch_manual_overrides(int64_t employee_id,
                                                              const db::Date& start,
                                                              const db::Date& end) override;
    std::vector<db::WeeklyRule> fetch_weekly_rules(int64_t department_id) override;
    std::vector<db::DepartmentShift> fetch_department_shifts(int64_t department_id) override;
    std::vector<db::SchedulePlan> fetch_active_schedule_plans(int64_t department_id,
                                                              const db::Date& start,
                                                              const db::Date& end) override;
    std::optional<db::WorkRule> fetch_work_rule(int64_t department_id) override;
    std::optional<db::LaborProfile> fetch_labor_profile() override;
};

} // namespace service

#endif // SQLITE_ATTENDANCE_SOURCE_H
