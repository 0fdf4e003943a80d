/**
 * @file sqlite_attendance_source.cc
 * @brief 基于 SQLite DAO 的考勤数据源实现
 */

#include "service/sqlite_attendance_source.h"
#include "database/attendance_dao.h"
#include "database/employee_dao.h"
#include "database/labor_profile_dao.h"
#include "database/leave_dao.h"
#include "database/manual_override_dao.h"
#include "database/rule_dao.h"
#include "database/schedule_plan_dao.h"

namespace service {

std::optional<db::Employee> SqliteAttendanceSource::fetch_employee(int64_t employee_id) {
    db::EmployeeDao dao;
    return dao.get_employee_by_id(employee_id);
}

std::vector<db::Department> SqliteAttendanceSource::fetch_departments(std::optional<int64_t> department_id,
                                                                      std::optional<int64_t> region_id) {
    db::EmployeeDao dao;
    return dao.get_departments(department_id, region_id);
}

std::vector<db::Employee> SqliteAttendanceSource::fetch_department_employees(int64_t department_id,
                                                                            bool include_inactive) {
    db::EmployeeDao dao;
    return dao.get_department_employees(department_id, include_inactive);
}

std::vector<db::AttendanceEvent> SqliteAttendanceSource::fetch_events(int64_t employee_id,
                                                                      std::time_t utc_start,
                                                                      std::time_t utc_end) {
    db::AttendanceDao dao;
    return dao.get_events_by_employee(employee_id, utc_start, utc_end);
}

std::vector<db::Leave> SqliteAttendanceSource::fetch_approved_leaves(int64_t employee_id,
                                                                     const db::Date& start,
                                                                     const db::Date& end) {
    db::LeaveDao dao;
    return dao.get_approved_leaves(employee_id, start, end);
}

std::vector<db::ManualDayOverride> SqliteAttendanceSource::fetch_manual_overrides(int64_t employee_id,
                                                                                  const db::Date& start,
                                                                                  const db::Date& end) {
    db::ManualOverrideDao dao;
    return dao.get_overrides(employee_id, start, end);
}

std::vector<db::WeeklyRule> SqliteAttendanceSource::fetch_weekly_rules(int64_t department_id) {
    db::RuleDao dao;
    return dao.get_weekly_rules(department_id);
}

std::vector<db::DepartmentShift> SqliteAttendanceSource::fetch_department_shifts(int64_t department_id) {
    db::RuleDao dao;
    return dao.get_department_shifts(department_id);
}

std::vector<db::SchedulePlan> SqliteAttendanceSource::fetch_active_schedule_plans(int64_t department_id,
                                                                                  const db::Date& start,
                                                                                  const db::Date& end) {
    db::SchedulePlanDao dao;
    return dao.get_active_plans(department_id, start, end);
}

std::optional<db::WorkRule> SqliteAttendanceSource::fetch_work_rule(int64_t department_id) {
    db::RuleDao dao;
    return dao.get_work_rule(department_id);
}

std::optional<db::LaborProfile> SqliteAttendanceSource::fetch_labor_profile() {
    db::LaborProfileDao dao;
    return dao.get_active_profile();
}

} // namespace service
