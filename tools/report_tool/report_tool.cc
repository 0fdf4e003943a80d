/**
 * @file report_tool.cc
 * @brief 考勤数据维护与报表命令行工具
 * @details 时区取环境变量 ATTENDANCE_TIMEZONE，未设置时使用 Config::Default::ATTENDANCE_TIMEZONE。
 *          打卡与人工覆盖的时间按考勤本地时间输入。
 */

#include <iostream>
#include <string>
#include <vector>
#include <optional>
#include <cstdlib>
#include <ctime>

#include "config.h"
#include "core/local_calendar.h"
#include "database/attendance_dao.h"
#include "database/database_manager.h"
#include "database/employee_dao.h"
#include "database/leave_dao.h"
#include "database/manual_override_dao.h"
#include "database/row_codec.h"
#include "database/rule_dao.h"
#include "service/monthly_service.h"
#include "service/report_printer.h"
#include "service/sqlite_attendance_source.h"

namespace {

void print_usage() {
    std::cout << "Usage: (db_path \"-\" uses " << Config::Path::DATABASE << ")" << std::endl;
    std::cout << "  report_tool init <db_path>" << std::endl;
    std::cout << "  report_tool add_department <db_path> <name> [region_id]" << std::endl;
    std::cout << "  report_tool add_employee <db_path> <name> <department_id> [contract_weekly_minutes]" << std::endl;
    std::cout << "  report_tool update_employee <db_path> <employee_id> <field=value>..." << std::endl;
    std::cout << "      fields: name, department_id, shift_id, contract_weekly_minutes, active (0|1); \"null\" clears an id or contract" << std::endl;
    std::cout << "  report_tool work_rule <db_path> <department_id> <planned_minutes> <break_minutes> [grace_minutes]" << std::endl;
    std::cout << "  report_tool weekly_rule <db_path> <department_id> <weekday 0-6> <workday 0|1> <planned_minutes> <break_minutes>" << std::endl;
    std::cout << "  report_tool add_shift <db_path> <department_id> <name> <HH:MM> <HH:MM> <break_minutes>" << std::endl;
    std::cout << "  report_tool punch <db_path> <employee_id> <in|out> <YYYY-MM-DD> <HH:MM> [shift_id]" << std::endl;
    std::cout << "  report_tool leave <db_path> <employee_id> <start> <end> <ANNUAL|SICK|UNPAID|EXCUSE|PUBLIC_HOLIDAY>" << std::endl;
    std::cout << "  report_tool absent <db_path> <employee_id> <YYYY-MM-DD>" << std::endl;
    std::cout << "  report_tool override <db_path> <employee_id> <YYYY-MM-DD> <HH:MM in> <HH:MM out> [rule_source]" << std::endl;
    std::cout << "  report_tool month <db_path> <employee_id> <year> <month>" << std::endl;
    std::cout << "  report_tool department <db_path> <year> <month> [department_id] [all]" << std::endl;
}

std::optional<int64_t> parse_int(const std::string& text) {
    try {
        size_t consumed = 0;
        const long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string attendance_timezone() {
    const char* value = std::getenv("ATTENDANCE_TIMEZONE");
    return value ? value : Config::Default::ATTENDANCE_TIMEZONE;
}

// 参数解析失败时输出错误并返回 false
bool require_int(const std::string& text, const char* name, int64_t& out) {
    auto value = parse_int(text);
    if (!value) {
        std::cerr << "Invalid " << name << ": " << text << std::endl;
        return false;
    }
    out = *value;
    return true;
}

bool require_date(const std::string& text, db::Date& out) {
    auto value = db::parse_date(text);
    if (!value) {
        std::cerr << "Invalid date: " << text << std::endl;
        return false;
    }
    out = *value;
    return true;
}

bool require_time(const std::string& text, int& out) {
    auto value = db::parse_minute_of_day(text);
    if (!value) {
        std::cerr << "Invalid time: " << text << std::endl;
        return false;
    }
    out = *value;
    return true;
}

bool require_optional_int(const std::string& text, const char* name, std::optional<int64_t>& out) {
    if (text == "null") {
        out = std::nullopt;
        return true;
    }
    int64_t value = 0;
    if (!require_int(text, name, value)) return false;
    out = value;
    return true;
}

// field=value 列表 -> 员工补丁
bool parse_employee_patch(const std::vector<std::string>& fields, db::EmployeePatch& patch) {
    for (const auto& field : fields) {
        const auto eq = field.find('=');
        if (eq == std::string::npos) {
            std::cerr << "Expected field=value: " << field << std::endl;
            return false;
        }
        const std::string key = field.substr(0, eq);
        const std::string value = field.substr(eq + 1);
        std::optional<int64_t> number;

        if (key == "name") {
            patch.full_name = value;
        } else if (key == "department_id") {
            if (!require_optional_int(value, "department_id", number)) return false;
            patch.department_id = number;
        } else if (key == "shift_id") {
            if (!require_optional_int(value, "shift_id", number)) return false;
            patch.shift_id = number;
        } else if (key == "contract_weekly_minutes") {
            if (!require_optional_int(value, "contract_weekly_minutes", number)) return false;
            patch.contract_weekly_minutes = number
                ? std::optional<int>(static_cast<int>(*number)) : std::optional<int>();
        } else if (key == "active") {
            if (value != "0" && value != "1") {
                std::cerr << "Invalid active flag: " << value << std::endl;
                return false;
            }
            patch.is_active = (value == "1");
        } else {
            std::cerr << "Unknown employee field: " << key << std::endl;
            return false;
        }
    }
    return true;
}

int report_id(int64_t id, const char* what) {
    if (id == -1) {
        std::cerr << "Failed to add " << what << "." << std::endl;
        return 1;
    }
    std::cout << what << " added. ID: " << id << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return 1;
    }

    const std::string command = argv[1];
    // "-" 表示使用默认数据库路径
    const std::string db_path = std::string(argv[2]) == "-" ? Config::Path::DATABASE : argv[2];
    const std::vector<std::string> args(argv + 3, argv + argc);

    if (!db::DatabaseManager::instance().open(db_path)) {
        std::cerr << "Failed to open database: " << db_path << std::endl;
        return 1;
    }

    const core::LocalCalendar calendar(attendance_timezone());

    if (command == "init") {
        std::cout << "Database initialized successfully at " << db_path << std::endl;
        return 0;
    }

    if (command == "add_department" && !args.empty()) {
        db::Department department;
        department.name = args[0];
        int64_t region = 0;
        if (args.size() > 1) {
            if (!require_int(args[1], "region_id", region)) return 1;
            department.region_id = region;
        }
        db::EmployeeDao dao;
        return report_id(dao.add_department(department), "Department");
    }

    if (command == "add_employee" && args.size() >= 2) {
        db::Employee employee;
        employee.full_name = args[0];
        int64_t department_id = 0;
        if (!require_int(args[1], "department_id", department_id)) return 1;
        employee.department_id = department_id;
        if (args.size() > 2) {
            int64_t contract = 0;
            if (!require_int(args[2], "contract_weekly_minutes", contract)) return 1;
            employee.contract_weekly_minutes = static_cast<int>(contract);
        }
        db::EmployeeDao dao;
        return report_id(dao.add_employee(employee), "Employee");
    }

    if (command == "update_employee" && args.size() >= 2) {
        int64_t employee_id = 0;
        if (!require_int(args[0], "employee_id", employee_id)) return 1;
        db::EmployeePatch patch;
        if (!parse_employee_patch(std::vector<std::string>(args.begin() + 1, args.end()), patch)) return 1;
        db::EmployeeDao dao;
        if (!dao.update_employee(employee_id, patch)) {
            std::cerr << "Failed to update employee " << employee_id << "." << std::endl;
            return 1;
        }
        std::cout << "Employee " << employee_id << " updated." << std::endl;
        return 0;
    }

    if (command == "work_rule" && args.size() >= 3) {
        db::WorkRule rule;
        int64_t value = 0;
        if (!require_int(args[0], "department_id", rule.department_id)) return 1;
        if (!require_int(args[1], "planned_minutes", value)) return 1;
        rule.daily_minutes_planned = static_cast<int>(value);
        if (!require_int(args[2], "break_minutes", value)) return 1;
        rule.break_minutes = static_cast<int>(value);
        if (args.size() > 3) {
            if (!require_int(args[3], "grace_minutes", value)) return 1;
            rule.grace_minutes = static_cast<int>(value);
        }
        db::RuleDao dao;
        if (!dao.upsert_work_rule(rule)) {
            std::cerr << "Failed to save work rule." << std::endl;
            return 1;
        }
        std::cout << "Work rule saved." << std::endl;
        return 0;
    }

    if (command == "weekly_rule" && args.size() >= 5) {
        db::WeeklyRule rule;
        int64_t value = 0;
        if (!require_int(args[0], "department_id", rule.department_id)) return 1;
        if (!require_int(args[1], "weekday", value)) return 1;
        rule.weekday = static_cast<int>(value);
        if (!require_int(args[2], "workday", value)) return 1;
        rule.is_workday = value != 0;
        if (!require_int(args[3], "planned_minutes", value)) return 1;
        rule.planned_minutes = static_cast<int>(value);
        if (!require_int(args[4], "break_minutes", value)) return 1;
        rule.break_minutes = static_cast<int>(value);
        db::RuleDao dao;
        if (!dao.upsert_weekly_rule(rule)) {
            std::cerr << "Failed to save weekly rule." << std::endl;
            return 1;
        }
        std::cout << "Weekly rule saved." << std::endl;
        return 0;
    }

    if (command == "add_shift" && args.size() >= 5) {
        db::DepartmentShift shift;
        int64_t value = 0;
        if (!require_int(args[0], "department_id", shift.department_id)) return 1;
        shift.name = args[1];
        if (!require_time(args[2], shift.start_minute_local)) return 1;
        if (!require_time(args[3], shift.end_minute_local)) return 1;
        if (!require_int(args[4], "break_minutes", value)) return 1;
        shift.break_minutes = static_cast<int>(value);
        db::RuleDao dao;
        return report_id(dao.add_shift(shift), "Shift");
    }

    if (command == "punch" && args.size() >= 4) {
        db::AttendanceEvent event;
        db::Date day;
        int minute = 0;
        if (!require_int(args[0], "employee_id", event.employee_id)) return 1;
        if (args[1] == "in") {
            event.type = db::EventType::In;
        } else if (args[1] == "out") {
            event.type = db::EventType::Out;
        } else {
            std::cerr << "Invalid event type: " << args[1] << std::endl;
            return 1;
        }
        if (!require_date(args[2], day) || !require_time(args[3], minute)) return 1;
        if (args.size() > 4) {
            int64_t shift_id = 0;
            if (!require_int(args[4], "shift_id", shift_id)) return 1;
            event.shift_id = shift_id;
        }
        event.ts_utc = calendar.to_utc(day, minute);
        event.source = db::EventSource::Manual;
        event.created_by_admin = true;
        db::AttendanceDao dao;
        return report_id(dao.add_event(event), "Event");
    }

    if (command == "leave" && args.size() >= 4) {
        db::Leave leave;
        if (!require_int(args[0], "employee_id", leave.employee_id)) return 1;
        if (!require_date(args[1], leave.start_date) || !require_date(args[2], leave.end_date)) return 1;
        auto type = db::parse_leave_type(args[3]);
        if (!type) {
            std::cerr << "Invalid leave type: " << args[3] << std::endl;
            return 1;
        }
        leave.type = *type;
        leave.status = db::LeaveStatus::Approved;
        db::LeaveDao dao;
        return report_id(dao.add_leave(leave), "Leave");
    }

    if ((command == "absent" && args.size() >= 2) || (command == "override" && args.size() >= 4)) {
        db::ManualDayOverride row;
        if (!require_int(args[0], "employee_id", row.employee_id)) return 1;
        if (!require_date(args[1], row.day_date)) return 1;
        if (command == "absent") {
            row.is_absent = true;
        } else {
            int in_minute = 0;
            int out_minute = 0;
            if (!require_time(args[2], in_minute) || !require_time(args[3], out_minute)) return 1;
            row.in_ts = calendar.to_utc(row.day_date, in_minute);
            // 签退早于签到视为次日
            const db::Date out_day = out_minute <= in_minute ? row.day_date + boost::gregorian::days(1) : row.day_date;
            row.out_ts = calendar.to_utc(out_day, out_minute);
            if (args.size() > 4) row.rule_source_override = args[4];
        }
        db::ManualOverrideDao dao;
        return report_id(dao.upsert_override(row), "Override");
    }

    if (command == "month" && args.size() >= 3) {
        int64_t employee_id = 0;
        int64_t year = 0;
        int64_t month = 0;
        if (!require_int(args[0], "employee_id", employee_id) ||
            !require_int(args[1], "year", year) ||
            !require_int(args[2], "month", month)) {
            return 1;
        }
        service::SqliteAttendanceSource source;
        service::MonthlyService monthly(source, calendar);
        auto report = monthly.compute_employee_month(employee_id, static_cast<int>(year), static_cast<int>(month));
        if (!report) {
            return 1;
        }
        service::print_monthly_report(std::cout, *report);
        return 0;
    }

    if (command == "department" && args.size() >= 2) {
        int64_t year = 0;
        int64_t month = 0;
        if (!require_int(args[0], "year", year) || !require_int(args[1], "month", month)) return 1;
        std::optional<int64_t> department_id;
        bool include_inactive = false;
        for (size_t i = 2; i < args.size(); ++i) {
            if (args[i] == "all") {
                include_inactive = true;
                continue;
            }
            int64_t value = 0;
            if (!require_int(args[i], "department_id", value)) return 1;
            department_id = value;
        }
        service::SqliteAttendanceSource source;
        service::MonthlyService monthly(source, calendar);
        service::print_department_summaries(
            std::cout,
            monthly.compute_department_month_summary(department_id, std::nullopt,
                                                     static_cast<int>(year), static_cast<int>(month),
                                                     include_inactive));
        return 0;
    }

    print_usage();
    return 1;
}
