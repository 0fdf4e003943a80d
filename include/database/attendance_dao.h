#ifndef ATTENDANCE_DAO_H
#define ATTENDANCE_DAO_H

#include "database/database_types.h"
#include <vector>
#include <optional>

namespace db {

class AttendanceDao {
public:
    // 写入打卡事件，返回 event_id，失败返回 -1
    int64_t add_event(const AttendanceEvent& event);

    // 软删除，记录仍保留但不再参与计算
    bool soft_delete_event(int64_t event_id, std::time_t deleted_at);

    std::optional<AttendanceEvent> get_event(int64_t event_id);

    // 获取 [start_time, end_time) 内未删除的事件，按 (ts_utc, event_id) 升序
    std::vector<AttendanceEvent> get_events_by_employee(int64_t employee_id, std::time_t start_time, std::time_t end_time);
};

} // namespace db

#endif // ATTENDANCE_DAO_H
