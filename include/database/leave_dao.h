#ifndef LEAVE_DAO_H
#define LEAVE_DAO_H

#include "database/database_types.h"
#include <vector>

namespace db {

class LeaveDao {
public:
    // 返回 leave_id，失败返回 -1
    int64_t add_leave(const Leave& leave);

    bool update_status(int64_t leave_id, LeaveStatus status);

    // 与 [start, end] 有交集的已批准请假，按 (start_date, leave_id) 升序
    std::vector<Leave> get_approved_leaves(int64_t employee_id, const Date& start, const Date& end);
};

} // namespace db

#endif // LEAVE_DAO_H
