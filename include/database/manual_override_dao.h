#ifndef MANUAL_OVERRIDE_DAO_H
#define MANUAL_OVERRIDE_DAO_H

#include "database/database_types.h"
#include <optional>
#include <vector>

namespace db {

class ManualOverrideDao {
public:
    /**
     * @brief 写入人工日覆盖，同一员工同一天已有记录时就地更新
     * @return override_id，失败返回 -1
     */
    int64_t upsert_override(const ManualDayOverride& row);

    bool delete_override(int64_t employee_id, const Date& day);

    std::optional<ManualDayOverride> get_override(int64_t employee_id, const Date& day);

    // [start, end] 内的覆盖，按 (day_date, override_id) 升序
    std::vector<ManualDayOverride> get_overrides(int64_t employee_id, const Date& start, const Date& end);
};

} // namespace db

#endif // MANUAL_OVERRIDE_DAO_H
