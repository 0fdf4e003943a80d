#ifndef LABOR_PROFILE_DAO_H
#define LABOR_PROFILE_DAO_H

#include "database/database_types.h"
#include <optional>

namespace db {

class LaborProfileDao {
public:
    // 返回 profile_id，失败返回 -1
    int64_t add_profile(const LaborProfile& profile);

    // 生效的是 profile_id 最小的一条，表为空时返回 std::nullopt
    std::optional<LaborProfile> get_active_profile();
};

} // namespace db

#endif // LABOR_PROFILE_DAO_H
