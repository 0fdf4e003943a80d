#include "core/report_types.h"

namespace core {

const char* to_string(DayStatus status) {
    switch (status) {
        case DayStatus::Ok: return "OK";
        case DayStatus::Incomplete: return "INCOMPLETE";
        case DayStatus::Leave: return "LEAVE";
        case DayStatus::Off: return "OFF";
    }
    return "INCOMPLETE";
}

} // namespace core
