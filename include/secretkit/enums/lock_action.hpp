#pragma once
#include <cstdint>
namespace secretkit::service::enums {
enum class LockAction : uint8_t {
    Lock = 0,
    Unlock = 1
};
inline const char* ToString(const LockAction action) {
    switch (action) {
        case LockAction::Lock:
            return "Lock";
        case LockAction::Unlock:
            return "Unlock";
        default:
            return "UNKNOWN";
    }
}
}
