#pragma once
#include "secretkit/core/constants.hpp"
#include <cstdint>
#include <string_view>
namespace secretkit::service::enums {
enum class EncryptionType : uint8_t {
    Plain = 0,
    Dh = 1
};
inline std::string_view AlgorithmName(const EncryptionType type) {
    switch (type) {
        case EncryptionType::Plain:
            return BusConstants::ALGORITHM_PLAIN;
        case EncryptionType::Dh:
            return BusConstants::ALGORITHM_DH;
    }
    return BusConstants::ALGORITHM_PLAIN;
}
inline const char* ToString(const EncryptionType type) {
    switch (type) {
        case EncryptionType::Plain:
            return "Plain";
        case EncryptionType::Dh:
            return "Dh";
        default:
            return "UNKNOWN";
    }
}
}
