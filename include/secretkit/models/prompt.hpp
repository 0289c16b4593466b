#pragma once
#include "secretkit/models/object_path.hpp"
#include <cstdint>
#include <variant>
#include <vector>
namespace secretkit::service::models {
enum class PromptStatus : uint8_t {
    Created = 0,
    AwaitingCompletion = 1,
    Completed = 2,
    Dismissed = 3,
    TimedOut = 4
};
inline const char* ToString(const PromptStatus status) {
    switch (status) {
        case PromptStatus::Created:
            return "Created";
        case PromptStatus::AwaitingCompletion:
            return "AwaitingCompletion";
        case PromptStatus::Completed:
            return "Completed";
        case PromptStatus::Dismissed:
            return "Dismissed";
        case PromptStatus::TimedOut:
            return "TimedOut";
        default:
            return "UNKNOWN";
    }
}
/// Variant payload of Prompt.Completed as delivered by the bus.
using WirePromptResult = std::variant<std::monostate, WirePath, std::vector<WirePath>>;
/// The same payload after sentinel conversion.
using PromptResult = std::variant<std::monostate, ObjectPath, std::vector<ObjectPath>>;
struct PromptCompleted {
    WirePath prompt;
    bool dismissed = false;
    WirePromptResult result;
};
}
