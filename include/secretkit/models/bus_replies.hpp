#pragma once
#include "secretkit/models/object_path.hpp"
#include <cstdint>
#include <vector>
namespace secretkit::service::models {
struct OpenSessionReply {
    std::vector<uint8_t> output;
    WirePath session;
};
/// Lock/Unlock: objects handled at once plus one prompt covering the rest.
struct LockReply {
    std::vector<WirePath> done;
    WirePath prompt;
};
/// CreateCollection/CreateItem: either the new object or a prompt, the other is "/".
struct CreateReply {
    WirePath object;
    WirePath prompt;
};
struct SearchReply {
    std::vector<WirePath> unlocked;
    std::vector<WirePath> locked;
};
}
