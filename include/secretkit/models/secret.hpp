#pragma once
#include "secretkit/models/object_path.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>
namespace secretkit::service::models {
using Attributes = std::map<std::string, std::string>;
struct Secret {
    std::vector<uint8_t> value;
    std::string content_type;
};
struct EncryptedPayload {
    std::vector<uint8_t> iv;
    std::vector<uint8_t> ciphertext;
};
/// (o session, ay parameters, ay value, s content_type)
struct WireSecret {
    WirePath session;
    std::vector<uint8_t> parameters;
    std::vector<uint8_t> value;
    std::string content_type;
};
}
