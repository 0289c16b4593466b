#include "secretkit/models/object_path.hpp"
#include "secretkit/core/constants.hpp"

namespace secretkit::service::models {

namespace {
    bool IsPathCharacter(const char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
               (c >= '0' && c <= '9') || c == '_';
    }

    bool IsWellFormed(std::string_view path) {
        if (path.size() < 2 || path.front() != '/' || path.back() == '/') {
            return false;
        }
        char previous = '\0';
        for (const char c : path) {
            if (c == '/') {
                if (previous == '/') {
                    return false;
                }
            } else if (!IsPathCharacter(c)) {
                return false;
            }
            previous = c;
        }
        return true;
    }
}

Result<ObjectPath, SecretServiceFailure> ObjectPath::Create(std::string path) {
    if (path == BusConstants::NO_OBJECT_PATH) {
        return Result<ObjectPath, SecretServiceFailure>::Err(
            SecretServiceFailure::InvalidInput("The \"/\" sentinel does not name an object"));
    }
    if (!IsWellFormed(path)) {
        return Result<ObjectPath, SecretServiceFailure>::Err(
            SecretServiceFailure::InvalidInput("Malformed object path: '" + path + "'"));
    }
    return Result<ObjectPath, SecretServiceFailure>::Ok(ObjectPath(std::move(path)));
}

Result<Option<ObjectPath>, SecretServiceFailure> ObjectPath::FromWire(std::string_view wire_path) {
    if (wire_path == BusConstants::NO_OBJECT_PATH) {
        return Result<Option<ObjectPath>, SecretServiceFailure>::Ok(None<ObjectPath>());
    }
    return Create(std::string(wire_path)).Map([](ObjectPath path) { return Some(std::move(path)); });
}

Result<std::vector<ObjectPath>, SecretServiceFailure> ObjectPath::FromWireList(
    const std::vector<WirePath>& wire_paths) {
    std::vector<ObjectPath> paths;
    paths.reserve(wire_paths.size());
    for (const auto& wire_path : wire_paths) {
        auto path = FromWire(wire_path);
        if (path.IsErr()) {
            return Result<std::vector<ObjectPath>, SecretServiceFailure>::Err(std::move(path).UnwrapErr());
        }
        if (auto value = std::move(path).Unwrap()) {
            paths.push_back(std::move(*value));
        }
    }
    return Result<std::vector<ObjectPath>, SecretServiceFailure>::Ok(std::move(paths));
}

WirePath ObjectPath::ToWire(const Option<ObjectPath>& path) {
    if (!path.has_value()) {
        return WirePath(BusConstants::NO_OBJECT_PATH);
    }
    return path->Value();
}

}
