#pragma once
#include "secretkit/core/result.hpp"
#include "secretkit/core/option.hpp"
#include "secretkit/core/failures.hpp"
#include <compare>
#include <string>
#include <string_view>
#include <vector>
namespace secretkit::service::models {

/// A bus object path exactly as it travels on the wire; may be the "/" sentinel.
using WirePath = std::string;

/**
 * @brief Reference to a live object on the secret service
 *
 * Never holds the "/" sentinel: paths coming off the bus go through
 * FromWire(), which turns "no object" into None and rejects anything
 * that is not a valid object path.
 */
class ObjectPath {
public:
    [[nodiscard]] static Result<ObjectPath, SecretServiceFailure> Create(std::string path);

    [[nodiscard]] static Result<Option<ObjectPath>, SecretServiceFailure> FromWire(std::string_view wire_path);

    /// Drops sentinels; fails on the first malformed entry.
    [[nodiscard]] static Result<std::vector<ObjectPath>, SecretServiceFailure> FromWireList(
        const std::vector<WirePath>& wire_paths);

    [[nodiscard]] static WirePath ToWire(const Option<ObjectPath>& path);

    [[nodiscard]] const std::string& Value() const noexcept {
        return path_;
    }

    [[nodiscard]] bool StartsWith(std::string_view prefix) const noexcept {
        return std::string_view(path_).starts_with(prefix);
    }

    auto operator<=>(const ObjectPath&) const = default;

private:
    explicit ObjectPath(std::string path) : path_(std::move(path)) {}

    std::string path_;
};
}
