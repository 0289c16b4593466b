#pragma once
#include "secretkit/core/result.hpp"
#include "secretkit/core/failures.hpp"
#include "secretkit/models/object_path.hpp"
#include "secretkit/models/secret.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace secretkit::service {
    class SecretService;
    using models::ObjectPath;
    using models::Attributes;

    /// Handle to one secret item; cheap to copy, valid while its SecretService lives.
    class Item {
    public:
        Item(const SecretService &service, ObjectPath path);

        [[nodiscard]] const ObjectPath &GetPath() const noexcept { return path_; }

        [[nodiscard]] Result<bool, SecretServiceFailure> IsLocked() const;
        [[nodiscard]] Result<Unit, SecretServiceFailure> EnsureUnlocked() const;
        [[nodiscard]] Result<Unit, SecretServiceFailure> Lock() const;
        [[nodiscard]] Result<Unit, SecretServiceFailure> Unlock() const;

        [[nodiscard]] Result<Attributes, SecretServiceFailure> GetAttributes() const;
        [[nodiscard]] Result<Unit, SecretServiceFailure> SetAttributes(const Attributes &attributes) const;
        [[nodiscard]] Result<std::string, SecretServiceFailure> GetLabel() const;
        [[nodiscard]] Result<Unit, SecretServiceFailure> SetLabel(std::string_view label) const;

        /// Deletes the remote object; this handle is dangling afterwards.
        [[nodiscard]] Result<Unit, SecretServiceFailure> Delete() const;

        [[nodiscard]] Result<std::vector<uint8_t>, SecretServiceFailure> GetSecret() const;
        [[nodiscard]] Result<std::string, SecretServiceFailure> GetSecretContentType() const;
        [[nodiscard]] Result<Unit, SecretServiceFailure> SetSecret(
            std::span<const uint8_t> secret,
            std::string_view content_type) const;

        /// Seconds since the Unix epoch.
        [[nodiscard]] Result<uint64_t, SecretServiceFailure> GetCreated() const;
        [[nodiscard]] Result<uint64_t, SecretServiceFailure> GetModified() const;

        bool operator==(const Item &other) const noexcept { return path_ == other.path_; }

    private:
        [[nodiscard]] Result<models::Secret, SecretServiceFailure> FetchSecret() const;

        const SecretService *service_;
        ObjectPath path_;
    };
}
