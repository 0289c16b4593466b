#pragma once
#include "secretkit/core/result.hpp"
#include "secretkit/core/failures.hpp"
#include "secretkit/models/object_path.hpp"
#include "secretkit/models/secret.hpp"
#include "secretkit/service/item.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace secretkit::service {
    class SecretService;

    /// Handle to one collection (keyring); cheap to copy, valid while its SecretService lives.
    class Collection {
    public:
        Collection(const SecretService &service, ObjectPath path);

        [[nodiscard]] const ObjectPath &GetPath() const noexcept { return path_; }

        [[nodiscard]] Result<bool, SecretServiceFailure> IsLocked() const;
        [[nodiscard]] Result<Unit, SecretServiceFailure> EnsureUnlocked() const;
        [[nodiscard]] Result<Unit, SecretServiceFailure> Lock() const;
        [[nodiscard]] Result<Unit, SecretServiceFailure> Unlock() const;

        /// Deletes the collection and every item in it; may prompt.
        [[nodiscard]] Result<Unit, SecretServiceFailure> Delete() const;

        [[nodiscard]] Result<std::vector<Item>, SecretServiceFailure> GetAllItems() const;
        [[nodiscard]] Result<std::vector<Item>, SecretServiceFailure> SearchItems(
            const Attributes &attributes) const;

        [[nodiscard]] Result<std::string, SecretServiceFailure> GetLabel() const;
        [[nodiscard]] Result<Unit, SecretServiceFailure> SetLabel(std::string_view label) const;

        /**
         * @brief Store a new secret in this collection
         *
         * The secret is encrypted by the service's session before it leaves
         * the process. With `replace`, an existing item with identical
         * attributes is overwritten instead of duplicated.
         */
        [[nodiscard]] Result<Item, SecretServiceFailure> CreateItem(
            std::string_view label,
            const Attributes &attributes,
            std::span<const uint8_t> secret,
            bool replace,
            std::string_view content_type) const;

        bool operator==(const Collection &other) const noexcept { return path_ == other.path_; }

    private:
        [[nodiscard]] Result<std::vector<Item>, SecretServiceFailure> ToItems(
            const std::vector<models::WirePath> &wire_paths) const;

        const SecretService *service_;
        ObjectPath path_;
    };
}
