#include "secretkit/service/collection.hpp"
#include "secretkit/service/secret_service.hpp"
#include "secretkit/core/constants.hpp"

namespace secretkit::service {
    Collection::Collection(const SecretService &service, ObjectPath path)
        : service_(&service)
        , path_(std::move(path)) {}

    Result<bool, SecretServiceFailure> Collection::IsLocked() const {
        return service_->GetBus().GetBoolProperty(
            path_, BusConstants::COLLECTION_INTERFACE, BusConstants::PROPERTY_LOCKED);
    }

    Result<Unit, SecretServiceFailure> Collection::EnsureUnlocked() const {
        auto locked = IsLocked();
        if (locked.IsErr()) {
            return Result<Unit, SecretServiceFailure>::Err(std::move(locked).UnwrapErr());
        }
        if (!locked.Unwrap()) {
            return Result<Unit, SecretServiceFailure>::Ok(unit);
        }
        return Unlock();
    }

    Result<Unit, SecretServiceFailure> Collection::Lock() const {
        return service_->LockUnlockAll(LockAction::Lock, {path_});
    }

    Result<Unit, SecretServiceFailure> Collection::Unlock() const {
        return service_->LockUnlockAll(LockAction::Unlock, {path_});
    }

    Result<Unit, SecretServiceFailure> Collection::Delete() const {
        auto prompt = service_->GetBus().Delete(path_, BusConstants::COLLECTION_INTERFACE);
        if (prompt.IsErr()) {
            return Result<Unit, SecretServiceFailure>::Err(std::move(prompt).UnwrapErr());
        }
        return service_->ResolveWirePrompt(prompt.Unwrap())
            .Map([](models::PromptResult) { return unit; });
    }

    Result<std::vector<Item>, SecretServiceFailure> Collection::GetAllItems() const {
        auto wire_paths = service_->GetBus().GetPathListProperty(
            path_, BusConstants::COLLECTION_INTERFACE, BusConstants::PROPERTY_ITEMS);
        if (wire_paths.IsErr()) {
            return Result<std::vector<Item>, SecretServiceFailure>::Err(std::move(wire_paths).UnwrapErr());
        }
        return ToItems(wire_paths.Unwrap());
    }

    Result<std::vector<Item>, SecretServiceFailure> Collection::SearchItems(const Attributes &attributes) const {
        auto wire_paths = service_->GetBus().SearchCollectionItems(path_, attributes);
        if (wire_paths.IsErr()) {
            return Result<std::vector<Item>, SecretServiceFailure>::Err(std::move(wire_paths).UnwrapErr());
        }
        return ToItems(wire_paths.Unwrap());
    }

    Result<std::string, SecretServiceFailure> Collection::GetLabel() const {
        return service_->GetBus().GetStringProperty(
            path_, BusConstants::COLLECTION_INTERFACE, BusConstants::PROPERTY_LABEL);
    }

    Result<Unit, SecretServiceFailure> Collection::SetLabel(const std::string_view label) const {
        return service_->GetBus().SetStringProperty(
            path_, BusConstants::COLLECTION_INTERFACE, BusConstants::PROPERTY_LABEL, label);
    }

    Result<Item, SecretServiceFailure> Collection::CreateItem(
        const std::string_view label,
        const Attributes &attributes,
        std::span<const uint8_t> secret,
        const bool replace,
        const std::string_view content_type) const {
        auto wire_secret = service_->GetSession().EncodeSecret(
            models::Secret{std::vector<uint8_t>(secret.begin(), secret.end()), std::string(content_type)});
        if (wire_secret.IsErr()) {
            return Result<Item, SecretServiceFailure>::Err(std::move(wire_secret).UnwrapErr());
        }

        auto reply = service_->GetBus().CreateItem(path_, label, attributes, wire_secret.Unwrap(), replace);
        if (reply.IsErr()) {
            return Result<Item, SecretServiceFailure>::Err(std::move(reply).UnwrapErr());
        }
        const auto &[wire_item, wire_prompt] = reply.Unwrap();

        auto created = ObjectPath::FromWire(wire_item);
        if (created.IsErr()) {
            return Result<Item, SecretServiceFailure>::Err(std::move(created).UnwrapErr());
        }
        if (auto &item_path = created.Unwrap(); item_path.has_value()) {
            return Result<Item, SecretServiceFailure>::Ok(Item(*service_, std::move(*item_path)));
        }

        auto resolved = service_->ResolveWirePrompt(wire_prompt);
        if (resolved.IsErr()) {
            return Result<Item, SecretServiceFailure>::Err(std::move(resolved).UnwrapErr());
        }
        auto path = PromptCoordinator::RequireObjectPath(resolved.Unwrap());
        if (path.IsErr()) {
            return Result<Item, SecretServiceFailure>::Err(std::move(path).UnwrapErr());
        }
        return Result<Item, SecretServiceFailure>::Ok(Item(*service_, std::move(path).Unwrap()));
    }

    Result<std::vector<Item>, SecretServiceFailure> Collection::ToItems(
        const std::vector<models::WirePath> &wire_paths) const {
        return ObjectPath::FromWireList(wire_paths).Map([this](std::vector<ObjectPath> paths) {
            std::vector<Item> items;
            items.reserve(paths.size());
            for (auto &path : paths) {
                items.emplace_back(*service_, std::move(path));
            }
            return items;
        });
    }
}
