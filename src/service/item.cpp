#include "secretkit/service/item.hpp"
#include "secretkit/service/secret_service.hpp"
#include "secretkit/core/constants.hpp"

namespace secretkit::service {
    Item::Item(const SecretService &service, ObjectPath path)
        : service_(&service)
        , path_(std::move(path)) {}

    Result<bool, SecretServiceFailure> Item::IsLocked() const {
        return service_->GetBus().GetBoolProperty(
            path_, BusConstants::ITEM_INTERFACE, BusConstants::PROPERTY_LOCKED);
    }

    Result<Unit, SecretServiceFailure> Item::EnsureUnlocked() const {
        auto locked = IsLocked();
        if (locked.IsErr()) {
            return Result<Unit, SecretServiceFailure>::Err(std::move(locked).UnwrapErr());
        }
        if (!locked.Unwrap()) {
            return Result<Unit, SecretServiceFailure>::Ok(unit);
        }
        return Unlock();
    }

    Result<Unit, SecretServiceFailure> Item::Lock() const {
        return service_->LockUnlockAll(LockAction::Lock, {path_});
    }

    Result<Unit, SecretServiceFailure> Item::Unlock() const {
        return service_->LockUnlockAll(LockAction::Unlock, {path_});
    }

    Result<Attributes, SecretServiceFailure> Item::GetAttributes() const {
        return service_->GetBus().GetAttributesProperty(
            path_, BusConstants::ITEM_INTERFACE, BusConstants::PROPERTY_ATTRIBUTES);
    }

    Result<Unit, SecretServiceFailure> Item::SetAttributes(const Attributes &attributes) const {
        return service_->GetBus().SetAttributesProperty(
            path_, BusConstants::ITEM_INTERFACE, BusConstants::PROPERTY_ATTRIBUTES, attributes);
    }

    Result<std::string, SecretServiceFailure> Item::GetLabel() const {
        return service_->GetBus().GetStringProperty(
            path_, BusConstants::ITEM_INTERFACE, BusConstants::PROPERTY_LABEL);
    }

    Result<Unit, SecretServiceFailure> Item::SetLabel(const std::string_view label) const {
        return service_->GetBus().SetStringProperty(
            path_, BusConstants::ITEM_INTERFACE, BusConstants::PROPERTY_LABEL, label);
    }

    Result<Unit, SecretServiceFailure> Item::Delete() const {
        auto prompt = service_->GetBus().Delete(path_, BusConstants::ITEM_INTERFACE);
        if (prompt.IsErr()) {
            return Result<Unit, SecretServiceFailure>::Err(std::move(prompt).UnwrapErr());
        }
        return service_->ResolveWirePrompt(prompt.Unwrap())
            .Map([](models::PromptResult) { return unit; });
    }

    Result<models::Secret, SecretServiceFailure> Item::FetchSecret() const {
        const auto &session = service_->GetSession();
        auto wire_secret = service_->GetBus().GetSecret(path_, session.GetWireSessionPath());
        if (wire_secret.IsErr()) {
            return Result<models::Secret, SecretServiceFailure>::Err(std::move(wire_secret).UnwrapErr());
        }
        return session.DecodeSecret(wire_secret.Unwrap());
    }

    Result<std::vector<uint8_t>, SecretServiceFailure> Item::GetSecret() const {
        return FetchSecret().Map([](models::Secret secret) { return std::move(secret.value); });
    }

    Result<std::string, SecretServiceFailure> Item::GetSecretContentType() const {
        return FetchSecret().Map([](models::Secret secret) { return std::move(secret.content_type); });
    }

    Result<Unit, SecretServiceFailure> Item::SetSecret(
        std::span<const uint8_t> secret,
        const std::string_view content_type) const {
        auto wire_secret = service_->GetSession().EncodeSecret(
            models::Secret{std::vector<uint8_t>(secret.begin(), secret.end()), std::string(content_type)});
        if (wire_secret.IsErr()) {
            return Result<Unit, SecretServiceFailure>::Err(std::move(wire_secret).UnwrapErr());
        }
        return service_->GetBus().SetSecret(path_, wire_secret.Unwrap());
    }

    Result<uint64_t, SecretServiceFailure> Item::GetCreated() const {
        return service_->GetBus().GetUInt64Property(
            path_, BusConstants::ITEM_INTERFACE, BusConstants::PROPERTY_CREATED);
    }

    Result<uint64_t, SecretServiceFailure> Item::GetModified() const {
        return service_->GetBus().GetUInt64Property(
            path_, BusConstants::ITEM_INTERFACE, BusConstants::PROPERTY_MODIFIED);
    }
}
