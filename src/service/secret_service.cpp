#include "secretkit/service/secret_service.hpp"
#include "secretkit/core/constants.hpp"

#include <algorithm>
#include <string>

namespace secretkit::service {
    namespace {
        Result<ObjectPath, SecretServiceFailure> ServicePath() {
            return ObjectPath::Create(std::string(BusConstants::SERVICE_PATH));
        }

        std::vector<ObjectPath> PathsOf(const std::vector<Item> &items) {
            std::vector<ObjectPath> paths;
            paths.reserve(items.size());
            for (const auto &item : items) {
                paths.push_back(item.GetPath());
            }
            return paths;
        }

        template<typename Object>
        Result<std::vector<Object>, SecretServiceFailure> ToObjects(
            const SecretService &service,
            const std::vector<models::WirePath> &wire_paths) {
            return ObjectPath::FromWireList(wire_paths).Map([&service](std::vector<ObjectPath> paths) {
                std::vector<Object> objects;
                objects.reserve(paths.size());
                for (auto &path : paths) {
                    objects.emplace_back(service, std::move(path));
                }
                return objects;
            });
        }
    }

    SecretService::SecretService(ISecretServiceBus &bus, ServiceConfig config, EncryptionSession session)
        : bus_(bus)
        , config_(std::move(config))
        , session_(std::move(session))
        , prompts_(bus, config_.GetWindowId())
        , lock_unlock_(bus, prompts_) {}

    Result<std::unique_ptr<SecretService>, SecretServiceFailure> SecretService::Connect(
        ISecretServiceBus &bus,
        ServiceConfig config) {
        auto session = EncryptionSession::Negotiate(bus, config.GetEncryption());
        if (session.IsErr()) {
            return Result<std::unique_ptr<SecretService>, SecretServiceFailure>::Err(
                std::move(session).UnwrapErr());
        }
        return Result<std::unique_ptr<SecretService>, SecretServiceFailure>::Ok(
            std::unique_ptr<SecretService>(
                new SecretService(bus, std::move(config), std::move(session).Unwrap())));
    }

    Result<std::vector<Collection>, SecretServiceFailure> SecretService::GetAllCollections() const {
        auto service_path = ServicePath();
        if (service_path.IsErr()) {
            return Result<std::vector<Collection>, SecretServiceFailure>::Err(
                std::move(service_path).UnwrapErr());
        }
        auto wire_paths = bus_.GetPathListProperty(
            service_path.Unwrap(), BusConstants::SERVICE_INTERFACE, BusConstants::PROPERTY_COLLECTIONS);
        if (wire_paths.IsErr()) {
            return Result<std::vector<Collection>, SecretServiceFailure>::Err(
                std::move(wire_paths).UnwrapErr());
        }
        return ToObjects<Collection>(*this, wire_paths.Unwrap());
    }

    Result<Collection, SecretServiceFailure> SecretService::GetCollectionByAlias(const std::string_view alias) const {
        auto wire_path = bus_.ReadAlias(alias);
        if (wire_path.IsErr()) {
            return Result<Collection, SecretServiceFailure>::Err(std::move(wire_path).UnwrapErr());
        }
        auto path = ObjectPath::FromWire(wire_path.Unwrap());
        if (path.IsErr()) {
            return Result<Collection, SecretServiceFailure>::Err(std::move(path).UnwrapErr());
        }
        if (!path.Unwrap().has_value()) {
            return Result<Collection, SecretServiceFailure>::Err(
                SecretServiceFailure::NoResult(
                    std::string(ErrorMessages::NO_SUCH_ALIAS) + ": " + std::string(alias)));
        }
        return Result<Collection, SecretServiceFailure>::Ok(Collection(*this, std::move(*path.Unwrap())));
    }

    Result<Collection, SecretServiceFailure> SecretService::GetDefaultCollection() const {
        return GetCollectionByAlias(BusConstants::DEFAULT_ALIAS);
    }

    Result<Collection, SecretServiceFailure> SecretService::GetAnyCollection() const {
        for (const std::string_view alias : {BusConstants::DEFAULT_ALIAS, BusConstants::SESSION_ALIAS}) {
            auto by_alias = GetCollectionByAlias(alias);
            if (by_alias.IsOk()) {
                return by_alias;
            }
        }

        auto all = GetAllCollections();
        if (all.IsErr()) {
            return Result<Collection, SecretServiceFailure>::Err(std::move(all).UnwrapErr());
        }
        auto collections = std::move(all).Unwrap();
        if (collections.empty()) {
            return Result<Collection, SecretServiceFailure>::Err(
                SecretServiceFailure::NoResult(std::string(ErrorMessages::NO_COLLECTIONS)));
        }
        return Result<Collection, SecretServiceFailure>::Ok(collections.front());
    }

    Result<Collection, SecretServiceFailure> SecretService::CreateCollection(
        const std::string_view label,
        const std::string_view alias) const {
        auto reply = bus_.CreateCollection(label, alias);
        if (reply.IsErr()) {
            return Result<Collection, SecretServiceFailure>::Err(std::move(reply).UnwrapErr());
        }
        const auto &[wire_collection, wire_prompt] = reply.Unwrap();

        auto created = ObjectPath::FromWire(wire_collection);
        if (created.IsErr()) {
            return Result<Collection, SecretServiceFailure>::Err(std::move(created).UnwrapErr());
        }
        if (auto &collection_path = created.Unwrap(); collection_path.has_value()) {
            return Result<Collection, SecretServiceFailure>::Ok(Collection(*this, std::move(*collection_path)));
        }

        auto resolved = ResolveWirePrompt(wire_prompt);
        if (resolved.IsErr()) {
            return Result<Collection, SecretServiceFailure>::Err(std::move(resolved).UnwrapErr());
        }
        auto path = PromptCoordinator::RequireObjectPath(resolved.Unwrap());
        if (path.IsErr()) {
            return Result<Collection, SecretServiceFailure>::Err(std::move(path).UnwrapErr());
        }
        return Result<Collection, SecretServiceFailure>::Ok(Collection(*this, std::move(path).Unwrap()));
    }

    Result<SearchItemsResult, SecretServiceFailure> SecretService::SearchItems(const Attributes &attributes) const {
        auto reply = bus_.SearchItems(attributes);
        if (reply.IsErr()) {
            return Result<SearchItemsResult, SecretServiceFailure>::Err(std::move(reply).UnwrapErr());
        }
        auto unlocked = ToObjects<Item>(*this, reply.Unwrap().unlocked);
        if (unlocked.IsErr()) {
            return Result<SearchItemsResult, SecretServiceFailure>::Err(std::move(unlocked).UnwrapErr());
        }
        auto locked = ToObjects<Item>(*this, reply.Unwrap().locked);
        if (locked.IsErr()) {
            return Result<SearchItemsResult, SecretServiceFailure>::Err(std::move(locked).UnwrapErr());
        }
        return Result<SearchItemsResult, SecretServiceFailure>::Ok(
            SearchItemsResult{std::move(unlocked).Unwrap(), std::move(locked).Unwrap()});
    }

    Result<Unit, SecretServiceFailure> SecretService::UnlockAll(const std::vector<Item> &items) const {
        return LockUnlockAll(LockAction::Unlock, PathsOf(items));
    }

    Result<Unit, SecretServiceFailure> SecretService::LockAll(const std::vector<Item> &items) const {
        return LockUnlockAll(LockAction::Lock, PathsOf(items));
    }

    Result<Unit, SecretServiceFailure> SecretService::LockUnlockAll(
        const LockAction action,
        const std::vector<ObjectPath> &paths) const {
        return lock_unlock_.Apply(action, paths, GetPromptTimeout());
    }

    Result<models::PromptResult, SecretServiceFailure> SecretService::ResolvePrompt(
        const Option<ObjectPath> &prompt) const {
        return prompts_.Resolve(prompt, GetPromptTimeout());
    }

    Result<models::PromptResult, SecretServiceFailure> SecretService::ResolveWirePrompt(
        const models::WirePath &prompt) const {
        return ObjectPath::FromWire(prompt).Bind([this](Option<ObjectPath> path) {
            return ResolvePrompt(path);
        });
    }

    Option<std::chrono::milliseconds> SecretService::GetPromptTimeout() const {
        const auto &timeout = config_.GetPromptTimeout();
        if (!timeout.has_value()) {
            return None<std::chrono::milliseconds>();
        }
        // Saturate: larger second counts overflow the millisecond representation.
        constexpr auto limit = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::milliseconds::max());
        if (*timeout >= limit) {
            return Some(std::chrono::milliseconds::max());
        }
        return Some(std::chrono::duration_cast<std::chrono::milliseconds>(*timeout));
    }
}
