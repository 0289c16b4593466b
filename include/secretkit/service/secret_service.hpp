#pragma once
#include "secretkit/core/result.hpp"
#include "secretkit/core/option.hpp"
#include "secretkit/core/failures.hpp"
#include "secretkit/configuration/service_config.hpp"
#include "secretkit/enums/lock_action.hpp"
#include "secretkit/interfaces/i_secret_service_bus.hpp"
#include "secretkit/prompt/lock_unlock_orchestrator.hpp"
#include "secretkit/prompt/prompt_coordinator.hpp"
#include "secretkit/session/encryption_session.hpp"
#include "secretkit/service/collection.hpp"
#include "secretkit/service/item.hpp"
#include <chrono>
#include <memory>
#include <string_view>
#include <vector>

namespace secretkit::service {
    using configuration::ServiceConfig;
    using enums::LockAction;
    using interfaces::ISecretServiceBus;
    using prompt::LockUnlockOrchestrator;
    using prompt::PromptCoordinator;
    using session::EncryptionSession;

    struct SearchItemsResult {
        std::vector<Item> unlocked;
        std::vector<Item> locked;
    };

    /**
     * @brief Entry point: one bus connection plus its negotiated session
     *
     * Connect() opens the encryption session; collections and items handed
     * out afterwards borrow this object. Not safe for concurrent use; open a
     * second bus connection and SecretService for parallel prompt flows.
     *
     * @example
     * ```cpp
     * auto service = SecretService::Connect(bus, ServiceConfig::Default()).Unwrap();
     * auto collection = service->GetDefaultCollection().Unwrap();
     * auto item = collection.CreateItem("token", {{"app", "demo"}}, secret, true, "text/plain");
     * ```
     */
    class SecretService {
    public:
        [[nodiscard]] static Result<std::unique_ptr<SecretService>, SecretServiceFailure> Connect(
            ISecretServiceBus &bus,
            ServiceConfig config);

        [[nodiscard]] Result<std::vector<Collection>, SecretServiceFailure> GetAllCollections() const;

        /// NoResult when nothing is bound to `alias`.
        [[nodiscard]] Result<Collection, SecretServiceFailure> GetCollectionByAlias(std::string_view alias) const;

        [[nodiscard]] Result<Collection, SecretServiceFailure> GetDefaultCollection() const;

        /// The "default" collection, else "session", else the first one listed.
        [[nodiscard]] Result<Collection, SecretServiceFailure> GetAnyCollection() const;

        [[nodiscard]] Result<Collection, SecretServiceFailure> CreateCollection(
            std::string_view label,
            std::string_view alias) const;

        [[nodiscard]] Result<SearchItemsResult, SecretServiceFailure> SearchItems(
            const Attributes &attributes) const;

        [[nodiscard]] Result<Unit, SecretServiceFailure> UnlockAll(const std::vector<Item> &items) const;

        [[nodiscard]] Result<Unit, SecretServiceFailure> LockAll(const std::vector<Item> &items) const;

        [[nodiscard]] Result<Unit, SecretServiceFailure> LockUnlockAll(
            LockAction action,
            const std::vector<ObjectPath> &paths) const;

        /// Resolve a prompt under this connection's timeout policy.
        [[nodiscard]] Result<models::PromptResult, SecretServiceFailure> ResolvePrompt(
            const Option<ObjectPath> &prompt) const;

        /// Same as ResolvePrompt() for a prompt path straight off the bus; a malformed path is an error.
        [[nodiscard]] Result<models::PromptResult, SecretServiceFailure> ResolveWirePrompt(
            const models::WirePath &prompt) const;

        [[nodiscard]] ISecretServiceBus &GetBus() const noexcept { return bus_; }

        [[nodiscard]] const EncryptionSession &GetSession() const noexcept { return session_; }

        [[nodiscard]] const ServiceConfig &GetConfig() const noexcept { return config_; }

        [[nodiscard]] Option<std::chrono::milliseconds> GetPromptTimeout() const;

        SecretService(const SecretService &) = delete;
        SecretService &operator=(const SecretService &) = delete;
        SecretService(SecretService &&) = delete;
        SecretService &operator=(SecretService &&) = delete;
        ~SecretService() = default;

    private:
        SecretService(ISecretServiceBus &bus, ServiceConfig config, EncryptionSession session);

        ISecretServiceBus &bus_;
        ServiceConfig config_;
        EncryptionSession session_;
        PromptCoordinator prompts_;
        LockUnlockOrchestrator lock_unlock_;
    };
}
