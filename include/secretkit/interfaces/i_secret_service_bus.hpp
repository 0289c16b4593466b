#pragma once
#include "secretkit/core/result.hpp"
#include "secretkit/core/failures.hpp"
#include "secretkit/interfaces/i_prompt_subscription.hpp"
#include "secretkit/models/object_path.hpp"
#include "secretkit/models/secret.hpp"
#include "secretkit/models/bus_replies.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace secretkit::service::interfaces {
using service::Unit;
using models::ObjectPath;
using models::WirePath;
using models::Attributes;
using models::WireSecret;
using models::OpenSessionReply;
using models::LockReply;
using models::CreateReply;
using models::SearchReply;

/**
 * @brief Transport adapter for org.freedesktop.Secret.*
 *
 * One method per remote call on the Secret Service. Implementations own
 * the bus connection; an IPC failure or disconnect is reported as
 * SecretServiceFailureType::Transport, and a daemon that refuses a session
 * algorithm as NotSupported. Object paths returned here are raw wire paths
 * and may be the "/" sentinel.
 */
class ISecretServiceBus {
public:
    virtual ~ISecretServiceBus() = default;

    // Service
    [[nodiscard]] virtual Result<OpenSessionReply, SecretServiceFailure> OpenSession(
        std::string_view algorithm,
        std::span<const uint8_t> input) = 0;
    [[nodiscard]] virtual Result<WirePath, SecretServiceFailure> ReadAlias(std::string_view alias) = 0;
    [[nodiscard]] virtual Result<CreateReply, SecretServiceFailure> CreateCollection(
        std::string_view label,
        std::string_view alias) = 0;
    [[nodiscard]] virtual Result<SearchReply, SecretServiceFailure> SearchItems(
        const Attributes& attributes) = 0;
    [[nodiscard]] virtual Result<LockReply, SecretServiceFailure> Lock(
        const std::vector<ObjectPath>& objects) = 0;
    [[nodiscard]] virtual Result<LockReply, SecretServiceFailure> Unlock(
        const std::vector<ObjectPath>& objects) = 0;

    // Prompt
    [[nodiscard]] virtual Result<Unit, SecretServiceFailure> Prompt(
        const ObjectPath& prompt,
        std::string_view window_id) = 0;
    [[nodiscard]] virtual Result<Unit, SecretServiceFailure> Dismiss(const ObjectPath& prompt) = 0;
    [[nodiscard]] virtual Result<std::unique_ptr<IPromptSubscription>, SecretServiceFailure>
    SubscribePromptCompleted(const ObjectPath& prompt) = 0;

    // Collection
    [[nodiscard]] virtual Result<std::vector<WirePath>, SecretServiceFailure> SearchCollectionItems(
        const ObjectPath& collection,
        const Attributes& attributes) = 0;
    [[nodiscard]] virtual Result<CreateReply, SecretServiceFailure> CreateItem(
        const ObjectPath& collection,
        std::string_view label,
        const Attributes& attributes,
        const WireSecret& secret,
        bool replace) = 0;

    // Item
    [[nodiscard]] virtual Result<WireSecret, SecretServiceFailure> GetSecret(
        const ObjectPath& item,
        const WirePath& session) = 0;
    [[nodiscard]] virtual Result<Unit, SecretServiceFailure> SetSecret(
        const ObjectPath& item,
        const WireSecret& secret) = 0;

    // Collection.Delete / Item.Delete
    [[nodiscard]] virtual Result<WirePath, SecretServiceFailure> Delete(
        const ObjectPath& object,
        std::string_view interface) = 0;

    // org.freedesktop.DBus.Properties
    [[nodiscard]] virtual Result<bool, SecretServiceFailure> GetBoolProperty(
        const ObjectPath& object, std::string_view interface, std::string_view name) = 0;
    [[nodiscard]] virtual Result<uint64_t, SecretServiceFailure> GetUInt64Property(
        const ObjectPath& object, std::string_view interface, std::string_view name) = 0;
    [[nodiscard]] virtual Result<std::string, SecretServiceFailure> GetStringProperty(
        const ObjectPath& object, std::string_view interface, std::string_view name) = 0;
    [[nodiscard]] virtual Result<Unit, SecretServiceFailure> SetStringProperty(
        const ObjectPath& object, std::string_view interface, std::string_view name,
        std::string_view value) = 0;
    [[nodiscard]] virtual Result<std::vector<WirePath>, SecretServiceFailure> GetPathListProperty(
        const ObjectPath& object, std::string_view interface, std::string_view name) = 0;
    [[nodiscard]] virtual Result<Attributes, SecretServiceFailure> GetAttributesProperty(
        const ObjectPath& object, std::string_view interface, std::string_view name) = 0;
    [[nodiscard]] virtual Result<Unit, SecretServiceFailure> SetAttributesProperty(
        const ObjectPath& object, std::string_view interface, std::string_view name,
        const Attributes& value) = 0;
};
}
