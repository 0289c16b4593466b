#pragma once
#include "secretkit/core/result.hpp"
#include "secretkit/core/option.hpp"
#include "secretkit/core/failures.hpp"
#include "secretkit/crypto/dh_key_exchange.hpp"
#include "secretkit/crypto/sodium_secure_memory_handle.hpp"
#include "secretkit/enums/encryption_type.hpp"
#include "secretkit/interfaces/i_secret_service_bus.hpp"
#include "secretkit/models/object_path.hpp"
#include "secretkit/models/secret.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace secretkit::service::session {
    using service::Result;
    using service::Option;
    using service::SecretServiceFailure;
    using crypto::DhKeyExchange;
    using crypto::SecureMemoryHandle;
    using enums::EncryptionType;
    using interfaces::ISecretServiceBus;
    using models::ObjectPath;
    using models::WirePath;
    using models::Secret;
    using models::WireSecret;
    using models::EncryptedPayload;

    /**
     * @brief The cryptographic channel negotiated once per bus connection
     *
     * Move-only and immutable after Negotiate(): every Encrypt/Decrypt on a
     * connection uses the same key. Plain sessions hold no key and pass
     * values through with an empty IV.
     */
    class EncryptionSession {
    public:
        [[nodiscard]] static Result<EncryptionSession, SecretServiceFailure> Negotiate(
            ISecretServiceBus &bus,
            EncryptionType type);

        /**
         * @brief DH negotiation with a caller-built key pair
         *
         * The key pair's private exponent is consumed by the derivation.
         */
        [[nodiscard]] static Result<EncryptionSession, SecretServiceFailure> NegotiateDh(
            ISecretServiceBus &bus,
            DhKeyExchange key_exchange);

        [[nodiscard]] Result<EncryptedPayload, SecretServiceFailure> Encrypt(
            std::span<const uint8_t> plaintext) const;

        [[nodiscard]] Result<std::vector<uint8_t>, SecretServiceFailure> Decrypt(
            std::span<const uint8_t> iv,
            std::span<const uint8_t> ciphertext) const;

        [[nodiscard]] Result<WireSecret, SecretServiceFailure> EncodeSecret(const Secret &secret) const;

        [[nodiscard]] Result<Secret, SecretServiceFailure> DecodeSecret(const WireSecret &wire_secret) const;

        [[nodiscard]] EncryptionType GetType() const noexcept { return type_; }

        [[nodiscard]] const Option<ObjectPath> &GetSessionPath() const noexcept { return session_path_; }

        [[nodiscard]] WirePath GetWireSessionPath() const { return ObjectPath::ToWire(session_path_); }

        EncryptionSession(EncryptionSession &&) noexcept = default;
        EncryptionSession &operator=(EncryptionSession &&) noexcept = default;
        EncryptionSession(const EncryptionSession &) = delete;
        EncryptionSession &operator=(const EncryptionSession &) = delete;
        ~EncryptionSession() = default;

    private:
        EncryptionSession(EncryptionType type, Option<ObjectPath> session_path, SecureMemoryHandle key) noexcept
            : type_(type)
            , session_path_(std::move(session_path))
            , key_(std::move(key)) {}

        EncryptionType type_;
        Option<ObjectPath> session_path_;
        SecureMemoryHandle key_;
    };
}
