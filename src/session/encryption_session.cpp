#include "secretkit/session/encryption_session.hpp"
#include "secretkit/crypto/aes_cbc.hpp"
#include "secretkit/crypto/sodium_interop.hpp"
#include "secretkit/core/constants.hpp"
#include "secretkit/debug/session_logger.hpp"

#include <format>
#include <string>

namespace secretkit::service::session {
    using crypto::AesCbc;
    using crypto::SodiumInterop;

    namespace {
        SecretServiceFailure ToNegotiationFailure(SecretServiceFailure failure) {
            if (failure.Is(SecretServiceFailureType::NotSupported)) {
                return SecretServiceFailure::Negotiation(
                    "Secret service rejected the session algorithm: " + failure.message);
            }
            return failure;
        }

        Result<Unit, SecretServiceFailure> EnsureSodium() {
            auto init = SodiumInterop::Initialize();
            if (init.IsErr()) {
                return Result<Unit, SecretServiceFailure>::Err(
                    SecretServiceFailure::FromSodiumFailure(init.UnwrapErr()));
            }
            return Result<Unit, SecretServiceFailure>::Ok(unit);
        }
    }

    Result<EncryptionSession, SecretServiceFailure> EncryptionSession::Negotiate(
        ISecretServiceBus &bus,
        const EncryptionType type) {
        auto init = EnsureSodium();
        if (init.IsErr()) {
            return Result<EncryptionSession, SecretServiceFailure>::Err(std::move(init).UnwrapErr());
        }

        if (type == EncryptionType::Dh) {
            auto key_exchange = DhKeyExchange::Generate();
            if (key_exchange.IsErr()) {
                return Result<EncryptionSession, SecretServiceFailure>::Err(
                    std::move(key_exchange).UnwrapErr());
            }
            return NegotiateDh(bus, std::move(key_exchange).Unwrap());
        }

        auto reply = bus.OpenSession(enums::AlgorithmName(EncryptionType::Plain), {});
        if (reply.IsErr()) {
            return Result<EncryptionSession, SecretServiceFailure>::Err(
                ToNegotiationFailure(std::move(reply).UnwrapErr()));
        }

        auto session_path = ObjectPath::FromWire(reply.Unwrap().session);
        if (session_path.IsErr()) {
            return Result<EncryptionSession, SecretServiceFailure>::Err(std::move(session_path).UnwrapErr());
        }
        debug::LogSessionNegotiated(enums::AlgorithmName(EncryptionType::Plain), reply.Unwrap().session, {}, {}, {});
        return Result<EncryptionSession, SecretServiceFailure>::Ok(
            EncryptionSession(EncryptionType::Plain, std::move(session_path).Unwrap(), SecureMemoryHandle()));
    }

    Result<EncryptionSession, SecretServiceFailure> EncryptionSession::NegotiateDh(
        ISecretServiceBus &bus,
        DhKeyExchange key_exchange) {
        auto init = EnsureSodium();
        if (init.IsErr()) {
            return Result<EncryptionSession, SecretServiceFailure>::Err(std::move(init).UnwrapErr());
        }

        auto reply = bus.OpenSession(enums::AlgorithmName(EncryptionType::Dh), key_exchange.PublicKey());
        if (reply.IsErr()) {
            return Result<EncryptionSession, SecretServiceFailure>::Err(
                ToNegotiationFailure(std::move(reply).UnwrapErr()));
        }
        const auto &[peer_public, wire_session] = reply.Unwrap();
        auto session_path = ObjectPath::FromWire(wire_session);
        if (session_path.IsErr()) {
            return Result<EncryptionSession, SecretServiceFailure>::Err(std::move(session_path).UnwrapErr());
        }

        auto key = key_exchange.DeriveSessionKey(peer_public);
        if (key.IsErr()) {
            const auto &failure = key.UnwrapErr();
            return Result<EncryptionSession, SecretServiceFailure>::Err(
                failure.Is(SecretServiceFailureType::Negotiation)
                    ? failure
                    : SecretServiceFailure::Negotiation("Session key derivation failed: " + failure.message));
        }

#ifdef SECRETKIT_DEBUG_LOG
        if (auto key_bytes = key.Unwrap().ReadBytes(); key_bytes.IsOk()) {
            debug::LogSessionNegotiated(enums::AlgorithmName(EncryptionType::Dh), wire_session,
                key_exchange.PublicKey(), peer_public, key_bytes.Unwrap());
        }
#endif

        return Result<EncryptionSession, SecretServiceFailure>::Ok(
            EncryptionSession(EncryptionType::Dh, std::move(session_path).Unwrap(), std::move(key).Unwrap()));
    }

    Result<EncryptedPayload, SecretServiceFailure> EncryptionSession::Encrypt(
        std::span<const uint8_t> plaintext) const {
        if (type_ == EncryptionType::Plain) {
            return Result<EncryptedPayload, SecretServiceFailure>::Ok(
                EncryptedPayload{{}, std::vector<uint8_t>(plaintext.begin(), plaintext.end())});
        }

        std::vector<uint8_t> iv = SodiumInterop::GetRandomBytes(Constants::AES_CBC_IV_SIZE);
        auto sealed = key_.WithReadAccess([&](std::span<const uint8_t> key) {
            return AesCbc::Encrypt(key, iv, plaintext);
        });
        if (sealed.IsErr()) {
            return Result<EncryptedPayload, SecretServiceFailure>::Err(
                SecretServiceFailure::FromSodiumFailure(sealed.UnwrapErr()));
        }
        auto ciphertext = std::move(sealed).Unwrap();
        if (ciphertext.IsErr()) {
            return Result<EncryptedPayload, SecretServiceFailure>::Err(std::move(ciphertext).UnwrapErr());
        }

        debug::LogSecretEncrypted(iv, plaintext.size(), ciphertext.Unwrap().size());
        return Result<EncryptedPayload, SecretServiceFailure>::Ok(
            EncryptedPayload{std::move(iv), std::move(ciphertext).Unwrap()});
    }

    Result<std::vector<uint8_t>, SecretServiceFailure> EncryptionSession::Decrypt(
        std::span<const uint8_t> iv,
        std::span<const uint8_t> ciphertext) const {
        if (type_ == EncryptionType::Plain) {
            if (!iv.empty()) {
                return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
                    SecretServiceFailure::Crypto(
                        std::format("Plain session received a {}-byte IV", iv.size())));
            }
            return Result<std::vector<uint8_t>, SecretServiceFailure>::Ok(
                std::vector<uint8_t>(ciphertext.begin(), ciphertext.end()));
        }

        auto opened = key_.WithReadAccess([&](std::span<const uint8_t> key) {
            return AesCbc::Decrypt(key, iv, ciphertext);
        });
        if (opened.IsErr()) {
            return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
                SecretServiceFailure::FromSodiumFailure(opened.UnwrapErr()));
        }
        return std::move(opened).Unwrap();
    }

    Result<WireSecret, SecretServiceFailure> EncryptionSession::EncodeSecret(const Secret &secret) const {
        auto payload = Encrypt(secret.value);
        if (payload.IsErr()) {
            return Result<WireSecret, SecretServiceFailure>::Err(std::move(payload).UnwrapErr());
        }
        auto [iv, ciphertext] = std::move(payload).Unwrap();
        return Result<WireSecret, SecretServiceFailure>::Ok(
            WireSecret{GetWireSessionPath(), std::move(iv), std::move(ciphertext), secret.content_type});
    }

    Result<Secret, SecretServiceFailure> EncryptionSession::DecodeSecret(const WireSecret &wire_secret) const {
        if (wire_secret.session != GetWireSessionPath()) {
            return Result<Secret, SecretServiceFailure>::Err(
                SecretServiceFailure::Crypto(std::string(ErrorMessages::SESSION_MISMATCH) +
                    ": " + wire_secret.session));
        }

        auto plaintext = Decrypt(wire_secret.parameters, wire_secret.value);
        if (plaintext.IsErr()) {
            return Result<Secret, SecretServiceFailure>::Err(std::move(plaintext).UnwrapErr());
        }
        return Result<Secret, SecretServiceFailure>::Ok(
            Secret{std::move(plaintext).Unwrap(), wire_secret.content_type});
    }
}
