#pragma once

#include "secretkit/core/result.hpp"
#include "secretkit/core/failures.hpp"
#include "secretkit/crypto/sodium_secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace secretkit::service::crypto {

/**
 * @brief Finite-field Diffie-Hellman over the RFC 2409 1024-bit MODP group
 *
 * One instance is one ephemeral key pair. The private exponent lives in
 * secure memory and is released by the first DeriveSessionKey() call,
 * successful or not; a second call fails with InvalidState.
 *
 * Key derivation:
 *   S   = peer^x mod p, big-endian, left-padded to 128 bytes
 *   key = HKDF-SHA256(ikm = S, salt = empty, info = empty, L = 16)
 */
class DhKeyExchange {
public:
    [[nodiscard]] static Result<DhKeyExchange, SecretServiceFailure> Generate();

    /**
     * @brief Build a key pair from a known exponent (big-endian)
     *
     * Used for reproducible derivations; the exponent must satisfy
     * 1 < x < p - 1.
     */
    [[nodiscard]] static Result<DhKeyExchange, SecretServiceFailure> FromPrivateExponent(
        std::span<const uint8_t> exponent);

    /**
     * @brief Reject peer values outside 1 < y < p - 1 or longer than the group
     */
    [[nodiscard]] static Result<Unit, SecretServiceFailure> ValidatePeerPublicKey(
        std::span<const uint8_t> peer_public_key);

    [[nodiscard]] static std::vector<uint8_t> GroupPrime();

    [[nodiscard]] Result<SecureMemoryHandle, SecretServiceFailure> DeriveSessionKey(
        std::span<const uint8_t> peer_public_key);

    /// Minimal big-endian encoding of g^x mod p, as sent in OpenSession.
    [[nodiscard]] const std::vector<uint8_t>& PublicKey() const noexcept {
        return public_key_;
    }

    [[nodiscard]] bool HasPrivateExponent() const noexcept {
        return !private_exponent_.IsInvalid();
    }

    DhKeyExchange(DhKeyExchange&&) noexcept = default;
    DhKeyExchange& operator=(DhKeyExchange&&) noexcept = default;
    DhKeyExchange(const DhKeyExchange&) = delete;
    DhKeyExchange& operator=(const DhKeyExchange&) = delete;
    ~DhKeyExchange() = default;

private:
    DhKeyExchange(SecureMemoryHandle private_exponent, std::vector<uint8_t> public_key) noexcept
        : private_exponent_(std::move(private_exponent))
        , public_key_(std::move(public_key)) {}

    SecureMemoryHandle private_exponent_;
    std::vector<uint8_t> public_key_;
};

} // namespace secretkit::service::crypto
