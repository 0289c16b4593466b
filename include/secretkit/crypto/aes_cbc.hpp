#pragma once
#include "secretkit/core/result.hpp"
#include "secretkit/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace secretkit::service::crypto {
using service::Result;
using service::SecretServiceFailure;

/**
 * AES-128-CBC with PKCS#7 padding, the cipher of the
 * dh-ietf1024-sha256-aes128-cbc-pkcs7 session algorithm.
 *
 * Stateless: the caller supplies a fresh 16-byte IV per call.
 * EncryptionSession owns IV generation; nothing below it may reuse one.
 *
 * Decrypt rejects a ciphertext that is empty or not a whole number of
 * blocks before touching OpenSSL, and reports bad padding as a Crypto
 * failure instead of returning a truncated buffer.
 */
class AesCbc {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, SecretServiceFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> plaintext);
    [[nodiscard]] static Result<std::vector<uint8_t>, SecretServiceFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> ciphertext);
private:
    AesCbc() = delete;
};
}
