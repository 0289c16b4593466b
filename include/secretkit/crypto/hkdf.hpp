#pragma once

#include "secretkit/core/result.hpp"
#include "secretkit/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace secretkit::service::crypto {

/**
 * @brief RFC 5869 HKDF over SHA-256, backed by OpenSSL's EVP_KDF
 *
 * The Secret Service DH algorithm derives its AES-128 key with an empty
 * salt and empty info, which is what the defaulted arguments give.
 */
class Hkdf {
public:
    /**
     * @brief Extract-then-expand into a caller-provided buffer
     *
     * @param ikm Input key material, must not be empty
     * @param output Buffer to fill, at most 255 * 32 bytes
     * @param salt Optional salt (empty means HashLen zero bytes)
     * @param info Optional context info
     */
    [[nodiscard]] static Result<Unit, SecretServiceFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, SecretServiceFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

private:
    Hkdf() = delete;
};

} // namespace secretkit::service::crypto
