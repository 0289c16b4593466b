#include "secretkit/crypto/hkdf.hpp"
#include "secretkit/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <string>

namespace secretkit::service::crypto {

namespace {
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            EVP_KDF_CTX_free(ctx);
        }
    };
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
}

Result<Unit, SecretServiceFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > Constants::HKDF_MAX_OUTPUT_SIZE) {
        return Result<Unit, SecretServiceFailure>::Err(
            SecretServiceFailure::InvalidInput(
                "HKDF output size must be in [1, " +
                std::to_string(Constants::HKDF_MAX_OUTPUT_SIZE) + "], got " +
                std::to_string(output.size())));
    }

    if (ikm.empty()) {
        return Result<Unit, SecretServiceFailure>::Err(
            SecretServiceFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_HKDF, nullptr);
    if (!kdf) {
        return Result<Unit, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto("Failed to fetch HKDF algorithm"));
    }

    EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);
    if (!kctx) {
        return Result<Unit, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OpenSSLConstants::PARAM_DIGEST, const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSLConstants::PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto("HKDF key derivation failed"));
    }

    return Result<Unit, SecretServiceFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SecretServiceFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            std::move(result).UnwrapErr());
    }

    return Result<std::vector<uint8_t>, SecretServiceFailure>::Ok(std::move(output));
}

} // namespace secretkit::service::crypto
