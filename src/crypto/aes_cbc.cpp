#include "secretkit/crypto/aes_cbc.hpp"
#include "secretkit/crypto/sodium_interop.hpp"
#include "secretkit/core/constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <format>
#include <memory>
#include <string>
namespace secretkit::service::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    Result<Unit, SecretServiceFailure> ValidateKeyAndIv(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv) {
        if (key.size() != Constants::AES_128_KEY_SIZE) {
            return Result<Unit, SecretServiceFailure>::Err(
                SecretServiceFailure::InvalidInput(
                    std::format("AES-128-CBC key must be {} bytes, got {}",
                        Constants::AES_128_KEY_SIZE, key.size())));
        }
        if (iv.size() != Constants::AES_CBC_IV_SIZE) {
            return Result<Unit, SecretServiceFailure>::Err(
                SecretServiceFailure::Crypto(
                    std::format("AES-CBC IV must be {} bytes, got {}",
                        Constants::AES_CBC_IV_SIZE, iv.size())));
        }
        return Result<Unit, SecretServiceFailure>::Ok(unit);
    }
    void Wipe(std::vector<uint8_t>& buffer) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
    }
}
Result<std::vector<uint8_t>, SecretServiceFailure>
AesCbc::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> plaintext) {
    auto validation = ValidateKeyAndIv(key, iv);
    if (validation.IsErr()) {
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            std::move(validation).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto(
                std::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key.data(), iv.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto(
                std::format("Failed to initialize AES-128-CBC: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> output(plaintext.size() + Constants::AES_BLOCK_SIZE);
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto(
                std::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto(
                std::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len + final_len));
    return Result<std::vector<uint8_t>, SecretServiceFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, SecretServiceFailure>
AesCbc::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> ciphertext) {
    auto validation = ValidateKeyAndIv(key, iv);
    if (validation.IsErr()) {
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            std::move(validation).UnwrapErr());
    }
    if (ciphertext.empty() || ciphertext.size() % Constants::AES_BLOCK_SIZE != 0) {
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto(
                std::format("Ciphertext length {} is not a positive multiple of the {}-byte block",
                    ciphertext.size(), Constants::AES_BLOCK_SIZE)));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto(
                std::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key.data(), iv.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto(
                std::format("Failed to initialize AES-128-CBC: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> output(ciphertext.size() + Constants::AES_BLOCK_SIZE);
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto(
                std::format("Decryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        ERR_clear_error();
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto("Invalid PKCS#7 padding"));
    }
    output.resize(static_cast<size_t>(plaintext_len + final_len));
    return Result<std::vector<uint8_t>, SecretServiceFailure>::Ok(std::move(output));
}
}
