#include "secretkit/crypto/dh_key_exchange.hpp"
#include "secretkit/crypto/hkdf.hpp"
#include "secretkit/crypto/sodium_interop.hpp"
#include "secretkit/core/constants.hpp"

#include <openssl/bn.h>
#include <format>
#include <memory>
#include <string>

namespace secretkit::service::crypto {

namespace {
    struct BIGNUM_Deleter {
        void operator()(BIGNUM* bn) const {
            BN_clear_free(bn);
        }
    };
    struct BN_CTX_Deleter {
        void operator()(BN_CTX* ctx) const {
            BN_CTX_free(ctx);
        }
    };
    using BIGNUM_ptr = std::unique_ptr<BIGNUM, BIGNUM_Deleter>;
    using BN_CTX_ptr = std::unique_ptr<BN_CTX, BN_CTX_Deleter>;

    BIGNUM_ptr LoadPrime() {
        return BIGNUM_ptr(BN_get_rfc2409_prime_1024(nullptr));
    }

    BIGNUM_ptr FromBytes(std::span<const uint8_t> bytes, bool secret) {
        BIGNUM_ptr bn(secret ? BN_secure_new() : BN_new());
        if (!bn) {
            return bn;
        }
        if (BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), bn.get()) == nullptr) {
            return BIGNUM_ptr();
        }
        return bn;
    }

    /// 1 < value < p - 1
    Result<bool, SecretServiceFailure> IsInOpenGroupRange(const BIGNUM* value, const BIGNUM* prime) {
        BIGNUM_ptr upper(BN_dup(prime));
        if (!upper || BN_sub_word(upper.get(), 1) != OpenSSLConstants::SUCCESS) {
            return Result<bool, SecretServiceFailure>::Err(
                SecretServiceFailure::Crypto("Failed to compute p - 1"));
        }
        const bool above_one = !BN_is_zero(value) && !BN_is_one(value);
        return Result<bool, SecretServiceFailure>::Ok(above_one && BN_cmp(value, upper.get()) < 0);
    }

    Result<std::vector<uint8_t>, SecretServiceFailure> ComputePublicKey(
        const BIGNUM* exponent, const BIGNUM* prime) {
        BN_CTX_ptr ctx(BN_CTX_new());
        BIGNUM_ptr generator(BN_new());
        BIGNUM_ptr public_value(BN_new());
        if (!ctx || !generator || !public_value ||
            BN_set_word(generator.get(), Constants::DH_GENERATOR) != OpenSSLConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
                SecretServiceFailure::Crypto("Failed to allocate DH working state"));
        }
        if (BN_mod_exp(public_value.get(), generator.get(), exponent, prime, ctx.get()) != OpenSSLConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, SecretServiceFailure>::Err(
                SecretServiceFailure::Crypto("Failed to compute DH public value"));
        }
        std::vector<uint8_t> encoded(static_cast<size_t>(BN_num_bytes(public_value.get())));
        BN_bn2bin(public_value.get(), encoded.data());
        return Result<std::vector<uint8_t>, SecretServiceFailure>::Ok(std::move(encoded));
    }
}

std::vector<uint8_t> DhKeyExchange::GroupPrime() {
    BIGNUM_ptr prime = LoadPrime();
    std::vector<uint8_t> encoded(Constants::DH_GROUP_BYTES);
    if (prime) {
        BN_bn2binpad(prime.get(), encoded.data(), static_cast<int>(encoded.size()));
    }
    return encoded;
}

Result<DhKeyExchange, SecretServiceFailure> DhKeyExchange::Generate() {
    std::vector<uint8_t> candidate(Constants::DH_PRIVATE_EXPONENT_BYTES);
    for (size_t attempt = 0; attempt < Constants::DH_MAX_EXPONENT_ATTEMPTS; ++attempt) {
        SodiumInterop::FillRandom(candidate);
        auto result = FromPrivateExponent(candidate);
        if (result.IsOk() || !result.UnwrapErr().Is(SecretServiceFailureType::InvalidInput)) {
            (void)SodiumInterop::SecureWipe(std::span<uint8_t>(candidate));
            return result;
        }
    }
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(candidate));
    return Result<DhKeyExchange, SecretServiceFailure>::Err(
        SecretServiceFailure::Crypto("Could not draw a DH private exponent in range"));
}

Result<DhKeyExchange, SecretServiceFailure> DhKeyExchange::FromPrivateExponent(
    std::span<const uint8_t> exponent) {

    if (exponent.empty() || exponent.size() > Constants::DH_PRIVATE_EXPONENT_BYTES) {
        return Result<DhKeyExchange, SecretServiceFailure>::Err(
            SecretServiceFailure::InvalidInput(
                std::format("DH private exponent must be 1..{} bytes, got {}",
                    Constants::DH_PRIVATE_EXPONENT_BYTES, exponent.size())));
    }

    BIGNUM_ptr prime = LoadPrime();
    BIGNUM_ptr x = FromBytes(exponent, true);
    if (!prime || !x) {
        return Result<DhKeyExchange, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto("Failed to load DH group parameters"));
    }

    auto in_range = IsInOpenGroupRange(x.get(), prime.get());
    if (in_range.IsErr()) {
        return Result<DhKeyExchange, SecretServiceFailure>::Err(std::move(in_range).UnwrapErr());
    }
    if (!in_range.Unwrap()) {
        return Result<DhKeyExchange, SecretServiceFailure>::Err(
            SecretServiceFailure::InvalidInput("DH private exponent is outside (1, p - 1)"));
    }

    BN_set_flags(x.get(), BN_FLG_CONSTTIME);
    auto public_key = ComputePublicKey(x.get(), prime.get());
    if (public_key.IsErr()) {
        return Result<DhKeyExchange, SecretServiceFailure>::Err(std::move(public_key).UnwrapErr());
    }

    auto handle_result = SecureMemoryHandle::Allocate(Constants::DH_PRIVATE_EXPONENT_BYTES);
    if (handle_result.IsErr()) {
        return Result<DhKeyExchange, SecretServiceFailure>::Err(
            SecretServiceFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();

    std::vector<uint8_t> padded(Constants::DH_PRIVATE_EXPONENT_BYTES);
    BN_bn2binpad(x.get(), padded.data(), static_cast<int>(padded.size()));
    auto write_result = handle.Write(padded);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(padded));
    if (write_result.IsErr()) {
        return Result<DhKeyExchange, SecretServiceFailure>::Err(
            SecretServiceFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return Result<DhKeyExchange, SecretServiceFailure>::Ok(
        DhKeyExchange(std::move(handle), std::move(public_key).Unwrap()));
}

Result<Unit, SecretServiceFailure> DhKeyExchange::ValidatePeerPublicKey(
    std::span<const uint8_t> peer_public_key) {

    if (peer_public_key.empty() || peer_public_key.size() > Constants::DH_GROUP_BYTES) {
        return Result<Unit, SecretServiceFailure>::Err(
            SecretServiceFailure::Negotiation(
                std::format("DH public value must be 1..{} bytes, got {}",
                    Constants::DH_GROUP_BYTES, peer_public_key.size())));
    }

    BIGNUM_ptr prime = LoadPrime();
    BIGNUM_ptr y = FromBytes(peer_public_key, false);
    if (!prime || !y) {
        return Result<Unit, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto("Failed to load DH public value"));
    }

    auto in_range = IsInOpenGroupRange(y.get(), prime.get());
    if (in_range.IsErr()) {
        return Result<Unit, SecretServiceFailure>::Err(std::move(in_range).UnwrapErr());
    }
    if (!in_range.Unwrap()) {
        return Result<Unit, SecretServiceFailure>::Err(
            SecretServiceFailure::Negotiation("DH public value is outside (1, p - 1)"));
    }

    return Result<Unit, SecretServiceFailure>::Ok(unit);
}

Result<SecureMemoryHandle, SecretServiceFailure> DhKeyExchange::DeriveSessionKey(
    std::span<const uint8_t> peer_public_key) {

    if (!HasPrivateExponent()) {
        return Result<SecureMemoryHandle, SecretServiceFailure>::Err(
            SecretServiceFailure::InvalidState("DH private exponent was already consumed"));
    }
    SecureMemoryHandle exponent = std::move(private_exponent_);

    auto validation = ValidatePeerPublicKey(peer_public_key);
    if (validation.IsErr()) {
        return Result<SecureMemoryHandle, SecretServiceFailure>::Err(
            std::move(validation).UnwrapErr());
    }

    BIGNUM_ptr prime = LoadPrime();
    BIGNUM_ptr y = FromBytes(peer_public_key, false);
    auto x_result = exponent.WithReadAccess([](std::span<const uint8_t> bytes) {
        return FromBytes(bytes, true);
    });
    BN_CTX_ptr ctx(BN_CTX_secure_new());
    BIGNUM_ptr shared(BN_secure_new());
    if (x_result.IsErr() || !prime || !y || !ctx || !shared) {
        return Result<SecureMemoryHandle, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto("Failed to allocate DH working state"));
    }
    BIGNUM_ptr x = std::move(x_result).Unwrap();
    if (!x) {
        return Result<SecureMemoryHandle, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto("Failed to load DH private exponent"));
    }
    BN_set_flags(x.get(), BN_FLG_CONSTTIME);

    if (BN_mod_exp(shared.get(), y.get(), x.get(), prime.get(), ctx.get()) != OpenSSLConstants::SUCCESS) {
        return Result<SecureMemoryHandle, SecretServiceFailure>::Err(
            SecretServiceFailure::Crypto("Failed to compute DH shared secret"));
    }

    std::vector<uint8_t> shared_bytes(Constants::DH_GROUP_BYTES);
    BN_bn2binpad(shared.get(), shared_bytes.data(), static_cast<int>(shared_bytes.size()));

    std::vector<uint8_t> key_bytes(Constants::AES_128_KEY_SIZE);
    auto derive_result = Hkdf::DeriveKey(shared_bytes, key_bytes);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(shared_bytes));
    if (derive_result.IsErr()) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key_bytes));
        return Result<SecureMemoryHandle, SecretServiceFailure>::Err(
            std::move(derive_result).UnwrapErr());
    }

    auto handle_result = SecureMemoryHandle::Allocate(Constants::AES_128_KEY_SIZE);
    if (handle_result.IsErr()) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key_bytes));
        return Result<SecureMemoryHandle, SecretServiceFailure>::Err(
            SecretServiceFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle key = std::move(handle_result).Unwrap();
    auto write_result = key.Write(key_bytes);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key_bytes));
    if (write_result.IsErr()) {
        return Result<SecureMemoryHandle, SecretServiceFailure>::Err(
            SecretServiceFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }
    auto seal_result = key.Seal();
    if (seal_result.IsErr()) {
        return Result<SecureMemoryHandle, SecretServiceFailure>::Err(
            SecretServiceFailure::FromSodiumFailure(seal_result.UnwrapErr()));
    }

    return Result<SecureMemoryHandle, SecretServiceFailure>::Ok(std::move(key));
}

} // namespace secretkit::service::crypto
