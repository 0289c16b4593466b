#include <catch2/catch_test_macros.hpp>
#include "secretkit/crypto/aes_cbc.hpp"
#include "secretkit/crypto/sodium_interop.hpp"
#include "secretkit/core/constants.hpp"
#include <string>
using namespace secretkit::service;
using namespace secretkit::service::crypto;

namespace {
    std::vector<uint8_t> FromHex(const std::string& hex) {
        std::vector<uint8_t> bytes;
        for (size_t i = 0; i + 1 < hex.size(); i += 2) {
            bytes.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
        }
        return bytes;
    }
}

TEST_CASE("AES-CBC - Basic encryption and decryption", "[aes_cbc]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(Constants::AES_128_KEY_SIZE, 0xAA);
    std::vector<uint8_t> iv(Constants::AES_CBC_IV_SIZE, 0xBB);
    SECTION("Encrypt and decrypt round-trip") {
        std::vector<uint8_t> plaintext = {'H', 'e', 'l', 'l', 'o', ' ', 'W', 'o', 'r', 'l', 'd', '!'};
        auto ciphertext = AesCbc::Encrypt(key, iv, plaintext);
        REQUIRE(ciphertext.IsOk());
        REQUIRE(ciphertext.Unwrap().size() == Constants::AES_BLOCK_SIZE);
        auto decrypted = AesCbc::Decrypt(key, iv, ciphertext.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext becomes one padding block") {
        auto ciphertext = AesCbc::Encrypt(key, iv, {});
        REQUIRE(ciphertext.IsOk());
        REQUIRE(ciphertext.Unwrap().size() == Constants::AES_BLOCK_SIZE);
        auto decrypted = AesCbc::Decrypt(key, iv, ciphertext.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap().empty());
    }
    SECTION("Block-aligned plaintext gains a full padding block") {
        std::vector<uint8_t> plaintext(32, 0x55);
        auto ciphertext = AesCbc::Encrypt(key, iv, plaintext);
        REQUIRE(ciphertext.Unwrap().size() == 48);
        REQUIRE(AesCbc::Decrypt(key, iv, ciphertext.Unwrap()).Unwrap() == plaintext);
    }
}

TEST_CASE("AES-CBC - NIST SP 800-38A F.2.1", "[aes_cbc]") {
    const auto key = FromHex("2b7e151628aed2a6abf7158809cf4f3c");
    const auto iv = FromHex("000102030405060708090a0b0c0d0e0f");
    const auto plaintext = FromHex("6bc1bee22e409f96e93d7e117393172a");
    auto ciphertext = AesCbc::Encrypt(key, iv, plaintext);
    REQUIRE(ciphertext.IsOk());
    const auto& bytes = ciphertext.Unwrap();
    REQUIRE(bytes.size() == 32);
    REQUIRE(std::vector<uint8_t>(bytes.begin(), bytes.begin() + 16) ==
            FromHex("7649abac8119b246cee98e9b12e9197d"));
}

TEST_CASE("AES-CBC - Rejected inputs", "[aes_cbc]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(Constants::AES_128_KEY_SIZE, 0x66);
    std::vector<uint8_t> iv(Constants::AES_CBC_IV_SIZE, 0x77);
    std::vector<uint8_t> plaintext = {'s', 'e', 'c', 'r', 'e', 't'};
    SECTION("Wrong key size") {
        std::vector<uint8_t> long_key(32, 0x66);
        auto result = AesCbc::Encrypt(long_key, iv, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(SecretServiceFailureType::InvalidInput));
    }
    SECTION("Wrong IV size") {
        std::vector<uint8_t> short_iv(12, 0x77);
        auto result = AesCbc::Decrypt(key, short_iv, std::vector<uint8_t>(16, 0));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(SecretServiceFailureType::Crypto));
    }
    SECTION("Ciphertext not a multiple of the block size") {
        auto result = AesCbc::Decrypt(key, iv, std::vector<uint8_t>(17, 0));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(SecretServiceFailureType::Crypto));
    }
    SECTION("Empty ciphertext") {
        REQUIRE(AesCbc::Decrypt(key, iv, {}).IsErr());
    }
    SECTION("Wrong key never yields the plaintext") {
        auto ciphertext = AesCbc::Encrypt(key, iv, plaintext).Unwrap();
        std::vector<uint8_t> other_key(Constants::AES_128_KEY_SIZE, 0x99);
        auto result = AesCbc::Decrypt(other_key, iv, ciphertext);
        if (result.IsOk()) {
            REQUIRE(result.Unwrap() != plaintext);
        } else {
            REQUIRE(result.UnwrapErr().Is(SecretServiceFailureType::Crypto));
        }
    }
    SECTION("Corrupted padding is reported") {
        auto ciphertext = AesCbc::Encrypt(key, iv, plaintext).Unwrap();
        // Plaintext is 6 bytes so the pad is ten 0x0a bytes; flipping the IV
        // byte at the last position turns the final pad byte into 0x0a ^ 0xff.
        std::vector<uint8_t> tampered_iv = iv;
        tampered_iv[15] ^= 0xFF;
        auto result = AesCbc::Decrypt(key, tampered_iv, ciphertext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().message == "Invalid PKCS#7 padding");
    }
}
