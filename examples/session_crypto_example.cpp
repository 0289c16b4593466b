/**
 * @file session_crypto_example.cpp
 * @brief Walk through the dh-ietf1024-sha256-aes128-cbc-pkcs7 session crypto
 *        with both the client and the daemon side running in-process
 */

#include "secretkit/crypto/aes_cbc.hpp"
#include "secretkit/crypto/dh_key_exchange.hpp"
#include "secretkit/crypto/sodium_interop.hpp"
#include "secretkit/core/constants.hpp"
#include "secretkit/core/result.hpp"

#include <iostream>
#include <iomanip>
#include <string>

using namespace secretkit::service;
using namespace secretkit::service::crypto;

void print_hex(const std::string& label, const std::vector<uint8_t>& data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

int main() {
    std::cout << "=== secretkit - Session Crypto Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Initialized" << std::endl;
    std::cout << std::endl;

    // Both ends draw an ephemeral exponent in the RFC 2409 1024-bit group
    std::cout << "2. Generating client and daemon key pairs..." << std::endl;
    auto client_result = DhKeyExchange::Generate();
    auto daemon_result = DhKeyExchange::Generate();
    if (client_result.IsErr() || daemon_result.IsErr()) {
        std::cerr << "Failed to generate DH key pairs" << std::endl;
        return 1;
    }
    auto client = std::move(client_result).Unwrap();
    auto daemon = std::move(daemon_result).Unwrap();
    const auto client_public = client.PublicKey();
    const auto daemon_public = daemon.PublicKey();
    std::cout << "   Client public value: " << client_public.size() << " bytes" << std::endl;
    std::cout << "   Daemon public value: " << daemon_public.size() << " bytes" << std::endl;
    std::cout << std::endl;

    std::cout << "3. Deriving the AES-128 session key on each side..." << std::endl;
    auto client_key = client.DeriveSessionKey(daemon_public);
    auto daemon_key = daemon.DeriveSessionKey(client_public);
    if (client_key.IsErr() || daemon_key.IsErr()) {
        std::cerr << "Key derivation failed" << std::endl;
        return 1;
    }
    auto client_bytes = client_key.Unwrap().ReadBytes().Unwrap();
    auto daemon_bytes = daemon_key.Unwrap().ReadBytes().Unwrap();
    std::cout << "   Keys match: "
              << (SodiumInterop::ConstantTimeEquals(client_bytes, daemon_bytes) ? "true" : "false")
              << std::endl;
    std::cout << "   Key sealed read-only: "
              << (client_key.Unwrap().IsSealed() ? "true" : "false") << std::endl;
    std::cout << std::endl;

    std::cout << "4. Encrypting a secret for the daemon..." << std::endl;
    const std::string secret = "correct horse battery staple";
    const std::vector<uint8_t> plaintext(secret.begin(), secret.end());
    auto iv = SodiumInterop::GetRandomBytes(Constants::AES_CBC_IV_SIZE);
    auto ciphertext = AesCbc::Encrypt(client_bytes, iv, plaintext);
    if (ciphertext.IsErr()) {
        std::cerr << "Encryption failed: " << ciphertext.UnwrapErr().message << std::endl;
        return 1;
    }
    print_hex("   IV (parameters)", iv);
    print_hex("   Ciphertext (value)", ciphertext.Unwrap());
    std::cout << std::endl;

    std::cout << "5. Daemon decrypts with its own copy of the key..." << std::endl;
    auto opened = AesCbc::Decrypt(daemon_bytes, iv, ciphertext.Unwrap());
    if (opened.IsErr()) {
        std::cerr << "Decryption failed: " << opened.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Recovered: " << std::string(opened.Unwrap().begin(), opened.Unwrap().end()) << std::endl;
    std::cout << std::endl;

    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(client_bytes));
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(daemon_bytes));

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
