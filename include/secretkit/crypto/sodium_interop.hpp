#pragma once

#include "secretkit/core/result.hpp"
#include "secretkit/core/failures.hpp"
#include "secretkit/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace secretkit::service::crypto {

/**
 * @brief Thin layer over the libsodium primitives secretkit relies on
 *
 * Covers library initialisation, the CSPRNG used for DH exponents and
 * CBC initialisation vectors, secure wiping of temporaries and guarded
 * allocations for session keys.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Zero a buffer in a way the optimizer cannot elide
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison; buffers of different size are unequal
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void FillRandom(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief sodium_malloc wrapper: guard pages, mlock'ed, zeroed on free
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
};

} // namespace secretkit::service::crypto
