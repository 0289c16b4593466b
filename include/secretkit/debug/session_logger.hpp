#pragma once

/**
 * @file session_logger.hpp
 * @brief Debug tracing for session negotiation and prompt handling.
 *
 * SECURITY WARNING: with SECRETKIT_DEBUG_LOG enabled this prints DH public
 * values, session keys and initialisation vectors to stdout. Use it only to
 * compare a derivation against a reference daemon. Never ship it enabled.
 *
 * Enable via CMake: -DSECRETKIT_DEBUG_LOG=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace secretkit::debug {

#ifdef SECRETKIT_DEBUG_LOG

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 64) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

#define SK_LOG_BYTES(operation, name, data) \
    do { \
        fprintf(stdout, "[SK-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            ::secretkit::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define SK_LOG_MSG(operation, message) \
    do { \
        fprintf(stdout, "[SK-DEBUG] %s %s\n", operation, message); \
        fflush(stdout); \
    } while(0)

#define SK_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[SK-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

inline void LogSessionNegotiated(
    std::string_view algorithm,
    std::string_view session_path,
    std::span<const uint8_t> local_public,
    std::span<const uint8_t> peer_public,
    std::span<const uint8_t> session_key) {

    SK_LOG_MSG("SESSION", "========== OPEN SESSION ==========");
    SK_LOG_MSG("SESSION", std::string(algorithm).c_str());
    SK_LOG_MSG("SESSION", std::string(session_path).c_str());
    SK_LOG_BYTES("SESSION", "local_public", local_public);
    SK_LOG_BYTES("SESSION", "peer_public", peer_public);
    SK_LOG_BYTES("SESSION", "aes_key", session_key);
}

inline void LogSecretEncrypted(std::span<const uint8_t> iv, size_t plaintext_size, size_t ciphertext_size) {
    SK_LOG_BYTES("ENCRYPT", "iv", iv);
    SK_LOG_VALUE("ENCRYPT", "plaintext_size", plaintext_size);
    SK_LOG_VALUE("ENCRYPT", "ciphertext_size", ciphertext_size);
}

inline void LogPromptStarted(std::string_view prompt_path, std::string_view window_id) {
    SK_LOG_MSG("PROMPT", ("start " + std::string(prompt_path) +
        " window='" + std::string(window_id) + "'").c_str());
}

inline void LogPromptIgnoredSignal(std::string_view expected, std::string_view received) {
    SK_LOG_MSG("PROMPT", ("ignoring Completed for " + std::string(received) +
        " while waiting on " + std::string(expected)).c_str());
}

inline void LogPromptFinished(std::string_view prompt_path, const char* status) {
    SK_LOG_MSG("PROMPT", (std::string(prompt_path) + " -> " + status).c_str());
}

inline void LogDismissFailed(std::string_view prompt_path, std::string_view reason) {
    SK_LOG_MSG("PROMPT", ("dismiss of " + std::string(prompt_path) +
        " failed: " + std::string(reason)).c_str());
}

inline void LogBatchLock(const char* action, size_t target_count, bool prompted) {
    SK_LOG_MSG("BATCH", action);
    SK_LOG_VALUE("BATCH", "targets", target_count);
    SK_LOG_MSG("BATCH", prompted ? "prompt: YES" : "prompt: NO");
}

#else // !SECRETKIT_DEBUG_LOG

#define SK_LOG_BYTES(operation, name, data) ((void)0)
#define SK_LOG_MSG(operation, message) ((void)0)
#define SK_LOG_VALUE(operation, name, value) ((void)0)

inline void LogSessionNegotiated(std::string_view, std::string_view, std::span<const uint8_t>,
    std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogSecretEncrypted(std::span<const uint8_t>, size_t, size_t) {}
inline void LogPromptStarted(std::string_view, std::string_view) {}
inline void LogPromptIgnoredSignal(std::string_view, std::string_view) {}
inline void LogPromptFinished(std::string_view, const char*) {}
inline void LogDismissFailed(std::string_view, std::string_view) {}
inline void LogBatchLock(const char*, size_t, bool) {}

#endif // SECRETKIT_DEBUG_LOG

} // namespace secretkit::debug
