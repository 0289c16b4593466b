#pragma once
#include <string>
#include <string_view>
namespace secretkit::service {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    MemoryProtectionFailed,
    AllocationFailed,
    InvalidOperation
};
enum class SecretServiceFailureType {
    Generic,
    Transport,
    Negotiation,
    Crypto,
    PromptDismissed,
    PromptTimeout,
    NoResult,
    NotSupported,
    InvalidInput,
    InvalidState
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure MemoryProtectionFailed(std::string msg) {
        return {SodiumFailureType::MemoryProtectionFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Error value returned by every fallible secretkit operation.
 *
 * PromptDismissed and NoResult are expected outcomes rather than faults;
 * callers branch on `type` to tell "cancelled" or "nothing matched" apart
 * from Transport, Negotiation and Crypto errors.
 */
class SecretServiceFailure {
public:
    SecretServiceFailureType type;
    std::string message;
    SecretServiceFailure(const SecretServiceFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SecretServiceFailure Generic(std::string msg) {
        return {SecretServiceFailureType::Generic, std::move(msg)};
    }
    static SecretServiceFailure Transport(std::string msg) {
        return {SecretServiceFailureType::Transport, std::move(msg)};
    }
    static SecretServiceFailure Negotiation(std::string msg) {
        return {SecretServiceFailureType::Negotiation, std::move(msg)};
    }
    static SecretServiceFailure Crypto(std::string msg) {
        return {SecretServiceFailureType::Crypto, std::move(msg)};
    }
    static SecretServiceFailure PromptDismissed(std::string msg) {
        return {SecretServiceFailureType::PromptDismissed, std::move(msg)};
    }
    static SecretServiceFailure PromptTimeout(std::string msg) {
        return {SecretServiceFailureType::PromptTimeout, std::move(msg)};
    }
    static SecretServiceFailure NoResult(std::string msg) {
        return {SecretServiceFailureType::NoResult, std::move(msg)};
    }
    static SecretServiceFailure NotSupported(std::string msg) {
        return {SecretServiceFailureType::NotSupported, std::move(msg)};
    }
    static SecretServiceFailure InvalidInput(std::string msg) {
        return {SecretServiceFailureType::InvalidInput, std::move(msg)};
    }
    static SecretServiceFailure InvalidState(std::string msg) {
        return {SecretServiceFailureType::InvalidState, std::move(msg)};
    }
    static SecretServiceFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Crypto(sf.message);
    }
    [[nodiscard]] bool Is(const SecretServiceFailureType t) const noexcept {
        return type == t;
    }
};
}
