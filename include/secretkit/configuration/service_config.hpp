#pragma once

#include "secretkit/core/constants.hpp"
#include "secretkit/enums/encryption_type.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace secretkit::service::configuration {

using enums::EncryptionType;

/// Connection-wide settings for a SecretService instance
///
/// - encryption: session algorithm negotiated once at Connect()
/// - prompt timeout: upper bound on how long a prompt may stay open;
///   unset means wait for the user indefinitely, zero means dismiss any
///   prompt immediately
/// - window id: parent-window hint passed to Prompt.Prompt
///
/// @example
/// ```cpp
/// auto config = ServiceConfig::Default()
///     .WithPromptTimeout(std::chrono::seconds{30});
/// ```
class ServiceConfig {
public:
    /// DH-encrypted session, no prompt timeout, empty window hint
    [[nodiscard]] static ServiceConfig Default() {
        return ServiceConfig(EncryptionType::Dh, std::nullopt, std::string(BusConstants::DEFAULT_WINDOW_ID));
    }

    /// Unencrypted session; secrets cross the bus in clear text
    [[nodiscard]] static ServiceConfig PlainText() {
        return ServiceConfig(EncryptionType::Plain, std::nullopt, std::string(BusConstants::DEFAULT_WINDOW_ID));
    }

    [[nodiscard]] ServiceConfig WithEncryption(EncryptionType encryption) const {
        return ServiceConfig(encryption, prompt_timeout_, window_id_);
    }

    [[nodiscard]] ServiceConfig WithPromptTimeout(std::chrono::seconds timeout) const {
        return ServiceConfig(encryption_, timeout, window_id_);
    }

    [[nodiscard]] ServiceConfig WithWindowId(std::string window_id) const {
        return ServiceConfig(encryption_, prompt_timeout_, std::move(window_id));
    }

    [[nodiscard]] EncryptionType GetEncryption() const noexcept {
        return encryption_;
    }

    [[nodiscard]] const std::optional<std::chrono::seconds>& GetPromptTimeout() const noexcept {
        return prompt_timeout_;
    }

    [[nodiscard]] const std::string& GetWindowId() const noexcept {
        return window_id_;
    }

    [[nodiscard]] bool operator==(const ServiceConfig& other) const = default;

private:
    ServiceConfig(EncryptionType encryption,
                  std::optional<std::chrono::seconds> prompt_timeout,
                  std::string window_id)
        : encryption_(encryption)
        , prompt_timeout_(prompt_timeout)
        , window_id_(std::move(window_id)) {}

    EncryptionType encryption_;
    std::optional<std::chrono::seconds> prompt_timeout_;
    std::string window_id_;
};

} // namespace secretkit::service::configuration
