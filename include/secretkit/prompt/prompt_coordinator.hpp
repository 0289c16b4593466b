#pragma once
#include "secretkit/core/result.hpp"
#include "secretkit/core/option.hpp"
#include "secretkit/core/failures.hpp"
#include "secretkit/interfaces/i_secret_service_bus.hpp"
#include "secretkit/models/object_path.hpp"
#include "secretkit/models/prompt.hpp"
#include <chrono>
#include <string>

namespace secretkit::service::prompt {
    using service::Result;
    using service::Option;
    using service::SecretServiceFailure;
    using interfaces::ISecretServiceBus;
    using models::ObjectPath;
    using models::PromptResult;

    /**
     * @brief Drives the optional confirmation step of a privileged call
     *
     * Resolve() subscribes to Prompt.Completed, calls Prompt.Prompt and then
     * blocks on the subscription until the Completed signal for this prompt
     * arrives or the timeout elapses. Signals for other prompts are skipped.
     * The subscription is a scoped handle and is gone once Resolve returns.
     */
    class PromptCoordinator {
    public:
        PromptCoordinator(ISecretServiceBus &bus, std::string window_id);

        /**
         * @param prompt None when the primary call needed no confirmation
         * @param timeout None to wait for the user indefinitely
         * @return the Completed result on success; PromptDismissed or
         *         PromptTimeout failures otherwise
         */
        [[nodiscard]] Result<PromptResult, SecretServiceFailure> Resolve(
            const Option<ObjectPath> &prompt,
            Option<std::chrono::milliseconds> timeout) const;

        /// For create calls: the prompt result must carry the new object.
        [[nodiscard]] static Result<ObjectPath, SecretServiceFailure> RequireObjectPath(
            const PromptResult &result);

        [[nodiscard]] const std::string &GetWindowId() const noexcept { return window_id_; }

    private:
        void DismissBestEffort(const ObjectPath &prompt) const;

        ISecretServiceBus &bus_;
        std::string window_id_;
    };
}
