#pragma once
#include "secretkit/core/result.hpp"
#include "secretkit/core/option.hpp"
#include "secretkit/core/failures.hpp"
#include "secretkit/enums/lock_action.hpp"
#include "secretkit/interfaces/i_secret_service_bus.hpp"
#include "secretkit/prompt/prompt_coordinator.hpp"
#include <chrono>
#include <vector>

namespace secretkit::service::prompt {
    using service::Unit;
    using enums::LockAction;

    /**
     * @brief One Lock/Unlock call for a whole set of objects
     *
     * The daemon handles what it can at once and returns a single prompt for
     * the rest, so the user is asked once per batch. The outcome is collapsed
     * to one success or one failure; which targets were handled immediately
     * is not reported.
     */
    class LockUnlockOrchestrator {
    public:
        LockUnlockOrchestrator(ISecretServiceBus &bus, const PromptCoordinator &prompts);

        [[nodiscard]] Result<Unit, SecretServiceFailure> Apply(
            LockAction action,
            const std::vector<ObjectPath> &targets,
            Option<std::chrono::milliseconds> timeout) const;

    private:
        ISecretServiceBus &bus_;
        const PromptCoordinator &prompts_;
    };
}
