#include "secretkit/prompt/lock_unlock_orchestrator.hpp"
#include "secretkit/debug/session_logger.hpp"

namespace secretkit::service::prompt {

    LockUnlockOrchestrator::LockUnlockOrchestrator(ISecretServiceBus &bus, const PromptCoordinator &prompts)
        : bus_(bus)
        , prompts_(prompts) {}

    Result<Unit, SecretServiceFailure> LockUnlockOrchestrator::Apply(
        const LockAction action,
        const std::vector<ObjectPath> &targets,
        const Option<std::chrono::milliseconds> timeout) const {
        if (targets.empty()) {
            return Result<Unit, SecretServiceFailure>::Ok(unit);
        }

        auto reply = action == LockAction::Lock ? bus_.Lock(targets) : bus_.Unlock(targets);
        if (reply.IsErr()) {
            return Result<Unit, SecretServiceFailure>::Err(std::move(reply).UnwrapErr());
        }

        auto wire_prompt = ObjectPath::FromWire(reply.Unwrap().prompt);
        if (wire_prompt.IsErr()) {
            return Result<Unit, SecretServiceFailure>::Err(std::move(wire_prompt).UnwrapErr());
        }
        const auto prompt = std::move(wire_prompt).Unwrap();
        debug::LogBatchLock(enums::ToString(action), targets.size(), prompt.has_value());
        if (!prompt.has_value()) {
            return Result<Unit, SecretServiceFailure>::Ok(unit);
        }

        return prompts_.Resolve(prompt, timeout).Map([](PromptResult) { return unit; });
    }
}
