#include "secretkit/prompt/prompt_coordinator.hpp"
#include "secretkit/core/constants.hpp"
#include "secretkit/debug/session_logger.hpp"

#include <algorithm>
#include <type_traits>

namespace secretkit::service::prompt {
    using models::PromptStatus;
    using models::WirePath;
    using models::WirePromptResult;
    using Clock = std::chrono::steady_clock;

    namespace {
        Result<PromptResult, SecretServiceFailure> ConvertResult(const WirePromptResult &wire_result) {
            return std::visit([](const auto &value) -> Result<PromptResult, SecretServiceFailure> {
                using V = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<V, WirePath>) {
                    return ObjectPath::FromWire(value).Map([](Option<ObjectPath> path) -> PromptResult {
                        if (path.has_value()) {
                            return std::move(*path);
                        }
                        return std::monostate{};
                    });
                } else if constexpr (std::is_same_v<V, std::vector<WirePath>>) {
                    return ObjectPath::FromWireList(value).Map([](std::vector<ObjectPath> paths) -> PromptResult {
                        return paths;
                    });
                } else {
                    return Result<PromptResult, SecretServiceFailure>::Ok(std::monostate{});
                }
            }, wire_result);
        }

        Option<Clock::time_point> DeadlineAfter(const Option<std::chrono::milliseconds> &timeout) {
            if (!timeout.has_value()) {
                return None<Clock::time_point>();
            }
            const auto now = Clock::now();
            const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
            if (*timeout >= headroom) {
                return Some(Clock::time_point::max());
            }
            return Some(now + *timeout);
        }
    }

    PromptCoordinator::PromptCoordinator(ISecretServiceBus &bus, std::string window_id)
        : bus_(bus)
        , window_id_(std::move(window_id)) {}

    Result<PromptResult, SecretServiceFailure> PromptCoordinator::Resolve(
        const Option<ObjectPath> &prompt,
        const Option<std::chrono::milliseconds> timeout) const {
        if (!prompt.has_value()) {
            return Result<PromptResult, SecretServiceFailure>::Ok(std::monostate{});
        }
        const ObjectPath &prompt_path = *prompt;
        PromptStatus status = PromptStatus::Created;

        auto subscribed = bus_.SubscribePromptCompleted(prompt_path);
        if (subscribed.IsErr()) {
            return Result<PromptResult, SecretServiceFailure>::Err(std::move(subscribed).UnwrapErr());
        }
        const auto subscription = std::move(subscribed).Unwrap();

        debug::LogPromptStarted(prompt_path.Value(), window_id_);
        auto started = bus_.Prompt(prompt_path, window_id_);
        if (started.IsErr()) {
            return Result<PromptResult, SecretServiceFailure>::Err(std::move(started).UnwrapErr());
        }
        status = PromptStatus::AwaitingCompletion;

        const Option<Clock::time_point> deadline = DeadlineAfter(timeout);

        while (status == PromptStatus::AwaitingCompletion) {
            Option<std::chrono::milliseconds> remaining;
            if (deadline.has_value()) {
                remaining = std::max(
                    std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()),
                    std::chrono::milliseconds::zero());
            }

            auto next = subscription->WaitNext(remaining);
            if (next.IsErr()) {
                return Result<PromptResult, SecretServiceFailure>::Err(std::move(next).UnwrapErr());
            }
            auto event = std::move(next).Unwrap();

            if (!event.has_value()) {
                status = PromptStatus::TimedOut;
                debug::LogPromptFinished(prompt_path.Value(), models::ToString(status));
                DismissBestEffort(prompt_path);
                return Result<PromptResult, SecretServiceFailure>::Err(
                    SecretServiceFailure::PromptTimeout(
                        std::string(ErrorMessages::PROMPT_TIMED_OUT) + ": " + prompt_path.Value()));
            }

            if (event->prompt != prompt_path.Value()) {
                debug::LogPromptIgnoredSignal(prompt_path.Value(), event->prompt);
                continue;
            }

            if (event->dismissed) {
                status = PromptStatus::Dismissed;
                debug::LogPromptFinished(prompt_path.Value(), models::ToString(status));
                return Result<PromptResult, SecretServiceFailure>::Err(
                    SecretServiceFailure::PromptDismissed(
                        std::string(ErrorMessages::PROMPT_DISMISSED) + ": " + prompt_path.Value()));
            }

            status = PromptStatus::Completed;
            debug::LogPromptFinished(prompt_path.Value(), models::ToString(status));
            return ConvertResult(event->result);
        }

        return Result<PromptResult, SecretServiceFailure>::Err(
            SecretServiceFailure::InvalidState("Prompt wait left in unexpected state"));
    }

    void PromptCoordinator::DismissBestEffort(const ObjectPath &prompt) const {
        auto dismissed = bus_.Dismiss(prompt);
        if (dismissed.IsErr()) {
            debug::LogDismissFailed(prompt.Value(), dismissed.UnwrapErr().message);
        }
    }

    Result<ObjectPath, SecretServiceFailure> PromptCoordinator::RequireObjectPath(const PromptResult &result) {
        if (const auto *path = std::get_if<ObjectPath>(&result)) {
            return Result<ObjectPath, SecretServiceFailure>::Ok(*path);
        }
        if (const auto *paths = std::get_if<std::vector<ObjectPath>>(&result); paths && !paths->empty()) {
            return Result<ObjectPath, SecretServiceFailure>::Ok(paths->front());
        }
        return Result<ObjectPath, SecretServiceFailure>::Err(
            SecretServiceFailure::NoResult(std::string(ErrorMessages::MISSING_PROMPT_RESULT)));
    }
}
