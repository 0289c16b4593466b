#pragma once
#include "secretkit/core/result.hpp"
#include "secretkit/core/option.hpp"
#include "secretkit/core/failures.hpp"
#include "secretkit/models/prompt.hpp"
#include <chrono>
namespace secretkit::service::interfaces {
using service::Result;
using service::Option;
using service::SecretServiceFailure;
using models::PromptCompleted;

/// A live match rule for Prompt.Completed; the destructor removes it.
class IPromptSubscription {
public:
    virtual ~IPromptSubscription() = default;
    /// Blocks for the next Completed signal. None when `timeout` elapses
    /// first; an unset timeout waits indefinitely.
    [[nodiscard]] virtual Result<Option<PromptCompleted>, SecretServiceFailure> WaitNext(
        Option<std::chrono::milliseconds> timeout) = 0;
};
}
