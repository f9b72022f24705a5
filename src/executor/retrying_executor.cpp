// ---------------------------------------------------------------------------
// retrying_executor.cpp
// ---------------------------------------------------------------------------

#include "executor/retrying_executor.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <expected>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "common/canonical.hpp"
#include "common/digest.hpp"

namespace {

enum class AttemptState : std::uint8_t {
    kAttempt,
    kSucceeded,
    kFailed,
};

std::string describe(const BackendError& error) {
    std::string text(to_string(error.code));
    if (!error.message.empty()) {
        text += ": ";
        text += error.message;
    }
    return text;
}

std::string hash_output(const QueryResult& output) {
    return sha256_hex(canonical_json(output));
}

}  // namespace

std::string step_name_of(const PlanStep& step) {
    return std::string(tool_name(step.tool)) + "#" + std::to_string(step.step_id);
}

RetryingExecutor::RetryingExecutor(std::shared_ptr<QueryBackend>        backend,
                                   ExecutorConfig                       config,
                                   std::shared_ptr<IdempotentStepCache> cache)
    : backend_(std::move(backend))
    , config_(std::move(config))
    , cache_(std::move(cache)) {
    if (!backend_) {
        throw std::invalid_argument("RetryingExecutor: backend must not be null");
    }
    for (const auto& name : config_.retryable_errors) {
        const auto code = backend_error_code_from_string(name);
        if (!code) {
            throw std::invalid_argument("RetryingExecutor: unknown retryable error code '" + name + "'");
        }
        retryable_.insert(*code);
    }
}

bool RetryingExecutor::is_retryable(BackendErrorCode code) const {
    return retryable_.count(code) != 0;
}

std::vector<StepOutcome> RetryingExecutor::run(const QueryPlan& plan) {
    return run_steps(plan, nullptr);
}

std::vector<StepOutcome> RetryingExecutor::run(const QueryPlan& plan, const ReplayScope& scope) {
    return run_steps(plan, &scope);
}

std::vector<StepOutcome> RetryingExecutor::run_steps(const QueryPlan& plan, const ReplayScope* scope) {
    std::vector<StepOutcome> outcomes;
    outcomes.reserve(plan.steps.size());
    bool halted = false;

    for (const auto& step : plan.steps) {
        if (halted) {
            StepOutcome skipped{};
            skipped.step_name   = step_name_of(step);
            skipped.step_id     = step.step_id;
            skipped.status      = StepStatus::kSkipped;
            skipped.output_hash = hash_output(skipped.output);
            outcomes.push_back(std::move(skipped));
            continue;
        }

        StepOutcome outcome{};
        if (scope != nullptr && cache_) {
            const std::string key = IdempotentStepCache::key(
                scope->tenant_id, scope->workflow_id, step_name_of(step), to_inputs(step.tool));
            outcome = cache_->run_once(key, [&] { return execute_step(step); });
        } else {
            outcome = execute_step(step);
        }

        if (outcome.status == StepStatus::kFailed) {
            halted = true;
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

StepOutcome RetryingExecutor::execute_step(const PlanStep& step) {
    return std::visit([&](const auto& call) { return run_tool(step, call); }, step.tool);
}

// ---------------------------------------------------------------------------
// run_tool (execute_query): 시도 상태 머신
// ---------------------------------------------------------------------------
StepOutcome RetryingExecutor::run_tool(const PlanStep& step, const ExecuteQuery& query) {
    StepOutcome outcome{};
    outcome.step_name  = step_name_of(step);
    outcome.step_id    = step.step_id;
    outcome.started_at = std::chrono::system_clock::now();

    const std::string step_id = std::to_string(step.step_id);
    AttemptState state = AttemptState::kAttempt;
    std::uint32_t retries = 0;
    BackendError last_error{};

    while (state == AttemptState::kAttempt) {
        std::expected<QueryResult, BackendError> result;
        try {
            result = backend_->execute(step_id, query.sql, config_.call_timeout);
        } catch (const std::exception& e) {
            result = std::unexpected(BackendError{BackendErrorCode::kInternalError, e.what()});
        }

        if (result) {
            outcome.output = std::move(*result);
            state = AttemptState::kSucceeded;
            break;
        }

        last_error = std::move(result.error());
        if (is_retryable(last_error.code) && retries < config_.max_retries) {
            ++retries;
            spdlog::warn("retrying_executor: step {} attempt failed ({}), retry {}/{}",
                         step.step_id, to_string(last_error.code), retries, config_.max_retries);
            continue;
        }
        state = AttemptState::kFailed;
    }

    outcome.retry_count = retries;
    outcome.finished_at = std::chrono::system_clock::now();

    if (state == AttemptState::kSucceeded) {
        outcome.status = StepStatus::kSuccess;
        outcome.error.reset();
    } else {
        outcome.status = StepStatus::kFailed;
        outcome.error  = describe(last_error);
        spdlog::error("retrying_executor: step {} failed after {} retries: {}",
                      step.step_id, retries, *outcome.error);
    }
    outcome.output_hash = hash_output(outcome.output);
    return outcome;
}
