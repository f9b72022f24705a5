#pragma once

// ---------------------------------------------------------------------------
// retrying_executor.hpp
//
// 게이트를 통과한 계획의 스텝을 순서대로 실행한다.
//
// [재시도 상태 머신]
//   kAttempt ─ 성공 ──────────────────────────→ kSucceeded
//      │
//      └─ 실패 ─ 재시도 가능 && attempts ≤ max ─→ kAttempt (retry_count + 1)
//               그 외 ──────────────────────────→ kFailed (마지막 오류 보존)
//
// - 재시도 가능 여부는 ExecutorConfig::retryable_errors 의 코드 이름으로 판정.
// - 재시도는 지연 없이 즉시 수행한다.
// - 백엔드가 던진 예외는 internal_error 로 변환하며 재시도하지 않는다.
//
// [스텝 순서]
// 스텝은 엄격히 순차 실행된다. 실패한 스텝 이후 스텝은 시작하지 않고
// kSkipped 로 보고한다.
// ---------------------------------------------------------------------------

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "executor/query_backend.hpp"
#include "executor/step_cache.hpp"
#include "executor/step_outcome.hpp"
#include "policy/gate_config.hpp"
#include "policy/plan.hpp"

// ---------------------------------------------------------------------------
// ReplayScope
//   멱등성 키의 테넌트/워크플로 범위.
// ---------------------------------------------------------------------------
struct ReplayScope {
    std::string tenant_id{};
    std::string workflow_id{};
};

class RetryingExecutor {
public:
    // backend == nullptr 이면 std::invalid_argument.
    // cache 는 선택. nullptr 이면 ReplayScope 가 주어져도 캐시를 쓰지 않는다.
    RetryingExecutor(std::shared_ptr<QueryBackend>        backend,
                     ExecutorConfig                       config,
                     std::shared_ptr<IdempotentStepCache> cache = nullptr);

    ~RetryingExecutor() = default;

    RetryingExecutor(const RetryingExecutor&)            = delete;
    RetryingExecutor& operator=(const RetryingExecutor&) = delete;

    // run
    //   스텝별 StepOutcome 을 계획 순서대로 반환한다 (스텝 수와 동일한 길이).
    [[nodiscard]] std::vector<StepOutcome> run(const QueryPlan& plan);

    // run (멱등성 재실행 방지)
    //   스텝마다 (tenant, workflow, step_name, inputs) 키로 캐시를 조회한다.
    [[nodiscard]] std::vector<StepOutcome> run(const QueryPlan& plan, const ReplayScope& scope);

private:
    [[nodiscard]] std::vector<StepOutcome> run_steps(const QueryPlan& plan, const ReplayScope* scope);

    [[nodiscard]] StepOutcome execute_step(const PlanStep& step);

    // 도구별 실행. 새 도구는 여기에 오버로드를 추가한다.
    [[nodiscard]] StepOutcome run_tool(const PlanStep& step, const ExecuteQuery& query);

    [[nodiscard]] bool is_retryable(BackendErrorCode code) const;

    std::shared_ptr<QueryBackend>        backend_;
    ExecutorConfig                       config_;
    std::shared_ptr<IdempotentStepCache> cache_;
    std::set<BackendErrorCode>           retryable_;
};

// 캐시 step_name: "<tool>#<step_id>"
[[nodiscard]] std::string step_name_of(const PlanStep& step);
