#pragma once

// ---------------------------------------------------------------------------
// query_pipeline.hpp
//
// 요청 하나에 대한 전체 흐름:
//   계획 구조 검사 → PolicyGate → 판정 감사 로그/통계
//   → RetryingExecutor → 실행된 스텝의 실제 바이트 기록 → 스텝 로그
//   → post_execute 경고
//
// [예산 기록 시점]
// BudgetLedger::record 는 실제로 실행되어 성공한 스텝에 대해서만 호출된다.
// 게이트의 추정 검사와 캐시 재사용(replayed) 결과는 원장에 남지 않는다.
//
// [동시성]
// 요청당 하나의 논리 스레드. 서로 다른 요청의 run() 은 동시에 호출될 수 있다
// (모든 협력자가 자체 동기화).
// ---------------------------------------------------------------------------

#include <memory>
#include <string>
#include <vector>

#include "budget/budget_ledger.hpp"
#include "executor/retrying_executor.hpp"
#include "executor/step_outcome.hpp"
#include "logger/structured_logger.hpp"
#include "policy/plan.hpp"
#include "policy/plan_validator.hpp"
#include "policy/policy_gate.hpp"
#include "stats/gate_stats.hpp"

// ---------------------------------------------------------------------------
// PipelineRequest
//   workflow_id 가 비어 있으면 멱등성 캐시를 사용하지 않는다.
// ---------------------------------------------------------------------------
struct PipelineRequest {
    std::string tenant_id{};
    std::string workflow_id{};
    QueryPlan   plan{};
};

struct PipelineResult {
    GateResult               gate{};
    std::vector<StepOutcome> outcomes{};
    std::vector<std::string> warnings{};
};

// 판정 결과의 감사 로그 항목 (게이트 단독 사용 시에도 같은 형식을 쓴다)
[[nodiscard]] DecisionLog make_decision_log(const PipelineRequest& request, const GateResult& gate);

class QueryPipeline {
public:
    // 모든 협력자는 non-null 이어야 한다 (아니면 std::invalid_argument).
    QueryPipeline(std::shared_ptr<PolicyGate>       gate,
                  std::shared_ptr<RetryingExecutor> executor,
                  std::shared_ptr<BudgetLedger>     ledger,
                  std::shared_ptr<StructuredLogger> logger,
                  std::shared_ptr<GateStats>        stats);

    ~QueryPipeline() = default;

    QueryPipeline(const QueryPipeline&)            = delete;
    QueryPipeline& operator=(const QueryPipeline&) = delete;

    [[nodiscard]] PipelineResult run(const PipelineRequest& request);

private:
    void audit_decision(const PipelineRequest& request, const GateResult& gate);

    std::shared_ptr<PolicyGate>       gate_;
    std::shared_ptr<RetryingExecutor> executor_;
    std::shared_ptr<BudgetLedger>     ledger_;
    std::shared_ptr<StructuredLogger> logger_;
    std::shared_ptr<GateStats>        stats_;
    PlanValidator                     validator_{};
};
