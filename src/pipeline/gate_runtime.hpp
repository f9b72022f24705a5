#pragma once

// ---------------------------------------------------------------------------
// gate_runtime.hpp
//
// GateConfig 로부터 게이트 구성 요소 전체를 조립하는 구성 루트.
//
// [설정 반영]
// - global.log_level / log_path : StructuredLogger (주입된 로거가 없을 때)
// - safety / cost / budget      : SafetyAnalyzer, PolicyGate, BudgetLedger
// - executor.deadline_threads   : 0 이면 DeadlineBackend 를 씌우지 않는다.
//                                  그 외에는 deadline_pool_size() 크기의 풀.
// - cache.capacity              : IdempotentStepCache 용량
//
// [백엔드 없는 구성]
// options.backend 가 nullptr 이면 게이트 전용 구성이다. executor/pipeline
// 은 nullptr 로 남는다 (CLI 판정 모드).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <memory>

#include "budget/budget_ledger.hpp"
#include "budget/usage_store.hpp"
#include "common/types.hpp"
#include "executor/query_backend.hpp"
#include "executor/retrying_executor.hpp"
#include "executor/step_cache.hpp"
#include "logger/structured_logger.hpp"
#include "pipeline/query_pipeline.hpp"
#include "policy/gate_config.hpp"
#include "policy/policy_gate.hpp"
#include "stats/gate_stats.hpp"

struct RuntimeOptions {
    std::shared_ptr<QueryBackend>     backend{};
    std::shared_ptr<StructuredLogger> logger{};       // nullptr 이면 global.log_path 로 생성
    bool                              echo_audit_to_stdout{true};
    std::shared_ptr<UsageStore>       usage_store{};  // nullptr 이면 InMemoryUsageStore
    TimeSource                        now{system_time_source()};
};

struct GateRuntime {
    std::shared_ptr<BudgetLedger>        ledger;
    std::shared_ptr<PolicyGate>          gate;
    std::shared_ptr<StructuredLogger>    logger;
    std::shared_ptr<GateStats>           stats;
    std::shared_ptr<IdempotentStepCache> cache;
    std::shared_ptr<QueryBackend>        backend;   // 타임아웃 데코레이터 적용 후
    std::shared_ptr<RetryingExecutor>    executor;
    std::shared_ptr<QueryPipeline>       pipeline;
};

// deadline_pool_size
//   DeadlineBackend 풀 크기. 0 이면 타임아웃 강제를 하지 않는다.
//   시간 초과된 호출은 풀 스레드를 계속 점유하므로, 한 스텝의 모든 시도가
//   앞선 시도 뒤에 줄 서지 않도록 최소 max_retries + 1 개를 확보한다.
[[nodiscard]] std::size_t deadline_pool_size(const ExecutorConfig& config) noexcept;

// build_runtime
//   config 는 ConfigLoader::validate 를 통과해야 한다 (아니면 std::invalid_argument).
//   로그 파일 생성 실패는 std::runtime_error.
[[nodiscard]] GateRuntime build_runtime(const GateConfig& config, RuntimeOptions options = {});
