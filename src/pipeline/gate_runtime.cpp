// ---------------------------------------------------------------------------
// gate_runtime.cpp
// ---------------------------------------------------------------------------

#include "pipeline/gate_runtime.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "executor/deadline_backend.hpp"
#include "parser/safety_analyzer.hpp"
#include "policy/config_loader.hpp"

std::size_t deadline_pool_size(const ExecutorConfig& config) noexcept {
    if (config.deadline_threads == 0) {
        return 0;
    }
    return std::max<std::size_t>(config.deadline_threads,
                                 static_cast<std::size_t>(config.max_retries) + 1);
}

// ---------------------------------------------------------------------------
// build_runtime
// ---------------------------------------------------------------------------
GateRuntime build_runtime(const GateConfig& config, RuntimeOptions options) {
    if (auto valid = ConfigLoader::validate(config); !valid) {
        throw std::invalid_argument("build_runtime: " + valid.error());
    }

    GateRuntime runtime{};

    // ── 감사 로거 ──────────────────────────────────────────────────────────
    runtime.logger = options.logger;
    if (!runtime.logger) {
        runtime.logger = std::make_shared<StructuredLogger>(
            log_level_from_string(config.global.log_level),
            config.global.log_path,
            options.echo_audit_to_stdout);
    }
    runtime.stats = std::make_shared<GateStats>();

    // ── 예산 원장 + 게이트 ─────────────────────────────────────────────────
    std::shared_ptr<UsageStore> store = std::move(options.usage_store);
    if (!store) {
        store = std::make_shared<InMemoryUsageStore>();
    }
    runtime.ledger = std::make_shared<BudgetLedger>(std::move(store), config.budget, std::move(options.now));
    runtime.gate   = std::make_shared<PolicyGate>(SafetyAnalyzer(config.safety), runtime.ledger, config.cost);

    if (!options.backend) {
        spdlog::info("gate_runtime: gate-only runtime (no query backend)");
        return runtime;
    }

    // ── 실행기 ─────────────────────────────────────────────────────────────
    runtime.backend = std::move(options.backend);
    if (const std::size_t threads = deadline_pool_size(config.executor); threads > 0) {
        runtime.backend = std::make_shared<DeadlineBackend>(runtime.backend, threads);
        spdlog::info("gate_runtime: deadline pool threads={}", threads);
    }

    runtime.cache    = std::make_shared<IdempotentStepCache>(config.cache.capacity);
    runtime.executor = std::make_shared<RetryingExecutor>(runtime.backend, config.executor, runtime.cache);
    runtime.pipeline = std::make_shared<QueryPipeline>(
        runtime.gate, runtime.executor, runtime.ledger, runtime.logger, runtime.stats);

    spdlog::info("gate_runtime: ready max_retries={} cache_capacity={}",
                 config.executor.max_retries, config.cache.capacity);
    return runtime;
}
