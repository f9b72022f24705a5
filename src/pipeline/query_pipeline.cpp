// ---------------------------------------------------------------------------
// query_pipeline.cpp
// ---------------------------------------------------------------------------

#include "pipeline/query_pipeline.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

namespace {

// 감사 로그에 남기는 SQL 접두 길이
constexpr std::size_t kAuditSqlPrefixLen = 80;

std::string first_sql_prefix(const QueryPlan& plan) {
    for (const auto& step : plan.steps) {
        if (const auto* query = std::get_if<ExecuteQuery>(&step.tool)) {
            return query->sql.substr(0, kAuditSqlPrefixLen);
        }
    }
    return {};
}

}  // namespace

QueryPipeline::QueryPipeline(std::shared_ptr<PolicyGate>       gate,
                             std::shared_ptr<RetryingExecutor> executor,
                             std::shared_ptr<BudgetLedger>     ledger,
                             std::shared_ptr<StructuredLogger> logger,
                             std::shared_ptr<GateStats>        stats)
    : gate_(std::move(gate))
    , executor_(std::move(executor))
    , ledger_(std::move(ledger))
    , logger_(std::move(logger))
    , stats_(std::move(stats)) {
    if (!gate_ || !executor_ || !ledger_ || !logger_ || !stats_) {
        throw std::invalid_argument("QueryPipeline: collaborators must not be null");
    }
}

DecisionLog make_decision_log(const PipelineRequest& request, const GateResult& gate) {
    DecisionLog entry{};
    entry.tenant_id          = request.tenant_id;
    entry.workflow_id        = request.workflow_id;
    entry.allowed            = gate.allowed;
    entry.approval_required  = gate.decision.approval_required;
    entry.next_action        = std::string(to_string(gate.decision.next_action));
    entry.reasons            = gate.reasons;
    entry.estimated_bytes    = gate.decision.estimated_bytes;
    entry.estimated_cost_usd = gate.decision.estimated_cost_usd;
    entry.sql_prefix         = first_sql_prefix(gate.plan);
    entry.timestamp          = std::chrono::system_clock::now();
    return entry;
}

void QueryPipeline::audit_decision(const PipelineRequest& request, const GateResult& gate) {
    stats_->on_decision(gate.allowed, gate.decision.approval_required);
    logger_->log_decision(make_decision_log(request, gate));
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
PipelineResult QueryPipeline::run(const PipelineRequest& request) {
    PipelineResult result{};

    // 1. 계획 구조 검사
    const PlanValidation validation = validator_.validate(request.plan);
    if (!validation.valid) {
        result.gate.allowed              = false;
        result.gate.reasons              = validation.errors;
        result.gate.plan                 = request.plan;
        result.gate.decision.reasons     = validation.errors;
        result.gate.decision.next_action = NextAction::kReviseQuery;
        audit_decision(request, result.gate);
        return result;
    }

    // 2. 게이트
    result.gate = gate_->pre_execute(request.tenant_id, request.plan);
    audit_decision(request, result.gate);
    if (!result.gate.allowed) {
        return result;
    }

    // 3. 실행
    if (request.workflow_id.empty()) {
        result.outcomes = executor_->run(result.gate.plan);
    } else {
        result.outcomes = executor_->run(
            result.gate.plan, ReplayScope{request.tenant_id, request.workflow_id});
    }

    // 4. 기록 / 로그 / 사후 경고
    for (const auto& outcome : result.outcomes) {
        if (outcome.status != StepStatus::kSkipped) {
            stats_->on_step(outcome.status == StepStatus::kFailed,
                            outcome.retry_count, outcome.replayed);
        }

        if (outcome.status == StepStatus::kSuccess && !outcome.replayed) {
            ledger_->record(request.tenant_id, outcome.output.bytes_scanned);
            logger_->log_usage(UsageLog{
                .tenant_id    = request.tenant_id,
                .bytes        = outcome.output.bytes_scanned,
                .window_usage = ledger_->usage(request.tenant_id),
                .budget       = ledger_->budget_for(request.tenant_id),
                .timestamp    = std::chrono::system_clock::now(),
            });
        }

        StepLog step_log{};
        step_log.tenant_id   = request.tenant_id;
        step_log.workflow_id = request.workflow_id;
        step_log.step_name   = outcome.step_name;
        step_log.status      = std::string(to_string(outcome.status));
        step_log.retry_count = outcome.retry_count;
        step_log.replayed    = outcome.replayed;
        step_log.output_hash = outcome.output_hash;
        step_log.error       = outcome.error.value_or("");
        step_log.duration    = std::chrono::duration_cast<std::chrono::microseconds>(
            outcome.finished_at - outcome.started_at);
        step_log.timestamp   = std::chrono::system_clock::now();
        logger_->log_step(step_log);

        if (outcome.status == StepStatus::kSuccess) {
            for (auto& warning : gate_->post_execute(outcome.output)) {
                result.warnings.push_back(std::move(warning));
            }
        }
    }

    spdlog::debug("query_pipeline: tenant='{}' steps={} warnings={}",
                  request.tenant_id, result.outcomes.size(), result.warnings.size());
    return result;
}
