// ---------------------------------------------------------------------------
// policy_gate.cpp
// ---------------------------------------------------------------------------

#include "policy/policy_gate.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "policy/cost_estimator.hpp"

PolicyGate::PolicyGate(SafetyAnalyzer analyzer,
                       std::shared_ptr<BudgetLedger> ledger,
                       CostLimits limits)
    : analyzer_(std::move(analyzer))
    , ledger_(std::move(ledger))
    , limits_(limits) {
    if (!ledger_) {
        throw std::invalid_argument("PolicyGate: budget ledger must not be null");
    }
    if (limits_.per_query_max_bytes <= 0 ||
        limits_.per_query_max_bytes > limits_.per_query_max_bytes_with_approval) {
        throw std::invalid_argument(
            "PolicyGate: per_query_max_bytes must be in (0, per_query_max_bytes_with_approval]");
    }
    if (limits_.bytes_per_sql_char <= 0) {
        throw std::invalid_argument("PolicyGate: bytes_per_sql_char must be greater than 0");
    }
}

// ---------------------------------------------------------------------------
// check_tool (execute_query)
// ---------------------------------------------------------------------------
bool PolicyGate::check_tool(std::string_view tenant_id,
                            ExecuteQuery&    query,
                            GateDecision&    decision) const {
    // 1. 정적 안전성
    SqlVerdict verdict = analyzer_.evaluate(query.sql);
    if (!verdict.allowed) {
        decision.reasons     = std::move(verdict.reasons);
        decision.next_action = NextAction::kReviseQuery;
        return false;
    }

    // 2. 재작성 적용
    if (verdict.rewritten_sql) {
        query.sql = std::move(*verdict.rewritten_sql);
    }

    // 3. 추정
    const std::int64_t bytes = estimate_bytes(query.sql, limits_);
    decision.estimated_bytes    = bytes;
    decision.estimated_cost_usd = estimate_cost_usd(bytes, limits_);

    // 4. 쿼리당 상한
    if (bytes > limits_.per_query_max_bytes_with_approval) {
        decision.reasons.emplace_back("Query exceeds hard max bytes with approval");
        decision.next_action = NextAction::kNarrowScope;
        return false;
    }
    if (bytes > limits_.per_query_max_bytes) {
        decision.reasons.emplace_back("Query exceeds per-query limit and requires approval");
        decision.approval_required = true;
        decision.next_action       = NextAction::kPreviewThenApprove;
        return false;
    }

    // 5. 시간당 예산
    const BudgetStatus budget = ledger_->check(tenant_id, bytes);
    if (!budget.allowed) {
        decision.reasons.emplace_back("Hourly budget exceeded");
        if (budget.suggestion) {
            decision.reasons.push_back(*budget.suggestion);
        }
        decision.next_action = NextAction::kWaitOrReduceCost;
        return false;
    }

    // 6. 추정치 기록
    query.estimated_bytes = bytes;
    return true;
}

// ---------------------------------------------------------------------------
// pre_execute
// ---------------------------------------------------------------------------
GateResult PolicyGate::pre_execute(std::string_view tenant_id, QueryPlan plan) const {
    GateDecision decision{};

    for (auto& step : plan.steps) {
        const bool cleared = std::visit(
            [&](auto& call) { return check_tool(tenant_id, call, decision); }, step.tool);

        if (!cleared) {
            decision.allowed = false;
            spdlog::info("policy_gate: denied tenant='{}' step={} next_action={}",
                         tenant_id, step.step_id, to_string(decision.next_action));
            GateResult result{};
            result.allowed  = false;
            result.reasons  = decision.reasons;
            result.plan     = std::move(plan);
            result.decision = std::move(decision);
            return result;
        }
    }

    decision.allowed     = true;
    decision.next_action = NextAction::kNone;
    spdlog::debug("policy_gate: allowed tenant='{}' steps={}", tenant_id, plan.steps.size());

    GateResult result{};
    result.allowed  = true;
    result.plan     = std::move(plan);
    result.decision = std::move(decision);
    return result;
}

// ---------------------------------------------------------------------------
// post_execute
// ---------------------------------------------------------------------------
std::vector<std::string> PolicyGate::post_execute(const QueryResult& output) const {
    std::vector<std::string> warnings;
    if (output.rows.empty()) {
        warnings.emplace_back("No data returned");
        return warnings;
    }

    const auto limit = analyzer_.limits().default_limit;
    if (output.rows.size() >= limit) {
        warnings.push_back("Result may be truncated at LIMIT " + std::to_string(limit));
    }
    return warnings;
}
