#pragma once

// ---------------------------------------------------------------------------
// policy_gate.hpp
//
// 실행 전/후 정책 게이트 ("critic").
// SafetyAnalyzer + 비용 추정 + BudgetLedger 판정을 하나의 GateDecision 으로
// 합성하고, 호출자가 스스로 조치할 수 있도록 next_action 을 붙인다.
//
// [평가 순서: 스텝 순서대로, 첫 번째 차단 스텝에서 중단]
// 1. SafetyAnalyzer 거부          → revise_query
// 2. 재작성 SQL 적용
// 3. 바이트/비용 추정
// 4. hard cap 초과                → narrow_scope
//    soft cap 초과                → approval_required, preview_then_approve
// 5. 테넌트 시간당 예산 초과        → wait_or_reduce_cost
// 6. 스텝에 추정치 기록
//
// [fail-close 원칙]
// 정책 위반과 예산 초과는 예외가 아니라 데이터(GateResult)로 반환한다.
// allowed == true 는 모든 스텝이 위 검사를 통과했을 때만 반환된다.
//
// [의존 방향]
// policy_gate.hpp → safety_analyzer.hpp, budget_ledger.hpp, gate_config.hpp, plan.hpp
// ---------------------------------------------------------------------------

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "budget/budget_ledger.hpp"
#include "common/types.hpp"
#include "parser/safety_analyzer.hpp"
#include "policy/gate_config.hpp"
#include "policy/plan.hpp"

// ---------------------------------------------------------------------------
// NextAction
// ---------------------------------------------------------------------------
enum class NextAction : std::uint8_t {
    kNone               = 0,
    kReviseQuery        = 1,  // SQL 안전성 위반: 쿼리 수정 필요
    kNarrowScope        = 2,  // hard cap 초과: 범위 축소 필요
    kPreviewThenApprove = 3,  // soft cap 초과: 미리보기 후 승인 경로
    kWaitOrReduceCost   = 4,  // 시간당 예산 초과
};

[[nodiscard]] constexpr std::string_view to_string(NextAction action) noexcept {
    switch (action) {
        case NextAction::kNone:               return "none";
        case NextAction::kReviseQuery:        return "revise_query";
        case NextAction::kNarrowScope:        return "narrow_scope";
        case NextAction::kPreviewThenApprove: return "preview_then_approve";
        case NextAction::kWaitOrReduceCost:   return "wait_or_reduce_cost";
    }
    return "none";
}

// ---------------------------------------------------------------------------
// GateDecision
//   approval_required == true 이면 allowed == false,
//   next_action == kPreviewThenApprove 이다.
//   estimated_bytes / estimated_cost_usd 는 마지막으로 추정된 스텝의 값.
// ---------------------------------------------------------------------------
struct GateDecision {
    bool                     allowed{false};
    std::vector<std::string> reasons{};
    bool                     approval_required{false};
    NextAction               next_action{NextAction::kNone};
    std::int64_t             estimated_bytes{0};
    double                   estimated_cost_usd{0.0};
};

// ---------------------------------------------------------------------------
// GateResult
//   plan: 재작성 SQL 과 추정치가 반영된 계획 (차단 시 차단 스텝까지만 반영)
// ---------------------------------------------------------------------------
struct GateResult {
    bool                     allowed{false};
    std::vector<std::string> reasons{};
    QueryPlan                plan{};
    GateDecision             decision{};
};

// ---------------------------------------------------------------------------
// PolicyGate
//   [스레드 안전성]
//   pre_execute/post_execute 는 concurrent 호출 안전.
//   (SafetyAnalyzer 는 상태 없음, BudgetLedger 는 자체 동기화)
// ---------------------------------------------------------------------------
class PolicyGate {
public:
    // ledger == nullptr 또는 soft cap > hard cap 이면 std::invalid_argument.
    PolicyGate(SafetyAnalyzer analyzer, std::shared_ptr<BudgetLedger> ledger, CostLimits limits);

    ~PolicyGate() = default;

    PolicyGate(const PolicyGate&)            = delete;
    PolicyGate& operator=(const PolicyGate&) = delete;
    PolicyGate(PolicyGate&&)                 = default;
    PolicyGate& operator=(PolicyGate&&)      = default;

    // pre_execute
    //   tenant_id 의 계획을 평가한다. 계획은 복사본이 재작성되어 반환된다.
    [[nodiscard]] GateResult pre_execute(std::string_view tenant_id, QueryPlan plan) const;

    // post_execute
    //   실행 결과에 대한 경고 목록. 차단하지 않는다.
    //   - 빈 결과         → "No data returned"
    //   - 행 수 ≥ LIMIT   → "Result may be truncated at LIMIT N"
    [[nodiscard]] std::vector<std::string> post_execute(const QueryResult& output) const;

    [[nodiscard]] const CostLimits& cost_limits() const noexcept { return limits_; }

private:
    // 스텝 하나의 도구 호출을 평가한다. 차단이면 false.
    bool check_tool(std::string_view tenant_id, ExecuteQuery& query, GateDecision& decision) const;

    SafetyAnalyzer                analyzer_;
    std::shared_ptr<BudgetLedger> ledger_;
    CostLimits                    limits_;
};
