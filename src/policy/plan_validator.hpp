#pragma once

// ---------------------------------------------------------------------------
// plan_validator.hpp
//
// 게이트 이전 단계의 계획 구조 검사.
// 안전성/비용 판단은 하지 않는다 (PolicyGate 소관).
//
// 검사 항목:
//   - 스텝이 하나 이상 존재
//   - step_id 중복 없음
//   - execute_query 의 sql 이 비어 있지 않음
// ---------------------------------------------------------------------------

#include <string>
#include <vector>

#include "policy/plan.hpp"

struct PlanValidation {
    bool                     valid{false};
    std::vector<std::string> errors{};
};

class PlanValidator {
public:
    [[nodiscard]] PlanValidation validate(const QueryPlan& plan) const;
};
