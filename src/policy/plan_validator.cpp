// ---------------------------------------------------------------------------
// plan_validator.cpp
// ---------------------------------------------------------------------------

#include "policy/plan_validator.hpp"

#include <set>
#include <string>
#include <type_traits>
#include <variant>

#include <spdlog/spdlog.h>

PlanValidation PlanValidator::validate(const QueryPlan& plan) const {
    PlanValidation result{};

    if (plan.steps.empty()) {
        result.errors.emplace_back("plan has no steps");
    }

    std::set<int> seen;
    for (const auto& step : plan.steps) {
        if (!seen.insert(step.step_id).second) {
            result.errors.push_back("duplicate step_id " + std::to_string(step.step_id));
        }

        std::visit([&](const auto& call) {
            using T = std::decay_t<decltype(call)>;
            if constexpr (std::is_same_v<T, ExecuteQuery>) {
                if (call.sql.find_first_not_of(" \t\r\n") == std::string::npos) {
                    result.errors.push_back(
                        "step " + std::to_string(step.step_id) + ": execute_query missing sql");
                }
            }
        }, step.tool);
    }

    result.valid = result.errors.empty();
    if (!result.valid) {
        spdlog::info("plan_validator: invalid plan errors={}", result.errors.size());
    }
    return result;
}
