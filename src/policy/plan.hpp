#pragma once

// ---------------------------------------------------------------------------
// plan.hpp
//
// 실행 계획(QueryPlan) 데이터 모델.
// 자연어 플래너(외부 협력자)가 만든 계획을 게이트와 실행기가 공유한다.
//
// [도구 디스패치]
// ToolCall 은 도구마다 대안 하나를 갖는 std::variant 이다.
// 새 도구를 추가하면 std::visit 를 쓰는 모든 지점이 컴파일 시점에 드러난다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// ExecuteQuery
//   estimated_bytes: PolicyGate 가 통과 시 추정치를 기록한다.
// ---------------------------------------------------------------------------
struct ExecuteQuery {
    std::string                 sql{};
    std::optional<std::int64_t> estimated_bytes{};
};

using ToolCall = std::variant<ExecuteQuery>;

struct PlanStep {
    int                      step_id{0};
    ToolCall                 tool{};
    std::vector<std::string> risk_flags{};
};

struct QueryPlan {
    std::string              goal{};
    std::vector<PlanStep>    steps{};
    std::vector<std::string> required_approvals{};
};

// 도구 이름 (로그 및 멱등성 키 step_name 에 사용)
[[nodiscard]] inline std::string_view tool_name(const ToolCall& tool) {
    return std::visit([](const auto& call) -> std::string_view {
        using T = std::decay_t<decltype(call)>;
        if constexpr (std::is_same_v<T, ExecuteQuery>) {
            return "execute_query";
        }
    }, tool);
}

// 도구 입력을 정규화 가능한 InputMap 으로 변환 (멱등성 키 payload)
[[nodiscard]] inline InputMap to_inputs(const ToolCall& tool) {
    return std::visit([](const auto& call) -> InputMap {
        using T = std::decay_t<decltype(call)>;
        InputMap inputs;
        if constexpr (std::is_same_v<T, ExecuteQuery>) {
            inputs.emplace("sql", call.sql);
        }
        return inputs;
    }, tool);
}
