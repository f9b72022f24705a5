#pragma once

// ---------------------------------------------------------------------------
// step_outcome.hpp
//
// 스텝 실행 결과 값 객체.
//
// [불변 조건]
// - status == kFailed  → error 설정됨
// - status == kSuccess → error 비어 있음
// - retry_count ≤ ExecutorConfig::max_retries
// - output_hash 는 output 의 정규화 JSON SHA-256 (실패/건너뜀이면 빈 결과의 해시)
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"

enum class StepStatus : std::uint8_t {
    kSuccess = 0,
    kFailed  = 1,
    kSkipped = 2,  // 앞선 스텝 실패로 시작하지 않음
};

[[nodiscard]] constexpr std::string_view to_string(StepStatus status) noexcept {
    switch (status) {
        case StepStatus::kSuccess: return "success";
        case StepStatus::kFailed:  return "failed";
        case StepStatus::kSkipped: return "skipped";
    }
    return "failed";
}

struct StepOutcome {
    std::string                           step_name{};
    int                                   step_id{0};
    StepStatus                            status{StepStatus::kFailed};
    QueryResult                           output{};
    std::string                           output_hash{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
    std::uint32_t                         retry_count{0};
    std::optional<std::string>            error{};
    bool                                  replayed{false};  // 멱등성 캐시에서 재사용됨
};
