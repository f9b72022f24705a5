#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사 로그 레코드 타입 정의.
//
// [순환 의존성 방지 설계]
// - NextAction, StepStatus 를 직접 include 하지 않는다.
//   호출자가 to_string() 결과를 문자열 필드에 채운다.
//
// [민감정보 취급 주의]
// - sql_prefix 는 SQL 앞부분만 담는다 (호출자가 잘라서 전달).
//   원문 SQL 전체를 감사 로그에 남기지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   감사 로거의 최소 출력 레벨. config 의 global.log_level 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "trace"/"debug" → kDebug, "warn" → kWarn, "error"/"critical" → kError, 그 외 kInfo
[[nodiscard]] LogLevel log_level_from_string(std::string_view name) noexcept;

// ---------------------------------------------------------------------------
// DecisionLog
//   계획 하나에 대한 게이트 판정 ("gate_decision").
//   next_action: to_string(NextAction)
// ---------------------------------------------------------------------------
struct DecisionLog {
    std::string                           tenant_id{};
    std::string                           workflow_id{};
    bool                                  allowed{false};
    bool                                  approval_required{false};
    std::string                           next_action{};
    std::vector<std::string>              reasons{};
    std::int64_t                          estimated_bytes{0};
    double                                estimated_cost_usd{0.0};
    std::string                           sql_prefix{};  // 첫 스텝 SQL 앞부분
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// StepLog
//   스텝 실행 결과 ("step_outcome").
//   status: to_string(StepStatus)
// ---------------------------------------------------------------------------
struct StepLog {
    std::string                           tenant_id{};
    std::string                           workflow_id{};
    std::string                           step_name{};
    std::string                           status{};
    std::uint32_t                         retry_count{0};
    bool                                  replayed{false};
    std::string                           output_hash{};
    std::string                           error{};     // 빈 문자열이면 오류 없음
    std::chrono::microseconds             duration{0};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// UsageLog
//   예산 원장 기록 ("usage_recorded").
// ---------------------------------------------------------------------------
struct UsageLog {
    std::string                           tenant_id{};
    std::int64_t                          bytes{0};
    std::int64_t                          window_usage{0};  // 기록 직후 윈도우 사용량
    std::int64_t                          budget{0};
    std::chrono::system_clock::time_point timestamp{};
};
