#pragma once

// ---------------------------------------------------------------------------
// gate_config.hpp
//
// 게이트 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/querygate.yaml 에서 로드된다.
//
// [설계 원칙]
// - 모든 멤버는 기본값을 명시한다. YAML 에서 누락된 필드는 기본값 유지.
// - 유효성 검사(예산 > 0, soft cap ≤ hard cap 등)는 ConfigLoader::validate
//   와 각 컴포넌트 생성자에서 수행한다. 이 구조체는 판정 로직을 갖지 않는다.
//
// [의존 방향]
// gate_config.hpp → safety_analyzer.hpp (SafetyLimits), budget_ledger.hpp (BudgetLimits)
// 역방향 include 금지.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "budget/budget_ledger.hpp"
#include "parser/safety_analyzer.hpp"

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level: "trace"|"debug"|"info"|"warn"|"error"|"critical"
//   log_path : 감사 로그(JSON lines) 파일 경로
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_path{"logs/querygate.log"};
};

// ---------------------------------------------------------------------------
// CostLimits
//   per_query_max_bytes              : soft cap. 초과 시 승인 필요.
//   per_query_max_bytes_with_approval: hard cap. 초과 시 범위 축소 요구.
//   bytes_per_sql_char               : SQL 길이 기반 추정 계수
//   usd_per_tib                      : 1 TiB 스캔당 비용 (USD)
// ---------------------------------------------------------------------------
struct CostLimits {
    std::int64_t per_query_max_bytes{10LL * 1024 * 1024 * 1024};
    std::int64_t per_query_max_bytes_with_approval{100LL * 1024 * 1024 * 1024};
    std::int64_t bytes_per_sql_char{2048};
    double       usd_per_tib{5.0};
};

// ---------------------------------------------------------------------------
// ExecutorConfig
//   max_retries      : 재시도 상한 (첫 시도 제외)
//   call_timeout     : 백엔드 호출 1회당 타임아웃
//   retryable_errors : 재시도 대상 오류 코드 이름 (BackendErrorCode 문자열)
//   deadline_threads : DeadlineBackend 스레드 풀 크기 (0 = 타임아웃 강제 안 함).
//                      실제 풀은 최소 max_retries + 1 (deadline_pool_size 참조).
// ---------------------------------------------------------------------------
struct ExecutorConfig {
    std::uint32_t             max_retries{3};
    std::chrono::milliseconds call_timeout{30000};
    std::vector<std::string>  retryable_errors{"transient_error", "timeout"};
    std::uint32_t             deadline_threads{4};
};

// ---------------------------------------------------------------------------
// CacheConfig
//   capacity == 0 이면 무제한.
// ---------------------------------------------------------------------------
struct CacheConfig {
    std::size_t capacity{0};
};

// ---------------------------------------------------------------------------
// GateConfig
//   전체 설정의 루트 구조체. ConfigLoader::load 가 반환한다.
// ---------------------------------------------------------------------------
struct GateConfig {
    GlobalConfig   global{};
    SafetyLimits   safety{};
    BudgetLimits   budget{};
    CostLimits     cost{};
    ExecutorConfig executor{};
    CacheConfig    cache{};
};
