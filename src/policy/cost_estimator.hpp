#pragma once

// ---------------------------------------------------------------------------
// cost_estimator.hpp
//
// SQL 길이 기반의 거친 스캔 바이트 추정.
// 정확도가 목적이 아니다. 쿼리가 길수록 추정치가 커지는 단조 대리 지표이며,
// hard cap + 1 에서 잘라 오버플로 없이 "hard cap 초과" 를 표현한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string_view>

#include "policy/gate_config.hpp"

// min(len(sql) × bytes_per_sql_char, hard_cap + 1)
[[nodiscard]] std::int64_t estimate_bytes(std::string_view sql, const CostLimits& limits);

// round(bytes / 2^40 × usd_per_tib, 4 자리)
[[nodiscard]] double estimate_cost_usd(std::int64_t bytes, const CostLimits& limits);
