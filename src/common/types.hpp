#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// ScalarValue
//   결과 행의 셀 값 및 스텝 입력 값.
//   std::monostate 는 SQL NULL 을 나타낸다.
//   재귀 구조(중첩 객체)는 지원하지 않는다. 쿼리 결과는 평면 행 집합이다.
// ---------------------------------------------------------------------------
using ScalarValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

// 열 이름 → 값. std::map 을 사용하여 키 순서가 항상 정렬 상태로 유지된다
// (정규화 직렬화 및 해시 안정성의 전제 조건).
using Row      = std::map<std::string, ScalarValue>;
using InputMap = std::map<std::string, ScalarValue>;

// ---------------------------------------------------------------------------
// QueryResult
//   쿼리 백엔드가 반환하는 구조화된 결과.
//   bytes_scanned 는 백엔드가 보고한 실제 스캔 바이트 (예산 기록에 사용).
//
//   [해시 안정성]
//   이 구조체에는 타임스탬프나 랜덤 ID 를 넣지 않는다.
//   output_hash 는 이 구조체의 정규화 직렬화만으로 계산된다.
// ---------------------------------------------------------------------------
struct QueryResult {
    std::vector<Row> rows{};
    std::int64_t     bytes_scanned{0};
};

// ---------------------------------------------------------------------------
// TimeSource
//   현재 시각 공급자. 테스트에서는 수동 시계로 교체한다.
// ---------------------------------------------------------------------------
using TimeSource = std::function<std::chrono::system_clock::time_point()>;

// 기본 시간 공급자 (system_clock::now)
[[nodiscard]] inline TimeSource system_time_source() {
    return [] { return std::chrono::system_clock::now(); };
}
