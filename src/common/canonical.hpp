#pragma once

// ---------------------------------------------------------------------------
// canonical.hpp
//
// 해시/멱등성 키 계산을 위한 정규화(canonical) JSON 직렬화.
//
// [정규화 규칙]
// - 객체 키는 사전순 정렬 (std::map 순회 순서를 그대로 사용).
// - 공백 없음 (구분자 ',' ':' 만 사용).
// - double 은 최단 왕복(round-trip) 표현으로 출력한다.
// - 동일한 논리 값은 항상 동일한 바이트열을 만든다.
//
// [한계]
// - NaN/Inf 는 JSON 표준에 없으므로 "null" 로 직렬화한다.
//   (NaN 과 NULL 이 같은 해시를 갖게 된다. 결과 해시 용도로는 허용)
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

#include "common/types.hpp"

// JSON 문자열 이스케이프 (따옴표 미포함)
[[nodiscard]] std::string escape_json_string(std::string_view str);

// 단일 스칼라 값을 JSON 토큰으로 직렬화
[[nodiscard]] std::string canonical_json(const ScalarValue& value);

// 정렬된 키 순서의 JSON 객체로 직렬화 (InputMap, Row 공용)
[[nodiscard]] std::string canonical_json(const std::map<std::string, ScalarValue>& object);

// {"bytes_scanned":N,"rows":[...]} 형태로 직렬화
[[nodiscard]] std::string canonical_json(const QueryResult& result);
