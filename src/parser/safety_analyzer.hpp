#pragma once

// ---------------------------------------------------------------------------
// safety_analyzer.hpp
//
// 실행 전 SQL 정적 안전성 분석기.
// SqlScanner 토큰 열 위에서 "구조 휴리스틱 + 텍스트 재작성" 으로 동작하며
// AST 를 만들지 않는다.
//
// [검사 순서: 첫 번째 차단 조건에서 즉시 반환]
// 0. 빈 입력 / 닫히지 않은 리터럴 / 괄호 불일치
// 1. 멀티 스테이트먼트 (단일 후행 세미콜론은 허용)
// 2. DDL/DML 키워드 (SELECT / WITH ... SELECT 만 허용)
// 3. 주석 내 위험 키워드
// 4. 최상위 JOIN 수
// 5. 서브쿼리 중첩 깊이
// 6. 비집계 SELECT 에 LIMIT 자동 추가        (재작성, 허용 여부 불변)
// 7. 파티션 테이블에 기간 필터 자동 추가       (재작성, 허용 여부 불변)
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 방언별 문자열 표기($$...$$, MySQL "...")는 렉서가 구분하지 못한다.
// 2. UNION 등 집합 연산의 두 번째 이후 SELECT 에는 파티션 필터를 넣지 않는다.
// 3. 최상위 SELECT 가 괄호로 감싸진 쿼리 "(SELECT ...)" 는 재작성하지 않는다.
//
// [오탐/미탐 트레이드오프]
// - 라이브 코드 어디든 변경 동사가 보이면 차단한다. SELECT ... FOR UPDATE 같은
//   잠금 절도 차단된다 (보수적).
// - 주석 안의 변경 동사도 차단한다. 정상적인 설명 주석에서 false positive 가능.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "parser/sql_scanner.hpp"

// ---------------------------------------------------------------------------
// SafetyLimits
//   partitioned_tables: "dataset.table" → 파티션 컬럼명.
//   키는 소문자 비교되며, 쿼리의 테이블 참조가 키와 같거나 ".키" 로 끝나면 일치.
// ---------------------------------------------------------------------------
struct SafetyLimits {
    std::uint32_t default_limit{10000};
    std::uint32_t max_join_depth{5};
    std::uint32_t max_subquery_depth{3};
    std::uint32_t partition_lookback_days{30};
    std::map<std::string, std::string> partitioned_tables{
        {"analytics.events", "created_at"},
        {"analytics.orders", "created_at"},
        {"analytics.users",  "created_at"},
    };
};

// ---------------------------------------------------------------------------
// SqlVerdict
//   allowed == false 이면 rewritten_sql 은 항상 비어 있다.
//   allowed == true 인 경우 reasons 는 적용된 재작성 안내 문구를 담는다.
// ---------------------------------------------------------------------------
struct SqlVerdict {
    bool                       allowed{false};
    std::vector<std::string>   reasons{};
    std::optional<std::string> rewritten_sql{};
};

// ---------------------------------------------------------------------------
// SafetyAnalyzer
//   순수 함수형. evaluate() 는 I/O 없이 결정적으로 동작하며
//   concurrent 호출에 안전하다.
// ---------------------------------------------------------------------------
class SafetyAnalyzer {
public:
    // default_limit == 0 이면 std::invalid_argument (설정 오류).
    explicit SafetyAnalyzer(SafetyLimits limits = {});

    ~SafetyAnalyzer() = default;

    SafetyAnalyzer(const SafetyAnalyzer&)            = default;
    SafetyAnalyzer& operator=(const SafetyAnalyzer&) = default;
    SafetyAnalyzer(SafetyAnalyzer&&)                 = default;
    SafetyAnalyzer& operator=(SafetyAnalyzer&&)      = default;

    // evaluate
    //   sql: 원문 SQL
    //   반환: SqlVerdict (재작성이 일어난 경우에만 rewritten_sql 설정)
    [[nodiscard]] SqlVerdict evaluate(std::string_view sql) const;

    [[nodiscard]] const SafetyLimits& limits() const noexcept { return limits_; }

private:
    SafetyLimits limits_;
    SqlScanner   scanner_{};
};
