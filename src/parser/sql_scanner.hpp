#pragma once

// ---------------------------------------------------------------------------
// sql_scanner.hpp
//
// SQL 텍스트를 토큰 열과 주석 목록으로 분해하는 단일 패스 렉서.
// AST 를 만들지 않는다. SafetyAnalyzer 의 구조 휴리스틱(조인 수, 서브쿼리
// 깊이, 절 위치 탐색)이 이 토큰 열 위에서 동작한다.
//
// [토큰화 규칙]
// - '...' 문자열 리터럴은 불투명 토큰(kString). 내부의 세미콜론/키워드는
//   구조 검사에 영향을 주지 않는다. '' 및 \' 이스케이프를 처리한다.
// - `...` / "..." 는 따옴표 식별자. 점으로 연결된 체인(a.b.`c`)은 토큰 하나.
// - -- 와 /* */ 주석은 토큰에서 제외하고 comments 에 본문을 모은다.
//   (주석 내 위험 키워드 탐지용)
// - '#' 는 주석으로 취급하지 않는다 (ANSI / BigQuery 방언 기준).
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 방언별 이스케이프: MySQL 의 "..." 문자열, PostgreSQL 의 $$...$$ 달러 인용은
//    구분하지 않는다. "..." 는 식별자로, $$ 는 기호로 처리된다.
// 2. 중첩 블록 주석 미지원 (첫 번째 */ 에서 종료).
// 3. 닫히지 않은 리터럴/주석은 unterminated 플래그로만 보고한다.
//    호출자는 이를 fail-close 로 처리해야 한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// TokenKind
// ---------------------------------------------------------------------------
enum class TokenKind : std::uint8_t {
    kWord             = 0,  // 키워드 또는 따옴표 없는 식별자 (점 체인 포함)
    kQuotedIdentifier = 1,  // 따옴표 구간을 포함한 식별자 체인 (따옴표 제거됨)
    kString           = 2,  // '...' 문자열 리터럴 (내용만 보관)
    kNumber           = 3,
    kOpenParen        = 4,
    kCloseParen       = 5,
    kSemicolon        = 6,
    kComma            = 7,
    kSymbol           = 8,  // 연산자 등 그 외 단일 문자
};

// ---------------------------------------------------------------------------
// SqlToken
//   offset/length 는 원문 SQL 기준 바이트 위치 (재작성 시 삽입 위치로 사용).
//   depth 는 토큰 시점의 괄호 중첩 깊이. '(' 와 ')' 는 바깥 깊이를 갖는다.
// ---------------------------------------------------------------------------
struct SqlToken {
    TokenKind     kind{TokenKind::kSymbol};
    std::string   text{};    // 원문 (따옴표 식별자는 따옴표 제거)
    std::string   upper{};   // 대문자 변환 (키워드 비교용)
    std::size_t   offset{0};
    std::size_t   length{0};
    std::uint32_t depth{0};
};

// ---------------------------------------------------------------------------
// SqlComment
// ---------------------------------------------------------------------------
struct SqlComment {
    std::string body{};      // 주석 구분자를 제외한 본문
    std::size_t offset{0};
    bool        block{false};  // true = /* */, false = --
};

// ---------------------------------------------------------------------------
// ScanResult
//   unterminated: 닫히지 않은 문자열/식별자/블록 주석 존재
//   unbalanced  : 괄호 짝 불일치
// ---------------------------------------------------------------------------
struct ScanResult {
    std::vector<SqlToken>   tokens{};
    std::vector<SqlComment> comments{};
    bool                    unterminated{false};
    bool                    unbalanced{false};
};

// ---------------------------------------------------------------------------
// SqlScanner
//   상태 없음. 복사/이동 자유.
// ---------------------------------------------------------------------------
class SqlScanner {
public:
    [[nodiscard]] ScanResult scan(std::string_view sql) const;
};

// 토큰이 따옴표 없는 키워드 kw(대문자) 인지 확인
[[nodiscard]] inline bool is_keyword(const SqlToken& token, std::string_view kw) {
    return token.kind == TokenKind::kWord && token.upper == kw;
}

// ASCII 대문자 변환
[[nodiscard]] std::string to_upper_ascii(std::string_view s);

// ASCII 소문자 변환
[[nodiscard]] std::string to_lower_ascii(std::string_view s);
