// ---------------------------------------------------------------------------
// sql_scanner.cpp
//
// 단일 패스 SQL 렉서 구현.
//
// 상태 머신은 "문자열/주석 밖 세미콜론" 탐지용으로 쓰던 구조를 일반화한 것이다:
//   kNormal → ' → 문자열 리터럴
//   kNormal → ` 또는 " → 따옴표 식별자
//   kNormal → /* → 블록 주석
//   kNormal → -- → 라인 주석
// 각 상태에서 빠져나올 때 토큰(또는 주석)을 하나 만든다.
//
// [오탐/미탐 트레이드오프]
// - 닫히지 않은 리터럴/주석은 입력 끝까지를 해당 구간으로 간주하고
//   unterminated 를 세운다. 분석기는 이를 차단한다 (보수적).
// ---------------------------------------------------------------------------

#include "parser/sql_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_ident_start(char c) {
    return (std::isalpha(static_cast<unsigned char>(c)) != 0) || c == '_';
}

bool is_ident_char(char c) {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_' || c == '$';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// 점 뒤에 식별자 세그먼트가 이어지는지 (a.b, a.`b`, a."b")
bool continues_chain(std::string_view sql, std::size_t dot_pos) {
    if (dot_pos >= sql.size() || sql[dot_pos] != '.') {
        return false;
    }
    if (dot_pos + 1 >= sql.size()) {
        return false;
    }
    const char next = sql[dot_pos + 1];
    return is_ident_start(next) || is_digit(next) || next == '`' || next == '"';
}

// quote 로 감싼 구간의 끝(닫는 따옴표 다음 위치)을 찾는다.
// 연속된 따옴표 두 개("" 또는 ``)는 이스케이프로 처리한다.
// allow_backslash: 문자열 리터럴에서만 \' 이스케이프 허용.
// 반환: {끝 위치, 닫힘 여부}
std::pair<std::size_t, bool> find_quote_end(std::string_view sql,
                                            std::size_t     open_pos,
                                            char            quote,
                                            bool            allow_backslash) {
    std::size_t i = open_pos + 1;
    const std::size_t len = sql.size();
    while (i < len) {
        const char c = sql[i];
        if (allow_backslash && c == '\\') {
            i += 2;
            continue;
        }
        if (c == quote) {
            if (i + 1 < len && sql[i + 1] == quote) {
                i += 2;
                continue;
            }
            return {i + 1, true};
        }
        ++i;
    }
    return {len, false};
}

}  // namespace

std::string to_upper_ascii(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string to_lower_ascii(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// ---------------------------------------------------------------------------
// SqlScanner::scan
// ---------------------------------------------------------------------------
ScanResult SqlScanner::scan(std::string_view sql) const {
    ScanResult result;
    const std::size_t len = sql.size();
    std::uint32_t depth = 0;
    std::size_t i = 0;

    const auto push = [&](TokenKind kind, std::size_t begin, std::size_t end, std::string text) {
        SqlToken tok;
        tok.kind   = kind;
        tok.upper  = to_upper_ascii(text);
        tok.text   = std::move(text);
        tok.offset = begin;
        tok.length = end - begin;
        tok.depth  = depth;
        result.tokens.push_back(std::move(tok));
    };

    while (i < len) {
        const char c    = sql[i];
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';

        if (is_space(c)) {
            ++i;
            continue;
        }

        // 라인 주석 -- (줄 끝까지)
        if (c == '-' && next == '-') {
            const std::size_t begin = i;
            std::size_t end = sql.find('\n', i);
            if (end == std::string_view::npos) {
                end = len;
            }
            result.comments.push_back(SqlComment{
                std::string(sql.substr(begin + 2, end - begin - 2)), begin, false});
            i = end;
            continue;
        }

        // 블록 주석 /* ... */ (중첩 미지원)
        if (c == '/' && next == '*') {
            const std::size_t begin = i;
            const std::size_t close = sql.find("*/", i + 2);
            std::size_t body_end = 0;
            if (close == std::string_view::npos) {
                result.unterminated = true;
                body_end = len;
                i = len;
            } else {
                body_end = close;
                i = close + 2;
            }
            result.comments.push_back(SqlComment{
                std::string(sql.substr(begin + 2, body_end - begin - 2)), begin, true});
            continue;
        }

        // 문자열 리터럴 '...'
        if (c == '\'') {
            const auto [end, closed] = find_quote_end(sql, i, '\'', true);
            if (!closed) {
                result.unterminated = true;
            }
            const std::size_t content_end = closed ? end - 1 : end;
            push(TokenKind::kString, i, end,
                 std::string(sql.substr(i + 1, content_end - (i + 1))));
            i = end;
            continue;
        }

        // 식별자 체인: word / `quoted` / "quoted" 세그먼트를 '.' 으로 연결
        if (is_ident_start(c) || c == '`' || c == '"') {
            const std::size_t begin = i;
            std::string text;
            bool quoted = false;

            while (i < len) {
                const char sc = sql[i];
                if (sc == '`' || sc == '"') {
                    const auto [end, closed] = find_quote_end(sql, i, sc, false);
                    if (!closed) {
                        result.unterminated = true;
                        text.append(sql.substr(i + 1));
                        i = len;
                        break;
                    }
                    text.append(sql.substr(i + 1, end - i - 2));
                    quoted = true;
                    i = end;
                } else {
                    const std::size_t seg_begin = i;
                    while (i < len && is_ident_char(sql[i])) {
                        ++i;
                    }
                    text.append(sql.substr(seg_begin, i - seg_begin));
                }

                if (!continues_chain(sql, i)) {
                    break;
                }
                text.push_back('.');
                ++i;  // '.' 건너뜀
            }

            push(quoted ? TokenKind::kQuotedIdentifier : TokenKind::kWord, begin, i, std::move(text));
            continue;
        }

        // 숫자 (1, 1.5, .5, 1e10, 0x1F)
        if (is_digit(c) || (c == '.' && is_digit(next))) {
            const std::size_t begin = i;
            while (i < len && (is_ident_char(sql[i]) || sql[i] == '.')) {
                ++i;
            }
            push(TokenKind::kNumber, begin, i, std::string(sql.substr(begin, i - begin)));
            continue;
        }

        switch (c) {
            case '(':
                push(TokenKind::kOpenParen, i, i + 1, "(");
                ++depth;
                break;
            case ')':
                if (depth == 0) {
                    result.unbalanced = true;
                } else {
                    --depth;
                }
                push(TokenKind::kCloseParen, i, i + 1, ")");
                break;
            case ';':
                push(TokenKind::kSemicolon, i, i + 1, ";");
                break;
            case ',':
                push(TokenKind::kComma, i, i + 1, ",");
                break;
            default:
                push(TokenKind::kSymbol, i, i + 1, std::string(1, c));
                break;
        }
        ++i;
    }

    if (depth != 0) {
        result.unbalanced = true;
    }

    return result;
}
