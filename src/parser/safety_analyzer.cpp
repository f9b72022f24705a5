// ---------------------------------------------------------------------------
// safety_analyzer.cpp
//
// SqlScanner 토큰 열 위에서 동작하는 안전성 검사 + 텍스트 재작성.
//
// [재작성 기준 텍스트]
// 첫 토큰 시작부터 마지막 코드 토큰 끝까지의 원문 구간을 사용한다.
// 앞뒤 주석과 후행 세미콜론은 재작성 결과에서 빠진다.
// 구간 내부 주석은 원문 그대로 유지된다.
//
// [감싸는 괄호]
// 쿼리 전체를 감싼 괄호 "(SELECT ...)" 는 서브쿼리가 아니다. 감싼 겹수를
// 최상위 깊이로 보고 JOIN 수와 기존 LIMIT 을 그 깊이에서 센다.
//
// [메인 SELECT]
// CTE 본문 밖에서 가장 얕은 깊이의 첫 번째 SELECT. "(SELECT ...) UNION ..."
// 처럼 괄호 안에만 SELECT 가 있어도 첫 피연산자가 메인 SELECT 가 된다.
// 파티션 필터는 메인 SELECT 블록 안에, LIMIT 은 문장 끝에 붙는다.
// ---------------------------------------------------------------------------

#include "parser/safety_analyzer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

// 로그에 남기는 SQL 접두 길이 (원문 전체를 로그에 남기지 않는다)
constexpr std::size_t kLogSqlPrefixLen = 80;

constexpr std::array<std::string_view, 10> kMutatingVerbs = {
    "CREATE", "DROP", "ALTER", "INSERT", "UPDATE",
    "DELETE", "TRUNCATE", "MERGE", "GRANT", "REVOKE",
};

constexpr std::array<std::string_view, 12> kAggregateFunctions = {
    "COUNT", "COUNTIF", "SUM", "AVG", "MIN", "MAX",
    "ARRAY_AGG", "STRING_AGG", "APPROX_COUNT_DISTINCT", "ANY_VALUE",
    "STDDEV", "VARIANCE",
};

// WHERE 절을 끝내는 깊이 0 키워드
constexpr std::array<std::string_view, 11> kClauseTerminators = {
    "GROUP", "HAVING", "QUALIFY", "WINDOW", "ORDER", "LIMIT",
    "UNION", "EXCEPT", "INTERSECT", "OFFSET", "FETCH",
};

constexpr std::array<std::string_view, 3> kSetOperators = {"UNION", "EXCEPT", "INTERSECT"};

// 테이블 참조 뒤에 오면 별칭이 아닌 키워드
constexpr std::array<std::string_view, 25> kNonAliasWords = {
    "WHERE", "JOIN", "ON", "USING", "LEFT", "RIGHT", "INNER", "OUTER", "FULL",
    "CROSS", "NATURAL", "GROUP", "ORDER", "LIMIT", "HAVING", "QUALIFY", "WINDOW",
    "UNION", "EXCEPT", "INTERSECT", "OFFSET", "FETCH", "TABLESAMPLE", "FOR", "AS",
};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& set, std::string_view word) {
    return std::find(set.begin(), set.end(), word) != set.end();
}

bool ends_with(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() &&
           value.substr(value.size() - suffix.size()) == suffix;
}

// name 이 key 와 같거나 ".key" 로 끝나는지 (둘 다 소문자 가정)
bool dotted_match(std::string_view name, std::string_view key) {
    if (name == key) {
        return true;
    }
    if (name.size() <= key.size()) {
        return false;
    }
    return ends_with(name, key) && name[name.size() - key.size() - 1] == '.';
}

bool is_word_token(const SqlToken& token) {
    return token.kind == TokenKind::kWord || token.kind == TokenKind::kQuotedIdentifier;
}

std::string log_prefix(std::string_view sql) {
    return std::string(sql.substr(0, kLogSqlPrefixLen));
}

// 주석 본문에서 영숫자/밑줄 단어 단위로 변경 동사를 찾는다.
bool comment_has_mutating_word(std::string_view body) {
    std::size_t i = 0;
    while (i < body.size()) {
        const auto c = static_cast<unsigned char>(body[i]);
        if (std::isalnum(c) == 0 && c != '_') {
            ++i;
            continue;
        }
        const std::size_t begin = i;
        while (i < body.size() &&
               (std::isalnum(static_cast<unsigned char>(body[i])) != 0 || body[i] == '_')) {
            ++i;
        }
        if (contains(kMutatingVerbs, to_upper_ascii(body.substr(begin, i - begin)))) {
            return true;
        }
    }
    return false;
}

// tokens[open] 의 '(' 가 tokens[close] 의 ')' 로 닫히는지
bool encloses(const std::vector<SqlToken>& tokens, std::size_t open, std::size_t close) {
    for (std::size_t i = open + 1; i < close; ++i) {
        if (tokens[i].depth <= tokens[open].depth) {
            return false;
        }
    }
    return true;
}

// 서브쿼리 최대 중첩 깊이.
// SELECT/WITH 로 시작하는 괄호만 센다. "AS (" 로 열리는 CTE 본문과
// 쿼리 전체를 감싸는 선두 괄호는 제외한다.
std::uint32_t max_subquery_depth(const std::vector<SqlToken>& tokens, std::size_t first_keyword) {
    std::vector<bool> opens_subquery;
    std::uint32_t current = 0;
    std::uint32_t max_depth = 0;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (tok.kind == TokenKind::kOpenParen) {
            bool subquery = false;
            if (i >= first_keyword && i + 1 < tokens.size()) {
                const auto& next = tokens[i + 1];
                const bool cte_body = i > 0 && is_keyword(tokens[i - 1], "AS");
                subquery = !cte_body && (is_keyword(next, "SELECT") || is_keyword(next, "WITH"));
            }
            opens_subquery.push_back(subquery);
            if (subquery) {
                ++current;
                max_depth = std::max(max_depth, current);
            }
        } else if (tok.kind == TokenKind::kCloseParen && !opens_subquery.empty()) {
            if (opens_subquery.back()) {
                --current;
            }
            opens_subquery.pop_back();
        }
    }
    return max_depth;
}

// 메인 SELECT 의 테이블 참조 (이름은 소문자, 따옴표 제거)
struct TableRef {
    std::string name;
    std::string alias;
};

// idx 위치의 테이블 참조를 읽고, 참조 다음 토큰 위치를 반환한다.
// depth 는 메인 SELECT 블록의 깊이.
std::size_t read_table_ref(const std::vector<SqlToken>& tokens,
                           std::size_t idx,
                           std::size_t end,
                           std::uint32_t depth,
                           std::vector<TableRef>& out) {
    if (idx >= end || !is_word_token(tokens[idx])) {
        return idx;  // 서브쿼리 또는 테이블 함수는 대상 아님
    }

    TableRef ref;
    ref.name = to_lower_ascii(tokens[idx].text);
    ++idx;

    if (idx < end && is_keyword(tokens[idx], "AS")) {
        ++idx;
        if (idx < end && is_word_token(tokens[idx])) {
            ref.alias = tokens[idx].text;
            ++idx;
        }
    } else if (idx < end && is_word_token(tokens[idx]) && tokens[idx].depth == depth &&
               (tokens[idx].kind == TokenKind::kQuotedIdentifier ||
                !contains(kNonAliasWords, tokens[idx].upper))) {
        ref.alias = tokens[idx].text;
        ++idx;
    }

    out.push_back(std::move(ref));
    return idx;
}

}  // namespace

// ---------------------------------------------------------------------------
// 생성자
// ---------------------------------------------------------------------------
SafetyAnalyzer::SafetyAnalyzer(SafetyLimits limits)
    : limits_(std::move(limits)) {
    if (limits_.default_limit == 0) {
        throw std::invalid_argument("SafetyAnalyzer: default_limit must be greater than 0");
    }

    // 파티션 테이블 키는 소문자로 정규화 (비교 시 대소문자 무시)
    std::map<std::string, std::string> normalized;
    for (const auto& [table, column] : limits_.partitioned_tables) {
        normalized.emplace(to_lower_ascii(table), to_lower_ascii(column));
    }
    limits_.partitioned_tables = std::move(normalized);
}

// ---------------------------------------------------------------------------
// evaluate
// ---------------------------------------------------------------------------
SqlVerdict SafetyAnalyzer::evaluate(std::string_view sql) const {
    SqlVerdict verdict{};

    const auto reject = [&](std::string reason) {
        spdlog::warn("safety_analyzer: rejected reason='{}' sql_prefix='{}'",
                     reason, log_prefix(sql));
        verdict.allowed = false;
        verdict.reasons.push_back(std::move(reason));
        return verdict;
    };

    const ScanResult scan = scanner_.scan(sql);
    const auto& tokens = scan.tokens;

    // 0. 입력 형태
    if (tokens.empty()) {
        return reject("empty SQL");
    }
    if (scan.unterminated) {
        return reject("malformed SQL: unterminated string, identifier or comment");
    }
    if (scan.unbalanced) {
        return reject("malformed SQL: unbalanced parentheses");
    }

    // 1. 멀티 스테이트먼트: 세미콜론 뒤에 토큰이 더 있으면 차단
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind == TokenKind::kSemicolon && i + 1 < tokens.size()) {
            return reject("multiple statements not allowed");
        }
    }

    // 2. DDL/DML
    std::size_t first_keyword = 0;
    while (first_keyword < tokens.size() &&
           tokens[first_keyword].kind == TokenKind::kOpenParen) {
        ++first_keyword;
    }
    const SqlToken* leading = first_keyword < tokens.size() ? &tokens[first_keyword] : nullptr;

    for (const auto& tok : tokens) {
        if (tok.kind == TokenKind::kWord && contains(kMutatingVerbs, tok.upper)) {
            return reject("mutating statement not allowed: " + tok.upper);
        }
    }
    if (leading == nullptr || !(is_keyword(*leading, "SELECT") || is_keyword(*leading, "WITH"))) {
        return reject("only SELECT queries are allowed");
    }

    // 3. 주석 내 위험 키워드
    for (const auto& comment : scan.comments) {
        if (comment_has_mutating_word(comment.body)) {
            return reject("dangerous SQL found in comments");
        }
    }

    // 선두 토큰이 SELECT/WITH 이므로 후행 세미콜론을 빼도 코드 토큰이 남는다
    std::size_t last = tokens.size() - 1;
    if (tokens[last].kind == TokenKind::kSemicolon) {
        --last;
    }
    const std::size_t end_idx = last + 1;  // 코드 토큰 구간 [0, end_idx)

    // 쿼리 전체를 감싸는 괄호 겹수 = 최상위 깊이
    std::size_t wrap = 0;
    while (2 * wrap < last && tokens[wrap].kind == TokenKind::kOpenParen &&
           tokens[last - wrap].kind == TokenKind::kCloseParen &&
           encloses(tokens, wrap, last - wrap)) {
        ++wrap;
    }
    const auto top = static_cast<std::uint32_t>(wrap);

    // 4. 최상위 JOIN 수
    const auto join_count = static_cast<std::uint32_t>(
        std::count_if(tokens.begin(), tokens.end(), [top](const SqlToken& t) {
            return t.depth == top && is_keyword(t, "JOIN");
        }));
    if (join_count > limits_.max_join_depth) {
        return reject("join depth exceeds max (" + std::to_string(limits_.max_join_depth) + ")");
    }

    // 5. 서브쿼리 중첩
    if (max_subquery_depth(tokens, first_keyword) > limits_.max_subquery_depth) {
        return reject("subquery nesting exceeds max (" +
                      std::to_string(limits_.max_subquery_depth) + ")");
    }

    verdict.allowed = true;

    // ---- 재작성 ----------------------------------------------------------
    const std::size_t base_from = tokens.front().offset;
    const std::size_t base_to   = tokens[last].offset + tokens[last].length;
    const std::string original_base(sql.substr(base_from, base_to - base_from));

    // 메인 SELECT
    std::optional<std::size_t> main_select;
    {
        std::vector<bool> cte_parens;  // 열린 괄호별 CTE 본문 여부
        std::size_t open_ctes = 0;
        for (std::size_t i = 0; i < end_idx; ++i) {
            const auto& tok = tokens[i];
            if (tok.kind == TokenKind::kOpenParen) {
                const bool cte_body = i > 0 && is_keyword(tokens[i - 1], "AS");
                cte_parens.push_back(cte_body);
                open_ctes += cte_body ? 1 : 0;
            } else if (tok.kind == TokenKind::kCloseParen && !cte_parens.empty()) {
                open_ctes -= cte_parens.back() ? 1 : 0;
                cte_parens.pop_back();
            } else if (open_ctes == 0 && is_keyword(tok, "SELECT") &&
                       (!main_select || tok.depth < tokens[*main_select].depth)) {
                main_select = i;
            }
        }
    }
    if (!main_select) {
        return verdict;
    }
    const std::uint32_t block_depth = tokens[*main_select].depth;

    // 메인 SELECT 블록 끝: 블록을 닫는 괄호 또는 같은 깊이의 첫 집합 연산자
    std::size_t block_end = end_idx;
    for (std::size_t i = *main_select + 1; i < end_idx; ++i) {
        if (tokens[i].depth < block_depth ||
            (tokens[i].depth == block_depth && tokens[i].kind == TokenKind::kWord &&
             contains(kSetOperators, tokens[i].upper))) {
            block_end = i;
            break;
        }
    }

    std::optional<std::size_t> from_idx;
    for (std::size_t i = *main_select + 1; i < block_end; ++i) {
        if (tokens[i].depth == block_depth && is_keyword(tokens[i], "FROM")) {
            from_idx = i;
            break;
        }
    }

    // 6. LIMIT 필요 여부
    //    문장 수준의 LIMIT 또는 FETCH FIRST/NEXT 가 있으면 행 수가 이미 제한된다
    bool has_limit = false;
    bool has_group_by = false;
    for (std::size_t i = 0; i < end_idx; ++i) {
        const bool statement_level = tokens[i].depth == top;
        const bool in_block = i > *main_select && i < block_end && tokens[i].depth == block_depth;
        if (statement_level && (is_keyword(tokens[i], "LIMIT") || is_keyword(tokens[i], "FETCH"))) {
            has_limit = true;
        }
        if ((statement_level || in_block) && is_keyword(tokens[i], "GROUP") &&
            i + 1 < end_idx && is_keyword(tokens[i + 1], "BY")) {
            has_group_by = true;
        }
    }
    bool has_aggregate = false;
    const std::size_t projection_end = from_idx.value_or(block_end);
    for (std::size_t i = *main_select + 1; i < projection_end; ++i) {
        if (tokens[i].kind == TokenKind::kWord && contains(kAggregateFunctions, tokens[i].upper) &&
            i + 1 < end_idx && tokens[i + 1].kind == TokenKind::kOpenParen) {
            has_aggregate = true;
            break;
        }
    }
    const bool add_limit = !has_limit && !has_group_by && !has_aggregate;

    // 7. 파티션 필터
    std::vector<std::string> filters;
    std::vector<std::string> filter_columns;
    std::optional<std::size_t> where_idx;
    std::size_t where_end = block_end;
    std::optional<std::size_t> insert_before;

    if (from_idx && !limits_.partitioned_tables.empty()) {
        std::vector<TableRef> refs;

        // 절 종결 위치와 WHERE 위치
        for (std::size_t i = *from_idx + 1; i < block_end; ++i) {
            if (tokens[i].depth != block_depth || tokens[i].kind != TokenKind::kWord) {
                continue;
            }
            if (!where_idx && tokens[i].upper == "WHERE") {
                where_idx = i;
            } else if (contains(kClauseTerminators, tokens[i].upper)) {
                insert_before = i;
                break;
            }
        }
        const std::size_t refs_end = where_idx.value_or(insert_before.value_or(block_end));
        if (insert_before) {
            where_end = *insert_before;
        }

        // FROM a [AS x], b y ... JOIN c z ...
        std::size_t i = read_table_ref(tokens, *from_idx + 1, refs_end, block_depth, refs);
        while (i < refs_end && tokens[i].kind == TokenKind::kComma &&
               tokens[i].depth == block_depth) {
            i = read_table_ref(tokens, i + 1, refs_end, block_depth, refs);
        }
        for (std::size_t j = i; j < refs_end; ++j) {
            if (tokens[j].depth == block_depth && is_keyword(tokens[j], "JOIN")) {
                read_table_ref(tokens, j + 1, refs_end, block_depth, refs);
            }
        }

        for (const auto& ref : refs) {
            const std::string* column = nullptr;
            for (const auto& [table, col] : limits_.partitioned_tables) {
                if (dotted_match(ref.name, table)) {
                    column = &col;
                    break;
                }
            }
            if (column == nullptr) {
                continue;
            }

            bool bounded = false;
            if (where_idx) {
                for (std::size_t k = *where_idx + 1; k < where_end; ++k) {
                    if (!is_word_token(tokens[k])) {
                        continue;
                    }
                    const std::string name = to_lower_ascii(tokens[k].text);
                    if (dotted_match(name, *column)) {
                        bounded = true;
                        break;
                    }
                }
            }
            if (bounded) {
                continue;
            }

            const std::string qualified = ref.alias.empty() ? *column : ref.alias + "." + *column;
            std::string filter = qualified + " >= DATE_SUB(CURRENT_DATE(), INTERVAL " +
                                 std::to_string(limits_.partition_lookback_days) + " DAY)";
            if (std::find(filters.begin(), filters.end(), filter) == filters.end()) {
                filters.push_back(std::move(filter));
            }
            if (std::find(filter_columns.begin(), filter_columns.end(), *column) ==
                filter_columns.end()) {
                filter_columns.push_back(*column);
            }
        }
    }

    // 앞뒤 주석/세미콜론 제거만으로는 재작성으로 보지 않는다
    if (!add_limit && filters.empty()) {
        return verdict;
    }

    // 원문 구간 기준 상대 오프셋으로 텍스트를 조립한다
    const auto rel = [&](std::size_t absolute) { return absolute - base_from; };
    std::string rewritten = original_base;

    if (!filters.empty()) {
        std::string combined;
        for (const auto& f : filters) {
            if (!combined.empty()) {
                combined += " AND ";
            }
            combined += f;
        }

        if (where_idx && *where_idx + 1 < where_end) {
            const std::size_t cond_from = rel(tokens[*where_idx + 1].offset);
            const std::size_t cond_to =
                rel(tokens[where_end - 1].offset + tokens[where_end - 1].length);
            const std::string condition = original_base.substr(cond_from, cond_to - cond_from);
            rewritten = original_base.substr(0, cond_from) + "(" + condition + ") AND " +
                        combined + original_base.substr(cond_to);
        } else if (where_idx) {
            const std::size_t at =
                rel(tokens[*where_idx].offset + tokens[*where_idx].length);
            rewritten = original_base.substr(0, at) + " " + combined + original_base.substr(at);
        } else if (insert_before) {
            const std::size_t at = rel(tokens[*insert_before].offset);
            rewritten = original_base.substr(0, at) + "WHERE " + combined + " " +
                        original_base.substr(at);
        } else if (block_end < end_idx) {
            // 블록을 닫는 괄호나 집합 연산자 앞, 블록 마지막 토큰 바로 뒤
            const std::size_t at =
                rel(tokens[block_end - 1].offset + tokens[block_end - 1].length);
            rewritten = original_base.substr(0, at) + " WHERE " + combined +
                        original_base.substr(at);
        } else {
            rewritten = original_base + " WHERE " + combined;
        }
    }

    if (add_limit) {
        rewritten += " LIMIT " + std::to_string(limits_.default_limit);
        verdict.reasons.emplace_back("LIMIT auto-added");
    }
    for (const auto& col : filter_columns) {
        verdict.reasons.push_back("partition filter auto-added on " + col);
    }

    spdlog::debug("safety_analyzer: rewritten sql_prefix='{}'", log_prefix(rewritten));
    verdict.rewritten_sql = std::move(rewritten);
    return verdict;
}
