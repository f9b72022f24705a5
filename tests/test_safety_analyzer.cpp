// ---------------------------------------------------------------------------
// test_safety_analyzer.cpp
//
// SafetyAnalyzer 단위 테스트.
//
// [테스트 범위]
// - 입력 형태 차단 (빈 입력, 닫히지 않은 리터럴, 괄호 불일치)
// - 멀티 스테이트먼트 차단 / 문자열 안 세미콜론 허용
// - DDL/DML 차단, SELECT/WITH 이외 구문 차단
// - 주석 내 위험 키워드 차단
// - JOIN 수 / 서브쿼리 중첩 한도
// - LIMIT 자동 추가 (집계/GROUP BY/기존 LIMIT/FETCH FIRST 제외)
// - 파티션 테이블 기간 필터 자동 추가 (별칭, 기존 WHERE, GROUP BY 앞 삽입)
// - 괄호로 감싼 쿼리와 집합 연산 피연산자 재작성
//
// [오탐/미탐 주의사항]
// - SELECT ... FOR UPDATE 는 변경 동사 UPDATE 로 차단된다 (보수적).
// - 주석의 설명 문구에 DROP 등이 있으면 정상 쿼리도 차단된다.
// ---------------------------------------------------------------------------

#include "parser/safety_analyzer.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace {

const std::string kEventsFilter = "created_at >= DATE_SUB(CURRENT_DATE(), INTERVAL 30 DAY)";

bool has_reason(const SqlVerdict& verdict, const std::string& reason) {
    for (const auto& r : verdict.reasons) {
        if (r == reason) {
            return true;
        }
    }
    return false;
}

}  // namespace

// ---------------------------------------------------------------------------
// 입력 형태
// ---------------------------------------------------------------------------

TEST(SafetyAnalyzer, EmptyInputIsRejected) {
    const SafetyAnalyzer analyzer;
    for (const char* sql : {"", "   \n\t", "-- only a comment"}) {
        const auto verdict = analyzer.evaluate(sql);
        EXPECT_FALSE(verdict.allowed) << "sql='" << sql << "'";
        EXPECT_TRUE(has_reason(verdict, "empty SQL")) << "sql='" << sql << "'";
    }
}

TEST(SafetyAnalyzer, UnterminatedLiteralIsRejected) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT 'abc FROM users");
    EXPECT_FALSE(verdict.allowed);
    EXPECT_TRUE(has_reason(verdict, "malformed SQL: unterminated string, identifier or comment"));
}

TEST(SafetyAnalyzer, UnbalancedParenthesesAreRejected) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT (1 FROM users");
    EXPECT_FALSE(verdict.allowed);
    EXPECT_TRUE(has_reason(verdict, "malformed SQL: unbalanced parentheses"));
}

// ---------------------------------------------------------------------------
// 멀티 스테이트먼트
// ---------------------------------------------------------------------------

TEST(SafetyAnalyzer, MultipleStatementsAreRejected) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT 1; DROP TABLE users");
    EXPECT_FALSE(verdict.allowed);
    ASSERT_EQ(verdict.reasons.size(), 1u);
    EXPECT_EQ(verdict.reasons[0], "multiple statements not allowed");
    EXPECT_FALSE(verdict.rewritten_sql.has_value()) << "거부 시 재작성 결과는 없어야 함";
}

TEST(SafetyAnalyzer, SemicolonInsideStringIsAllowed) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT 'a;b' AS v FROM users LIMIT 1");
    EXPECT_TRUE(verdict.allowed);
    EXPECT_TRUE(verdict.reasons.empty());
    EXPECT_FALSE(verdict.rewritten_sql.has_value());
}

TEST(SafetyAnalyzer, SingleTrailingSemicolonIsDropped) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT id FROM users;");
    ASSERT_TRUE(verdict.allowed);
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    EXPECT_EQ(*verdict.rewritten_sql, "SELECT id FROM users LIMIT 10000");
}

// ---------------------------------------------------------------------------
// DDL / DML
// ---------------------------------------------------------------------------

TEST(SafetyAnalyzer, DdlIsRejected) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("DROP TABLE users");
    EXPECT_FALSE(verdict.allowed);
    EXPECT_TRUE(has_reason(verdict, "mutating statement not allowed: DROP"));
}

TEST(SafetyAnalyzer, DmlIsRejectedCaseInsensitive) {
    const SafetyAnalyzer analyzer;
    EXPECT_TRUE(has_reason(analyzer.evaluate("delete from users where id = 1"),
                           "mutating statement not allowed: DELETE"));
    EXPECT_TRUE(has_reason(analyzer.evaluate("Insert Into t VALUES (1)"),
                           "mutating statement not allowed: INSERT"));
}

TEST(SafetyAnalyzer, SelectForUpdateIsRejected) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT * FROM users FOR UPDATE");
    EXPECT_FALSE(verdict.allowed);
    EXPECT_TRUE(has_reason(verdict, "mutating statement not allowed: UPDATE"));
}

TEST(SafetyAnalyzer, NonSelectStatementIsRejected) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SHOW TABLES");
    EXPECT_FALSE(verdict.allowed);
    EXPECT_TRUE(has_reason(verdict, "only SELECT queries are allowed"));
}

TEST(SafetyAnalyzer, VerbInsideStringIsNotMutation) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT id FROM users WHERE note = 'drop table' LIMIT 5");
    EXPECT_TRUE(verdict.allowed);
}

// ---------------------------------------------------------------------------
// 주석
// ---------------------------------------------------------------------------

TEST(SafetyAnalyzer, DangerousCommentIsRejected) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT 1 /* DROP TABLE x */");
    EXPECT_FALSE(verdict.allowed);
    EXPECT_TRUE(has_reason(verdict, "dangerous SQL found in comments"));
}

TEST(SafetyAnalyzer, HarmlessCommentIsAllowed) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT id FROM users -- daily report\nLIMIT 10");
    EXPECT_TRUE(verdict.allowed);
    EXPECT_FALSE(verdict.rewritten_sql.has_value());
}

TEST(SafetyAnalyzer, CommentWordMatchIsWholeWord) {
    const SafetyAnalyzer analyzer;
    // "dropdown" / "updated_at" 은 변경 동사가 아니다
    const auto verdict = analyzer.evaluate("SELECT 1 AS x /* dropdown updated_at */ LIMIT 1");
    EXPECT_TRUE(verdict.allowed);
}

// ---------------------------------------------------------------------------
// JOIN / 서브쿼리 한도
// ---------------------------------------------------------------------------

TEST(SafetyAnalyzer, JoinDepthLimit) {
    SafetyLimits limits;
    limits.max_join_depth = 2;
    const SafetyAnalyzer analyzer(limits);

    const auto verdict = analyzer.evaluate(
        "SELECT * FROM a JOIN b ON a.id = b.id JOIN c ON b.id = c.id JOIN d ON c.id = d.id");
    EXPECT_FALSE(verdict.allowed);
    EXPECT_TRUE(has_reason(verdict, "join depth exceeds max (2)"));

    const auto ok = analyzer.evaluate("SELECT * FROM a JOIN b ON a.id = b.id LIMIT 1");
    EXPECT_TRUE(ok.allowed);
}

TEST(SafetyAnalyzer, SubqueryDepthLimit) {
    SafetyLimits limits;
    limits.max_subquery_depth = 1;
    const SafetyAnalyzer analyzer(limits);

    const auto verdict = analyzer.evaluate("SELECT * FROM (SELECT * FROM (SELECT 1) t1) t2");
    EXPECT_FALSE(verdict.allowed);
    EXPECT_TRUE(has_reason(verdict, "subquery nesting exceeds max (1)"));

    const auto ok = analyzer.evaluate("SELECT * FROM (SELECT 1) t1 LIMIT 1");
    EXPECT_TRUE(ok.allowed);
}

TEST(SafetyAnalyzer, CteBodyIsNotCountedAsSubquery) {
    SafetyLimits limits;
    limits.max_subquery_depth = 0;
    const SafetyAnalyzer analyzer(limits);

    const auto verdict = analyzer.evaluate("WITH t AS (SELECT id FROM users) SELECT id FROM t");
    ASSERT_TRUE(verdict.allowed);
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    EXPECT_EQ(*verdict.rewritten_sql, "WITH t AS (SELECT id FROM users) SELECT id FROM t LIMIT 10000");
}

// ---------------------------------------------------------------------------
// LIMIT 자동 추가
// ---------------------------------------------------------------------------

TEST(SafetyAnalyzer, LimitIsAddedToPlainSelect) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT id FROM users");
    ASSERT_TRUE(verdict.allowed);
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    EXPECT_EQ(*verdict.rewritten_sql, "SELECT id FROM users LIMIT 10000");
    ASSERT_EQ(verdict.reasons.size(), 1u);
    EXPECT_EQ(verdict.reasons[0], "LIMIT auto-added");
}

TEST(SafetyAnalyzer, LimitUsesConfiguredDefault) {
    SafetyLimits limits;
    limits.default_limit = 50;
    const SafetyAnalyzer analyzer(limits);
    const auto verdict = analyzer.evaluate("SELECT id FROM users");
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    EXPECT_EQ(*verdict.rewritten_sql, "SELECT id FROM users LIMIT 50");
}

TEST(SafetyAnalyzer, ExistingLimitIsKept) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT id FROM users LIMIT 5");
    EXPECT_TRUE(verdict.allowed);
    EXPECT_FALSE(verdict.rewritten_sql.has_value());
}

TEST(SafetyAnalyzer, AggregateQueryGetsNoLimit) {
    const SafetyAnalyzer analyzer;
    const auto count = analyzer.evaluate("SELECT COUNT(*) FROM users");
    EXPECT_TRUE(count.allowed);
    EXPECT_FALSE(count.rewritten_sql.has_value());

    const auto grouped = analyzer.evaluate("SELECT kind, COUNT(*) FROM users GROUP BY kind");
    EXPECT_TRUE(grouped.allowed);
    EXPECT_FALSE(grouped.rewritten_sql.has_value());
}

TEST(SafetyAnalyzer, InvalidDefaultLimitThrows) {
    SafetyLimits limits;
    limits.default_limit = 0;
    EXPECT_THROW(SafetyAnalyzer{limits}, std::invalid_argument);
}

// ---------------------------------------------------------------------------
// 파티션 필터 자동 추가
// ---------------------------------------------------------------------------

TEST(SafetyAnalyzer, PartitionFilterIsAdded) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT * FROM analytics.events");
    ASSERT_TRUE(verdict.allowed);
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    EXPECT_EQ(*verdict.rewritten_sql,
              "SELECT * FROM analytics.events WHERE " + kEventsFilter + " LIMIT 10000");
    ASSERT_EQ(verdict.reasons.size(), 2u);
    EXPECT_EQ(verdict.reasons[0], "LIMIT auto-added");
    EXPECT_EQ(verdict.reasons[1], "partition filter auto-added on created_at");
}

TEST(SafetyAnalyzer, PartitionFilterIsAndedWithExistingWhere) {
    const SafetyAnalyzer analyzer;
    const auto verdict =
        analyzer.evaluate("SELECT e.id FROM analytics.events e WHERE e.kind = 'click' LIMIT 5");
    ASSERT_TRUE(verdict.allowed);
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    EXPECT_EQ(*verdict.rewritten_sql,
              "SELECT e.id FROM analytics.events e WHERE (e.kind = 'click') AND e." + kEventsFilter +
                  " LIMIT 5");
    ASSERT_EQ(verdict.reasons.size(), 1u);
    EXPECT_EQ(verdict.reasons[0], "partition filter auto-added on created_at");
}

TEST(SafetyAnalyzer, PartitionFilterIsInsertedBeforeGroupBy) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("SELECT kind FROM analytics.events GROUP BY kind");
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    EXPECT_EQ(*verdict.rewritten_sql,
              "SELECT kind FROM analytics.events WHERE " + kEventsFilter + " GROUP BY kind");
}

TEST(SafetyAnalyzer, BoundedPartitionColumnIsLeftAlone) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate(
        "SELECT id FROM analytics.events WHERE created_at > '2024-01-01' LIMIT 10");
    EXPECT_TRUE(verdict.allowed);
    EXPECT_TRUE(verdict.reasons.empty());
    EXPECT_FALSE(verdict.rewritten_sql.has_value());
}

TEST(SafetyAnalyzer, JoinedPartitionTablesEachGetFilter) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate(
        "SELECT * FROM analytics.events e JOIN analytics.orders o ON e.id = o.event_id");
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    const std::string& sql = *verdict.rewritten_sql;
    EXPECT_NE(sql.find("WHERE e." + kEventsFilter + " AND o." + kEventsFilter), std::string::npos)
        << sql;
    // 같은 컬럼이면 안내 문구는 한 번만
    EXPECT_EQ(verdict.reasons.size(), 2u);
}

TEST(SafetyAnalyzer, CustomPartitionMappingIsCaseInsensitive) {
    SafetyLimits limits;
    limits.partitioned_tables = {{"Sales.Orders", "Order_Date"}};
    limits.partition_lookback_days = 7;
    const SafetyAnalyzer analyzer(limits);

    const auto verdict = analyzer.evaluate("SELECT o.id FROM proj.sales.orders o LIMIT 3");
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    EXPECT_EQ(*verdict.rewritten_sql,
              "SELECT o.id FROM proj.sales.orders o WHERE "
              "o.order_date >= DATE_SUB(CURRENT_DATE(), INTERVAL 7 DAY) LIMIT 3");
    ASSERT_EQ(verdict.reasons.size(), 1u);
    EXPECT_EQ(verdict.reasons[0], "partition filter auto-added on order_date");
}

// ---------------------------------------------------------------------------
// 괄호로 감싼 쿼리 / 집합 연산
// ---------------------------------------------------------------------------

TEST(SafetyAnalyzer, WrappedQueryIsStillRewritten) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("(SELECT * FROM analytics.events)");
    ASSERT_TRUE(verdict.allowed);
    ASSERT_TRUE(verdict.rewritten_sql.has_value()) << "괄호 한 쌍으로 재작성을 피할 수 없어야 함";
    EXPECT_EQ(*verdict.rewritten_sql,
              "(SELECT * FROM analytics.events WHERE " + kEventsFilter + ") LIMIT 10000");
    EXPECT_TRUE(has_reason(verdict, "LIMIT auto-added"));
    EXPECT_TRUE(has_reason(verdict, "partition filter auto-added on created_at"));
}

TEST(SafetyAnalyzer, DoublyWrappedQueryGetsLimit) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("((SELECT id FROM users));");
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    EXPECT_EQ(*verdict.rewritten_sql, "((SELECT id FROM users)) LIMIT 10000");
}

TEST(SafetyAnalyzer, WrappedQueryKeepsInnerLimit) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate("(SELECT id FROM users LIMIT 5)");
    EXPECT_TRUE(verdict.allowed);
    EXPECT_FALSE(verdict.rewritten_sql.has_value());
}

TEST(SafetyAnalyzer, WrappedQueryJoinsAreCounted) {
    SafetyLimits limits;
    limits.max_join_depth = 2;
    const SafetyAnalyzer analyzer(limits);

    const auto verdict = analyzer.evaluate(
        "(SELECT * FROM a JOIN b ON a.id = b.id JOIN c ON b.id = c.id JOIN d ON c.id = d.id)");
    EXPECT_FALSE(verdict.allowed);
    EXPECT_TRUE(has_reason(verdict, "join depth exceeds max (2)"));
}

TEST(SafetyAnalyzer, ParenthesizedUnionOperandGetsFilter) {
    const SafetyAnalyzer analyzer;
    const auto verdict = analyzer.evaluate(
        "(SELECT id FROM analytics.events) UNION ALL (SELECT id FROM users)");
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    EXPECT_EQ(*verdict.rewritten_sql,
              "(SELECT id FROM analytics.events WHERE " + kEventsFilter +
                  ") UNION ALL (SELECT id FROM users) LIMIT 10000");
}

TEST(SafetyAnalyzer, UnionFilterStaysInFirstSelect) {
    const SafetyAnalyzer analyzer;
    const auto verdict =
        analyzer.evaluate("SELECT id FROM analytics.events UNION ALL SELECT id FROM users");
    ASSERT_TRUE(verdict.rewritten_sql.has_value());
    EXPECT_EQ(*verdict.rewritten_sql,
              "SELECT id FROM analytics.events WHERE " + kEventsFilter +
                  " UNION ALL SELECT id FROM users LIMIT 10000");
}

// ---------------------------------------------------------------------------
// FETCH FIRST
// ---------------------------------------------------------------------------

TEST(SafetyAnalyzer, FetchFirstCountsAsLimit) {
    const SafetyAnalyzer analyzer;
    const auto fetch = analyzer.evaluate("SELECT id FROM users FETCH FIRST 10 ROWS ONLY");
    EXPECT_TRUE(fetch.allowed);
    EXPECT_FALSE(fetch.rewritten_sql.has_value()) << "LIMIT 을 덧붙이면 잘못된 SQL 이 된다";

    const auto offset_fetch = analyzer.evaluate(
        "SELECT id FROM users ORDER BY id OFFSET 5 ROWS FETCH NEXT 10 ROWS ONLY");
    EXPECT_TRUE(offset_fetch.allowed);
    EXPECT_FALSE(offset_fetch.rewritten_sql.has_value());
}

TEST(SafetyAnalyzer, EvaluateIsDeterministic) {
    const SafetyAnalyzer analyzer;
    const auto first  = analyzer.evaluate("SELECT * FROM analytics.events");
    const auto second = analyzer.evaluate("SELECT * FROM analytics.events");
    EXPECT_EQ(first.allowed, second.allowed);
    EXPECT_EQ(first.reasons, second.reasons);
    EXPECT_EQ(first.rewritten_sql, second.rewritten_sql);
}
