// ---------------------------------------------------------------------------
// test_budget_ledger.cpp
//
// BudgetLedger / InMemoryUsageStore 단위 테스트.
//
// [테스트 범위]
// - 예산 이내 / 초과 판정과 잔여량 계산
// - record 후 윈도우 사용량 반영, 3600초 경과 후 만료
// - 테넌트별 예산 오버라이드
// - 음수 추정치/사용량 보정
// - int64 경계 추정치/사용량 포화 (오버플로 없이 거부)
// - 생성자 인자 검증
// - 동시 record 합계 정확성
//
// 시간은 수동 시계(ManualClock)로 제어한다.
// ---------------------------------------------------------------------------

#include "budget/budget_ledger.hpp"
#include "budget/usage_store.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

constexpr std::int64_t kBudget = 1024 * 1024;

// ---------------------------------------------------------------------------
// 헬퍼: 테스트에서 앞으로 감을 수 있는 시계
// ---------------------------------------------------------------------------
struct ManualClock {
    std::shared_ptr<std::chrono::system_clock::time_point> now =
        std::make_shared<std::chrono::system_clock::time_point>(std::chrono::seconds{1'700'000'000});

    TimeSource source() const {
        auto current = now;
        return [current] { return *current; };
    }

    void advance(std::chrono::seconds delta) { *now += delta; }
};

BudgetLimits small_limits() {
    BudgetLimits limits;
    limits.hourly_budget_bytes = kBudget;
    return limits;
}

}  // namespace

// ---------------------------------------------------------------------------
// 기본 판정
// ---------------------------------------------------------------------------

TEST(BudgetLedger, FreshTenantIsWithinBudget) {
    ManualClock clock;
    BudgetLedger ledger(std::make_shared<InMemoryUsageStore>(), small_limits(), clock.source());

    const auto status = ledger.check("tenant-a", 4096);
    EXPECT_TRUE(status.allowed);
    EXPECT_EQ(status.budget, kBudget);
    EXPECT_EQ(status.bytes_used, 4096) << "허용 시 bytes_used 는 추정치를 포함";
    EXPECT_EQ(status.bytes_remaining, kBudget - 4096);
    EXPECT_FALSE(status.suggestion.has_value());
}

TEST(BudgetLedger, ExceedingBudgetIsDenied) {
    ManualClock clock;
    BudgetLedger ledger(std::make_shared<InMemoryUsageStore>(), small_limits(), clock.source());

    ledger.record("tenant-a", kBudget - 1024);
    const auto status = ledger.check("tenant-a", 2048);

    EXPECT_FALSE(status.allowed);
    EXPECT_EQ(status.bytes_used, kBudget - 1024);
    EXPECT_LE(status.bytes_remaining, 1024);
    ASSERT_TRUE(status.suggestion.has_value());
    EXPECT_EQ(*status.suggestion, "Try sampling or a narrower time window");
}

TEST(BudgetLedger, ExactBudgetIsAllowed) {
    ManualClock clock;
    BudgetLedger ledger(std::make_shared<InMemoryUsageStore>(), small_limits(), clock.source());

    ledger.record("tenant-a", kBudget - 100);
    const auto status = ledger.check("tenant-a", 100);
    EXPECT_TRUE(status.allowed) << "used + estimate == budget 는 허용";
    EXPECT_EQ(status.bytes_remaining, 0);
}

TEST(BudgetLedger, AllowedStatusAddsUpToBudget) {
    ManualClock clock;
    BudgetLedger ledger(std::make_shared<InMemoryUsageStore>(), small_limits(), clock.source());

    ledger.record("tenant-a", 1000);
    const std::vector<std::int64_t> estimates{0, 1, 5000, kBudget - 1000};
    for (const std::int64_t estimate : estimates) {
        const auto status = ledger.check("tenant-a", estimate);
        ASSERT_TRUE(status.allowed) << "estimate=" << estimate;
        EXPECT_EQ(status.bytes_used + status.bytes_remaining, status.budget)
            << "estimate=" << estimate;
    }
}

// ---------------------------------------------------------------------------
// 롤링 윈도우
// ---------------------------------------------------------------------------

TEST(BudgetLedger, RecordedUsageIsCounted) {
    ManualClock clock;
    BudgetLedger ledger(std::make_shared<InMemoryUsageStore>(), small_limits(), clock.source());

    ledger.record("tenant-a", 300);
    clock.advance(std::chrono::seconds{10});
    ledger.record("tenant-a", 200);

    EXPECT_EQ(ledger.usage("tenant-a"), 500);
    EXPECT_EQ(ledger.check("tenant-a", 0).bytes_used, 500);
}

TEST(BudgetLedger, UsageExpiresAfterWindow) {
    ManualClock clock;
    auto store = std::make_shared<InMemoryUsageStore>();
    BudgetLedger ledger(store, small_limits(), clock.source());

    ledger.record("tenant-a", kBudget);
    EXPECT_FALSE(ledger.check("tenant-a", 1).allowed);

    clock.advance(std::chrono::seconds{3601});
    const auto status = ledger.check("tenant-a", 1);
    EXPECT_TRUE(status.allowed) << "3600초가 지난 사용량은 만료되어야 함";
    EXPECT_EQ(status.bytes_used, 1);
    EXPECT_EQ(store->event_count("tenant-a"), 0u) << "만료 이벤트는 정리되어야 함";
}

TEST(BudgetLedger, TenantsAreIsolated) {
    ManualClock clock;
    BudgetLedger ledger(std::make_shared<InMemoryUsageStore>(), small_limits(), clock.source());

    ledger.record("tenant-a", kBudget);
    EXPECT_FALSE(ledger.check("tenant-a", 1).allowed);
    EXPECT_TRUE(ledger.check("tenant-b", 1).allowed);
    EXPECT_EQ(ledger.usage("tenant-b"), 0);
}

// ---------------------------------------------------------------------------
// 테넌트 오버라이드
// ---------------------------------------------------------------------------

TEST(BudgetLedger, TenantOverrideIsApplied) {
    ManualClock clock;
    BudgetLimits limits = small_limits();
    limits.tenant_budgets["trial"] = 1000;
    BudgetLedger ledger(std::make_shared<InMemoryUsageStore>(), limits, clock.source());

    EXPECT_EQ(ledger.budget_for("trial"), 1000);
    EXPECT_EQ(ledger.budget_for("other"), kBudget);

    const auto status = ledger.check("trial", 1001);
    EXPECT_FALSE(status.allowed);
    EXPECT_EQ(status.budget, 1000);
    EXPECT_EQ(status.bytes_remaining, 1000);
}

// ---------------------------------------------------------------------------
// 입력 보정 / 검증
// ---------------------------------------------------------------------------

TEST(BudgetLedger, NegativeValuesAreClampedToZero) {
    ManualClock clock;
    BudgetLedger ledger(std::make_shared<InMemoryUsageStore>(), small_limits(), clock.source());

    ledger.record("tenant-a", -500);
    EXPECT_EQ(ledger.usage("tenant-a"), 0);

    const auto status = ledger.check("tenant-a", -10);
    EXPECT_TRUE(status.allowed);
    EXPECT_EQ(status.bytes_used, 0);
    EXPECT_EQ(status.bytes_remaining, kBudget);
}

TEST(BudgetLedger, HugeEstimateIsDeniedWithoutOverflow) {
    ManualClock clock;
    BudgetLedger ledger(std::make_shared<InMemoryUsageStore>(), small_limits(), clock.source());

    ledger.record("tenant-a", 1024);
    const auto status = ledger.check("tenant-a", std::numeric_limits<std::int64_t>::max());

    EXPECT_FALSE(status.allowed);
    EXPECT_EQ(status.bytes_used, 1024);
    EXPECT_EQ(status.bytes_remaining, kBudget - 1024);
    EXPECT_GE(status.bytes_remaining, 0);
}

TEST(BudgetLedger, HugeRecordedUsageSaturates) {
    ManualClock clock;
    BudgetLedger ledger(std::make_shared<InMemoryUsageStore>(), small_limits(), clock.source());

    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    ledger.record("tenant-a", kMax);
    ledger.record("tenant-a", kMax);
    EXPECT_EQ(ledger.usage("tenant-a"), kMax) << "합계가 int64 범위를 넘으면 상한으로 포화";

    const auto status = ledger.check("tenant-a", 0);
    EXPECT_FALSE(status.allowed);
    EXPECT_EQ(status.bytes_used, kMax);
    EXPECT_EQ(status.bytes_remaining, 0);
}

TEST(BudgetLedger, InvalidConstructionThrows) {
    EXPECT_THROW(BudgetLedger(nullptr, small_limits()), std::invalid_argument);

    BudgetLimits zero;
    zero.hourly_budget_bytes = 0;
    EXPECT_THROW(BudgetLedger(std::make_shared<InMemoryUsageStore>(), zero), std::invalid_argument);

    BudgetLimits bad_tenant = small_limits();
    bad_tenant.tenant_budgets["x"] = -1;
    EXPECT_THROW(BudgetLedger(std::make_shared<InMemoryUsageStore>(), bad_tenant),
                 std::invalid_argument);
}

// ---------------------------------------------------------------------------
// 동시성
// ---------------------------------------------------------------------------

TEST(BudgetLedger, ConcurrentRecordsAreSummed) {
    ManualClock clock;
    BudgetLedger ledger(std::make_shared<InMemoryUsageStore>(), small_limits(), clock.source());

    constexpr int kThreads = 8;
    constexpr int kPerThread = 100;
    std::vector<std::thread> workers;
    workers.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&ledger] {
            for (int i = 0; i < kPerThread; ++i) {
                ledger.record("tenant-a", 10);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(ledger.usage("tenant-a"), kThreads * kPerThread * 10);
}

// ---------------------------------------------------------------------------
// InMemoryUsageStore
// ---------------------------------------------------------------------------

TEST(InMemoryUsageStore, PruneRemovesOlderEvents) {
    InMemoryUsageStore store;
    store.append(UsageEvent{"t", 10.0, 1.0});
    store.append(UsageEvent{"t", 20.0, 2.0});
    store.append(UsageEvent{"t", 30.0, 4.0});

    EXPECT_EQ(store.prune("t", 20.0), 1u) << "timestamp < older_than 만 제거";
    EXPECT_DOUBLE_EQ(store.sum("t", 0.0, 100.0), 6.0);
    EXPECT_DOUBLE_EQ(store.sum("t", 25.0, 30.0), 4.0);
    EXPECT_EQ(store.prune("unknown", 100.0), 0u);
}
