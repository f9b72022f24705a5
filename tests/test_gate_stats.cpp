// ---------------------------------------------------------------------------
// test_gate_stats.cpp
//
// GateStats 단위 테스트.
//
// [테스트 범위]
// - 초기 스냅샷 0
// - 판정/스텝 카운터 누적
// - deny_rate 계산 (0 나누기 방지)
// - 멀티스레드 동시 갱신 시 정확성
// ---------------------------------------------------------------------------

#include "stats/gate_stats.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

TEST(GateStats, InitialSnapshotIsZero) {
    const GateStats stats;
    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_plans, 0u);
    EXPECT_EQ(snap.denied_plans, 0u);
    EXPECT_EQ(snap.steps_executed, 0u);
    EXPECT_DOUBLE_EQ(snap.deny_rate, 0.0) << "total 0 이면 deny_rate 는 0";
}

TEST(GateStats, DecisionCounters) {
    GateStats stats;
    stats.on_decision(true, false);
    stats.on_decision(false, true);
    stats.on_decision(false, false);
    stats.on_decision(true, false);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_plans, 4u);
    EXPECT_EQ(snap.denied_plans, 2u);
    EXPECT_EQ(snap.approvals_required, 1u);
    EXPECT_DOUBLE_EQ(snap.deny_rate, 0.5);
}

TEST(GateStats, StepCounters) {
    GateStats stats;
    stats.on_step(false, 2, false);
    stats.on_step(true, 3, false);
    stats.on_step(false, 0, true);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.steps_executed, 3u);
    EXPECT_EQ(snap.steps_failed, 1u);
    EXPECT_EQ(snap.retries, 5u);
    EXPECT_EQ(snap.replays, 1u);
}

// ---------------------------------------------------------------------------
// 동시성
// ---------------------------------------------------------------------------

TEST(GateStats, ConcurrentUpdates) {
    GateStats stats;
    constexpr int kThreads   = 8;
    constexpr int kPerThread = 1000;

    std::vector<std::thread> workers;
    workers.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&stats, t] {
            for (int i = 0; i < kPerThread; ++i) {
                stats.on_decision(t % 2 == 0, false);
                stats.on_step(false, 1, false);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_plans, static_cast<std::uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(snap.denied_plans, static_cast<std::uint64_t>(kThreads / 2 * kPerThread));
    EXPECT_EQ(snap.retries, static_cast<std::uint64_t>(kThreads * kPerThread));
}
