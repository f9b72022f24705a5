#pragma once

// ---------------------------------------------------------------------------
// gate_stats.hpp
//
// 게이트/실행기 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_* 갱신 메서드: 요청 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 조회 경로. 갱신 경로와 mutex 없이 분리된다.
//   카운터 간 원자적 일관성은 보장하지 않는다 (각 카운터는 개별적으로 정확).
//
// [격리 원칙]
// - 통계 갱신 실패가 요청 처리로 전파되지 않도록 모든 갱신 메서드는 noexcept.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// GateStatsSnapshot
//   deny_rate: denied_plans / total_plans (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct GateStatsSnapshot {
    std::uint64_t                         total_plans{0};
    std::uint64_t                         denied_plans{0};
    std::uint64_t                         approvals_required{0};
    std::uint64_t                         steps_executed{0};
    std::uint64_t                         steps_failed{0};
    std::uint64_t                         retries{0};
    std::uint64_t                         replays{0};
    double                                deny_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class GateStats {
public:
    GateStats() noexcept = default;
    ~GateStats()         = default;

    // 복사/이동 금지 (atomic)
    GateStats(const GateStats&)            = delete;
    GateStats& operator=(const GateStats&) = delete;
    GateStats(GateStats&&)                 = delete;
    GateStats& operator=(GateStats&&)      = delete;

    // on_decision
    //   계획 하나에 대한 게이트 판정 시 호출.
    void on_decision(bool allowed, bool approval_required) noexcept {
        total_plans_.fetch_add(1, std::memory_order_relaxed);
        if (!allowed) {
            denied_plans_.fetch_add(1, std::memory_order_relaxed);
        }
        if (approval_required) {
            approvals_required_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // on_step
    //   실제로 시작된 스텝마다 호출 (건너뛴 스텝 제외).
    void on_step(bool failed, std::uint32_t retry_count, bool replayed) noexcept {
        steps_executed_.fetch_add(1, std::memory_order_relaxed);
        retries_.fetch_add(retry_count, std::memory_order_relaxed);
        if (failed) {
            steps_failed_.fetch_add(1, std::memory_order_relaxed);
        }
        if (replayed) {
            replays_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] GateStatsSnapshot snapshot() const noexcept {
        const auto total  = total_plans_.load(std::memory_order_relaxed);
        const auto denied = denied_plans_.load(std::memory_order_relaxed);

        double deny_rate = 0.0;
        if (total > 0) {
            deny_rate = static_cast<double>(denied) / static_cast<double>(total);
        }

        return GateStatsSnapshot{
            .total_plans        = total,
            .denied_plans       = denied,
            .approvals_required = approvals_required_.load(std::memory_order_relaxed),
            .steps_executed     = steps_executed_.load(std::memory_order_relaxed),
            .steps_failed       = steps_failed_.load(std::memory_order_relaxed),
            .retries            = retries_.load(std::memory_order_relaxed),
            .replays            = replays_.load(std::memory_order_relaxed),
            .deny_rate          = deny_rate,
            .captured_at        = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_plans_{0};
    std::atomic<std::uint64_t> denied_plans_{0};
    std::atomic<std::uint64_t> approvals_required_{0};
    std::atomic<std::uint64_t> steps_executed_{0};
    std::atomic<std::uint64_t> steps_failed_{0};
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> replays_{0};
};
