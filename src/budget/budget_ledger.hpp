#pragma once

// ---------------------------------------------------------------------------
// budget_ledger.hpp
//
// 테넌트별 1시간 롤링 윈도우 비용(스캔 바이트) 원장.
//
// [모델]
// - check(): now − 3600s 이전 이벤트를 정리한 뒤 남은 사용량 합계에
//   추정치를 더해 시간당 예산과 비교한다. 원장을 변경하지 않는다
//   (정리 제외). 추정 검사는 사용량에 흔적을 남기지 않는다.
// - record(): 실제 실행이 끝난 스텝의 바이트를 현재 시각으로 추가한다.
// - 고정 버킷이 아닌 연속 롤링 윈도우이므로 사용량은 시계 정각에 리셋되지
//   않고 시간이 지남에 따라 연속적으로 감소한다.
//
// [동시성]
// 같은 테넌트에 대한 check/record 는 테넌트별 mutex 로 직렬화된다.
// 서로 다른 테넌트는 경합하지 않는다.
// 테넌트 mutex 는 처음 본 테넌트마다 하나씩 만들어지고 제거되지 않는다.
// 맵 크기는 관측된 테넌트 수에 비례한다 (요청 수와 무관).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "budget/usage_store.hpp"
#include "common/types.hpp"

// 기본 시간당 예산: 50 GiB
inline constexpr std::int64_t kDefaultHourlyBudgetBytes = 50LL * 1024 * 1024 * 1024;

// ---------------------------------------------------------------------------
// BudgetLimits
//   tenant_budgets: 테넌트별 시간당 예산 재정의 (없으면 hourly_budget_bytes)
// ---------------------------------------------------------------------------
struct BudgetLimits {
    std::int64_t                                  hourly_budget_bytes{kDefaultHourlyBudgetBytes};
    std::unordered_map<std::string, std::int64_t> tenant_budgets{};
};

// ---------------------------------------------------------------------------
// BudgetStatus
//   allowed == true : bytes_used = 윈도우 사용량 + 추정치 (예상 사용량)
//                     bytes_used + bytes_remaining == budget
//   allowed == false: bytes_used = 윈도우 사용량 (추정치 미포함)
//                     bytes_remaining = max(0, budget − bytes_used)
// ---------------------------------------------------------------------------
struct BudgetStatus {
    bool                       allowed{false};
    std::int64_t               bytes_used{0};
    std::int64_t               bytes_remaining{0};
    std::int64_t               budget{0};
    std::optional<std::string> suggestion{};
};

// ---------------------------------------------------------------------------
// BudgetLedger
// ---------------------------------------------------------------------------
class BudgetLedger {
public:
    static constexpr std::chrono::seconds kWindow{3600};

    // 예산 ≤ 0 또는 store == nullptr 이면 std::invalid_argument.
    BudgetLedger(std::shared_ptr<UsageStore> store,
                 BudgetLimits                limits,
                 TimeSource                  now = system_time_source());

    ~BudgetLedger() = default;

    BudgetLedger(const BudgetLedger&)            = delete;
    BudgetLedger& operator=(const BudgetLedger&) = delete;

    // check
    //   tenant 의 윈도우 사용량 + estimated_bytes 가 예산 이하인지 판정한다.
    //   음수 추정치는 0 으로 보정된다.
    [[nodiscard]] BudgetStatus check(std::string_view tenant_id, std::int64_t estimated_bytes);

    // record
    //   실제 소비 바이트를 현재 시각 이벤트로 추가한다. 음수는 0 으로 보정.
    void record(std::string_view tenant_id, std::int64_t actual_bytes);

    // usage
    //   현재 윈도우 내 사용량 (추정치 없이)
    [[nodiscard]] std::int64_t usage(std::string_view tenant_id);

    // 테넌트에 적용되는 시간당 예산
    [[nodiscard]] std::int64_t budget_for(std::string_view tenant_id) const;

private:
    // 테넌트 mutex 조회/생성 (map 자체는 locks_mutex_ 로 보호)
    std::mutex& tenant_mutex(std::string_view tenant_id);

    // 정리 후 윈도우 합계. 호출자가 테넌트 mutex 를 잡고 있어야 한다.
    std::int64_t window_usage_locked(std::string_view tenant_id, double now_sec);

    [[nodiscard]] double now_seconds() const;

    std::shared_ptr<UsageStore> store_;
    BudgetLimits                limits_;
    TimeSource                  now_;

    std::mutex                                                    locks_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> tenant_locks_;
};
