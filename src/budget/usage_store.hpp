#pragma once

// ---------------------------------------------------------------------------
// usage_store.hpp
//
// 테넌트별 사용량 이벤트 저장소.
// BudgetLedger 가 주입받아 소유하는 명시적 객체로, 프로세스 전역 상태가 아니다.
// 테스트는 독립된 저장소를 만들어 원장마다 격리할 수 있다.
//
// [동시성 계약]
// 구현체는 자체적으로 스레드 안전해야 한다. BudgetLedger 는 테넌트 단위로
// 직렬화하지만, 서로 다른 테넌트에 대한 호출은 동시에 들어올 수 있다.
// ---------------------------------------------------------------------------

#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

// ---------------------------------------------------------------------------
// UsageEvent
//   timestamp: epoch 기준 초 (double)
//   bytes    : 실제 소비 바이트 (≥ 0)
// ---------------------------------------------------------------------------
struct UsageEvent {
    std::string tenant_id{};
    double      timestamp{0.0};
    double      bytes{0.0};
};

// ---------------------------------------------------------------------------
// UsageStore
//   타임스탬프 순으로 정렬된 테넌트별 이벤트 집합.
// ---------------------------------------------------------------------------
class UsageStore {
public:
    virtual ~UsageStore() = default;

    // append
    //   이벤트 하나를 추가한다.
    virtual void append(const UsageEvent& event) = 0;

    // prune
    //   timestamp < older_than 인 이벤트를 제거하고 제거 개수를 반환한다.
    virtual std::size_t prune(std::string_view tenant_id, double older_than) = 0;

    // sum
    //   from <= timestamp <= to 범위 이벤트의 bytes 합.
    [[nodiscard]] virtual double sum(std::string_view tenant_id, double from, double to) const = 0;
};

// ---------------------------------------------------------------------------
// InMemoryUsageStore
//   단일 mutex 로 보호되는 map 기반 구현.
//   테넌트별 multimap<timestamp, bytes> 로 정렬 순서를 유지한다.
// ---------------------------------------------------------------------------
class InMemoryUsageStore final : public UsageStore {
public:
    InMemoryUsageStore()           = default;
    ~InMemoryUsageStore() override = default;

    InMemoryUsageStore(const InMemoryUsageStore&)            = delete;
    InMemoryUsageStore& operator=(const InMemoryUsageStore&) = delete;

    void append(const UsageEvent& event) override;

    std::size_t prune(std::string_view tenant_id, double older_than) override;

    [[nodiscard]] double sum(std::string_view tenant_id, double from, double to) const override;

    // 테넌트의 현재 이벤트 수 (테스트/진단용)
    [[nodiscard]] std::size_t event_count(std::string_view tenant_id) const;

private:
    mutable std::mutex                                              mutex_;
    std::unordered_map<std::string, std::multimap<double, double>> events_;
};
