// ---------------------------------------------------------------------------
// budget_ledger.cpp
// ---------------------------------------------------------------------------

#include "budget/budget_ledger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

constexpr const char* kBudgetSuggestion = "Try sampling or a narrower time window";

}  // namespace

BudgetLedger::BudgetLedger(std::shared_ptr<UsageStore> store,
                           BudgetLimits                limits,
                           TimeSource                  now)
    : store_(std::move(store))
    , limits_(std::move(limits))
    , now_(std::move(now)) {
    if (!store_) {
        throw std::invalid_argument("BudgetLedger: usage store must not be null");
    }
    if (!now_) {
        throw std::invalid_argument("BudgetLedger: time source must not be empty");
    }
    if (limits_.hourly_budget_bytes <= 0) {
        throw std::invalid_argument("BudgetLedger: hourly_budget_bytes must be greater than 0");
    }
    for (const auto& [tenant, budget] : limits_.tenant_budgets) {
        if (budget <= 0) {
            throw std::invalid_argument(
                "BudgetLedger: budget for tenant '" + tenant + "' must be greater than 0");
        }
    }
}

double BudgetLedger::now_seconds() const {
    return std::chrono::duration<double>(now_().time_since_epoch()).count();
}

std::int64_t BudgetLedger::budget_for(std::string_view tenant_id) const {
    const auto it = limits_.tenant_budgets.find(std::string(tenant_id));
    return it != limits_.tenant_budgets.end() ? it->second : limits_.hourly_budget_bytes;
}

std::mutex& BudgetLedger::tenant_mutex(std::string_view tenant_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = tenant_locks_[std::string(tenant_id)];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::int64_t BudgetLedger::window_usage_locked(std::string_view tenant_id, double now_sec) {
    const double window_start =
        now_sec - std::chrono::duration<double>(kWindow).count();
    store_->prune(tenant_id, window_start);

    // int64 범위를 넘는 합계는 상한으로 포화 (llround 범위 밖은 정의되지 않음)
    constexpr double kMaxUsage = 9.2e18;
    const double total = store_->sum(tenant_id, window_start, now_sec);
    if (!(total < kMaxUsage)) {
        return std::numeric_limits<std::int64_t>::max();
    }
    return total > 0.0 ? std::llround(total) : 0;
}

// ---------------------------------------------------------------------------
// check
// ---------------------------------------------------------------------------
BudgetStatus BudgetLedger::check(std::string_view tenant_id, std::int64_t estimated_bytes) {
    if (estimated_bytes < 0) {
        spdlog::warn("budget_ledger: negative estimate {} for tenant '{}', treating as 0",
                     estimated_bytes, tenant_id);
        estimated_bytes = 0;
    }

    const std::int64_t budget = budget_for(tenant_id);
    std::int64_t used = 0;
    {
        std::lock_guard<std::mutex> lock(tenant_mutex(tenant_id));
        used = window_usage_locked(tenant_id, now_seconds());
    }

    BudgetStatus status{};
    status.budget = budget;

    // used ≥ 0, budget > 0 이므로 budget - used 는 넘치지 않는다
    if (estimated_bytes > budget - used) {
        status.allowed         = false;
        status.bytes_used      = used;
        status.bytes_remaining = std::max<std::int64_t>(0, budget - used);
        status.suggestion      = kBudgetSuggestion;
        spdlog::info("budget_ledger: denied tenant='{}' used={} estimate={} budget={}",
                     tenant_id, used, estimated_bytes, budget);
        return status;
    }

    status.allowed         = true;
    status.bytes_used      = used + estimated_bytes;
    status.bytes_remaining = budget - used - estimated_bytes;
    return status;
}

// ---------------------------------------------------------------------------
// record
// ---------------------------------------------------------------------------
void BudgetLedger::record(std::string_view tenant_id, std::int64_t actual_bytes) {
    if (actual_bytes < 0) {
        spdlog::warn("budget_ledger: negative usage {} for tenant '{}', recording 0",
                     actual_bytes, tenant_id);
        actual_bytes = 0;
    }

    std::lock_guard<std::mutex> lock(tenant_mutex(tenant_id));
    store_->append(UsageEvent{
        .tenant_id = std::string(tenant_id),
        .timestamp = now_seconds(),
        .bytes     = static_cast<double>(actual_bytes),
    });
    spdlog::debug("budget_ledger: recorded tenant='{}' bytes={}", tenant_id, actual_bytes);
}

std::int64_t BudgetLedger::usage(std::string_view tenant_id) {
    std::lock_guard<std::mutex> lock(tenant_mutex(tenant_id));
    return window_usage_locked(tenant_id, now_seconds());
}
