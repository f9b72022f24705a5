// ---------------------------------------------------------------------------
// usage_store.cpp
// ---------------------------------------------------------------------------

#include "budget/usage_store.hpp"

#include <iterator>
#include <string>

void InMemoryUsageStore::append(const UsageEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_[event.tenant_id].emplace(event.timestamp, event.bytes);
}

std::size_t InMemoryUsageStore::prune(std::string_view tenant_id, double older_than) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = events_.find(std::string(tenant_id));
    if (it == events_.end()) {
        return 0;
    }

    auto& series = it->second;
    const auto cut = series.lower_bound(older_than);
    const auto removed = static_cast<std::size_t>(std::distance(series.begin(), cut));
    series.erase(series.begin(), cut);

    if (series.empty()) {
        events_.erase(it);
    }
    return removed;
}

double InMemoryUsageStore::sum(std::string_view tenant_id, double from, double to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = events_.find(std::string(tenant_id));
    if (it == events_.end()) {
        return 0.0;
    }

    double total = 0.0;
    const auto& series = it->second;
    for (auto e = series.lower_bound(from); e != series.end() && e->first <= to; ++e) {
        total += e->second;
    }
    return total;
}

std::size_t InMemoryUsageStore::event_count(std::string_view tenant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = events_.find(std::string(tenant_id));
    return it == events_.end() ? 0 : it->second.size();
}
