// ---------------------------------------------------------------------------
// step_cache.cpp
// ---------------------------------------------------------------------------

#include "executor/step_cache.hpp"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/canonical.hpp"
#include "common/digest.hpp"

namespace {

// in_flight_ 표시를 해제하고 대기자를 깨운다 (예외 경로 포함)
class InFlightGuard {
public:
    InFlightGuard(std::mutex& mutex, std::condition_variable& cv,
                  std::unordered_set<std::string>& in_flight, std::string key)
        : mutex_(mutex), cv_(cv), in_flight_(in_flight), key_(std::move(key)) {}

    ~InFlightGuard() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(key_);
        }
        cv_.notify_all();
    }

    InFlightGuard(const InFlightGuard&)            = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::mutex&                      mutex_;
    std::condition_variable&         cv_;
    std::unordered_set<std::string>& in_flight_;
    std::string                      key_;
};

}  // namespace

IdempotentStepCache::IdempotentStepCache(std::size_t capacity)
    : capacity_(capacity) {}

std::string IdempotentStepCache::key(std::string_view tenant_id,
                                     std::string_view workflow_id,
                                     std::string_view step_name,
                                     const InputMap&  payload) {
    std::string material;
    material.reserve(64);
    material += '[';
    material += canonical_json(ScalarValue{std::string(tenant_id)});
    material += ',';
    material += canonical_json(ScalarValue{std::string(workflow_id)});
    material += ',';
    material += canonical_json(ScalarValue{std::string(step_name)});
    material += ',';
    material += canonical_json(payload);
    material += ']';
    return sha256_hex(material);
}

std::optional<StepOutcome> IdempotentStepCache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void IdempotentStepCache::put(const std::string& key, StepOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    put_locked(key, std::move(outcome));
}

void IdempotentStepCache::put_locked(const std::string& key, StepOutcome outcome) {
    const auto [it, inserted] = entries_.insert_or_assign(key, std::move(outcome));
    if (inserted) {
        insertion_order_.push_back(key);
    }

    while (capacity_ > 0 && entries_.size() > capacity_ && !insertion_order_.empty()) {
        entries_.erase(insertion_order_.front());
        insertion_order_.pop_front();
    }
}

StepOutcome IdempotentStepCache::run_once(const std::string& key, const Compute& compute) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return in_flight_.count(key) == 0; });

        if (const auto it = entries_.find(key); it != entries_.end()) {
            StepOutcome cached = it->second;
            cached.replayed = true;
            spdlog::debug("step_cache: replay step='{}' key={}", cached.step_name, key.substr(0, 12));
            return cached;
        }
        in_flight_.insert(key);
    }

    InFlightGuard guard(mutex_, cv_, in_flight_, key);
    StepOutcome outcome = compute();

    if (outcome.status == StepStatus::kSuccess) {
        std::lock_guard<std::mutex> lock(mutex_);
        put_locked(key, outcome);
    }
    return outcome;
}

std::size_t IdempotentStepCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}
