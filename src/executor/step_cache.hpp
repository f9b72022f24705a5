#pragma once

// ---------------------------------------------------------------------------
// step_cache.hpp
//
// 콘텐츠 주소 기반 스텝 결과 캐시 (멱등성 재실행 방지).
//
// [키]
// SHA-256( canonical_json([tenant_id, workflow_id, step_name, payload]) )
// payload 키는 정렬되어 직렬화되므로 입력 키 순서와 무관하게 같은 키가 된다.
//
// [동시성]
// run_once() 는 키당 동시에 최대 하나의 compute 만 실행한다.
// 같은 키의 다른 호출자는 대기 후 캐시된 결과를 재사용한다.
//
// [한계]
// 프로세스 메모리 내 캐시이다. 재시작 후 정확히 한 번 실행을 보장하지 않는다.
// ---------------------------------------------------------------------------

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "common/types.hpp"
#include "executor/step_outcome.hpp"

class IdempotentStepCache {
public:
    using Compute = std::function<StepOutcome()>;

    // capacity == 0 이면 무제한. 초과 시 가장 오래된 항목부터 제거.
    explicit IdempotentStepCache(std::size_t capacity = 0);

    ~IdempotentStepCache() = default;

    IdempotentStepCache(const IdempotentStepCache&)            = delete;
    IdempotentStepCache& operator=(const IdempotentStepCache&) = delete;

    [[nodiscard]] static std::string key(std::string_view tenant_id,
                                         std::string_view workflow_id,
                                         std::string_view step_name,
                                         const InputMap&  payload);

    [[nodiscard]] std::optional<StepOutcome> get(const std::string& key) const;

    void put(const std::string& key, StepOutcome outcome);

    // run_once
    //   캐시 적중 시 replayed = true 인 결과를 반환한다.
    //   미적중 시 compute 를 실행하고, 성공한 결과만 캐시한다
    //   (실패는 재실행 시 다시 시도될 수 있도록 남기지 않는다).
    //   compute 가 던진 예외는 호출자에게 전파되며 대기자는 깨어난다.
    [[nodiscard]] StepOutcome run_once(const std::string& key, const Compute& compute);

    [[nodiscard]] std::size_t size() const;

private:
    void put_locked(const std::string& key, StepOutcome outcome);

    std::size_t capacity_;

    mutable std::mutex                           mutex_;
    std::condition_variable                      cv_;
    std::unordered_map<std::string, StepOutcome> entries_;
    std::deque<std::string>                      insertion_order_;
    std::unordered_set<std::string>              in_flight_;
};
