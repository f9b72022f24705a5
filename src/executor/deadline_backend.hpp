#pragma once

// ---------------------------------------------------------------------------
// deadline_backend.hpp
//
// 임의의 QueryBackend 를 감싸 호출 1회당 타임아웃을 강제하는 데코레이터.
// 내부 백엔드가 timeout 을 지키지 않고 블로킹하더라도 호출자는 timeout 후
// kTimeout 을 받는다 (재시도 가능한 신호).
//
// [동작]
// - 호출은 boost::asio::thread_pool 에 post 된다.
// - 호출자는 future 를 timeout 동안 기다린다.
// - 시간 초과된 호출은 취소되지 않는다. 풀 스레드에서 끝까지 실행되고
//   결과는 버려진다 (스텝 간 취소 없음).
// - 따라서 버려진 호출은 끝날 때까지 풀 스레드 하나를 점유한다. 풀이
//   재시도 횟수보다 작으면 재시도가 앞선 호출 뒤에 줄 서서 대기만 하다
//   다시 timeout 된다. 풀은 최소 max_retries + 1 로 잡는다
//   (gate_runtime 의 deadline_pool_size).
//
// [수명]
// 소멸자는 풀을 join 한다. 버려진 호출이 남아 있으면 그 완료를 기다린다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string_view>

#include <boost/asio/thread_pool.hpp>

#include "executor/query_backend.hpp"

class DeadlineBackend final : public QueryBackend {
public:
    // inner == nullptr 또는 threads == 0 이면 std::invalid_argument.
    DeadlineBackend(std::shared_ptr<QueryBackend> inner, std::size_t threads);

    ~DeadlineBackend() override;

    DeadlineBackend(const DeadlineBackend&)            = delete;
    DeadlineBackend& operator=(const DeadlineBackend&) = delete;

    [[nodiscard]] std::expected<QueryResult, BackendError>
    execute(std::string_view step_id, std::string_view sql, std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<QueryBackend> inner_;
    boost::asio::thread_pool      pool_;
};
