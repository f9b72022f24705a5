// ---------------------------------------------------------------------------
// deadline_backend.cpp
// ---------------------------------------------------------------------------

#include "executor/deadline_backend.hpp"

#include <future>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

DeadlineBackend::DeadlineBackend(std::shared_ptr<QueryBackend> inner, std::size_t threads)
    : inner_(std::move(inner))
    , pool_(threads == 0 ? 1 : threads) {
    if (!inner_) {
        throw std::invalid_argument("DeadlineBackend: inner backend must not be null");
    }
    if (threads == 0) {
        throw std::invalid_argument("DeadlineBackend: threads must be greater than 0");
    }
}

DeadlineBackend::~DeadlineBackend() {
    pool_.join();
}

std::expected<QueryResult, BackendError>
DeadlineBackend::execute(std::string_view step_id,
                         std::string_view sql,
                         std::chrono::milliseconds timeout) {
    // 풀 스레드가 호출자보다 오래 살 수 있으므로 인자를 소유 복사한다
    auto task = std::make_shared<std::packaged_task<std::expected<QueryResult, BackendError>()>>(
        [inner = inner_, id = std::string(step_id), text = std::string(sql), timeout] {
            return inner->execute(id, text, timeout);
        });
    auto future = task->get_future();

    boost::asio::post(pool_, [task] { (*task)(); });

    if (future.wait_for(timeout) != std::future_status::ready) {
        spdlog::warn("deadline_backend: step '{}' exceeded {}ms", step_id, timeout.count());
        return std::unexpected(BackendError{
            BackendErrorCode::kTimeout,
            "call exceeded " + std::to_string(timeout.count()) + "ms",
        });
    }

    // 내부 백엔드 예외는 future 를 통해 그대로 재전파된다 (RetryingExecutor 가 분류)
    return future.get();
}
