// ---------------------------------------------------------------------------
// test_gate_runtime.cpp
//
// 구성 루트(build_runtime) 단위 테스트.
//
// [테스트 범위]
// - deadline_pool_size: 0 = 데코레이터 없음, 최소 max_retries + 1
// - deadline_threads == 0 이면 백엔드를 그대로 사용
// - cache.capacity 가 멱등성 캐시에 반영됨
// - global.log_path 에 감사 로그 파일 생성 (백엔드 없는 게이트 전용 구성)
// - 시간 초과된 호출이 풀을 점유해도 재시도는 바로 실행됨
// - 잘못된 설정은 std::invalid_argument
// ---------------------------------------------------------------------------

#include "pipeline/gate_runtime.hpp"

#include "executor/deadline_backend.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>

namespace fs = std::filesystem;

namespace {

// ---------------------------------------------------------------------------
// 헬퍼: 첫 호출만 오래 걸리는 백엔드
// ---------------------------------------------------------------------------
class SlowFirstBackend : public QueryBackend {
public:
    explicit SlowFirstBackend(std::chrono::milliseconds first_delay) : first_delay_(first_delay) {}

    std::expected<QueryResult, BackendError>
    execute(std::string_view, std::string_view, std::chrono::milliseconds) override {
        if (calls.fetch_add(1) == 0) {
            std::this_thread::sleep_for(first_delay_);
        }
        QueryResult result;
        result.bytes_scanned = 64;
        return result;
    }

    std::atomic<int> calls{0};

private:
    std::chrono::milliseconds first_delay_;
};

std::shared_ptr<StructuredLogger> memory_logger(std::ostringstream& out) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    return std::make_shared<StructuredLogger>(LogLevel::kDebug, std::vector<spdlog::sink_ptr>{sink});
}

PipelineRequest request_of(const std::string& workflow) {
    PipelineRequest request;
    request.tenant_id   = "tenant-a";
    request.workflow_id = workflow;
    request.plan.goal   = "runtime";
    request.plan.steps.push_back(PlanStep{1, ExecuteQuery{"SELECT id FROM users LIMIT 5", std::nullopt}, {}});
    return request;
}

}  // namespace

// ---------------------------------------------------------------------------
// deadline_pool_size
// ---------------------------------------------------------------------------

TEST(GateRuntime, DeadlinePoolSize) {
    ExecutorConfig config;
    config.max_retries = 3;

    config.deadline_threads = 0;
    EXPECT_EQ(deadline_pool_size(config), 0u) << "0 이면 타임아웃 강제 안 함";

    config.deadline_threads = 1;
    EXPECT_EQ(deadline_pool_size(config), 4u) << "최소 max_retries + 1";

    config.deadline_threads = 8;
    EXPECT_EQ(deadline_pool_size(config), 8u);
}

// ---------------------------------------------------------------------------
// 백엔드 데코레이터
// ---------------------------------------------------------------------------

TEST(GateRuntime, ZeroDeadlineThreadsUsesBackendDirectly) {
    std::ostringstream audit;
    GateConfig config;
    config.executor.deadline_threads = 0;

    auto backend = std::make_shared<SlowFirstBackend>(std::chrono::milliseconds{0});
    RuntimeOptions options;
    options.backend = backend;
    options.logger  = memory_logger(audit);

    const GateRuntime runtime = build_runtime(config, std::move(options));
    EXPECT_EQ(runtime.backend.get(), backend.get());
    ASSERT_NE(runtime.pipeline, nullptr);

    const auto result = runtime.pipeline->run(request_of("wf-1"));
    ASSERT_EQ(result.outcomes.size(), 1u);
    EXPECT_EQ(result.outcomes[0].status, StepStatus::kSuccess);
}

TEST(GateRuntime, DeadlineThreadsWrapBackend) {
    std::ostringstream audit;
    GateConfig config;
    config.executor.deadline_threads = 2;

    RuntimeOptions options;
    options.backend = std::make_shared<SlowFirstBackend>(std::chrono::milliseconds{0});
    options.logger  = memory_logger(audit);

    const GateRuntime runtime = build_runtime(config, std::move(options));
    EXPECT_NE(dynamic_cast<DeadlineBackend*>(runtime.backend.get()), nullptr);
}

TEST(GateRuntime, TimedOutCallDoesNotBlockRetry) {
    std::ostringstream audit;
    GateConfig config;
    config.executor.deadline_threads = 1;
    config.executor.max_retries      = 2;
    config.executor.call_timeout     = std::chrono::milliseconds{50};

    auto backend = std::make_shared<SlowFirstBackend>(std::chrono::milliseconds{400});
    RuntimeOptions options;
    options.backend = backend;
    options.logger  = memory_logger(audit);

    const GateRuntime runtime = build_runtime(config, std::move(options));

    QueryPlan plan;
    plan.goal = "retry";
    plan.steps.push_back(PlanStep{1, ExecuteQuery{"SELECT 1", std::nullopt}, {}});

    const auto outcomes = runtime.executor->run(plan);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, StepStatus::kSuccess) << "재시도는 점유되지 않은 풀 스레드에서 실행";
    EXPECT_EQ(outcomes[0].retry_count, 1u);
}

// ---------------------------------------------------------------------------
// 캐시 용량
// ---------------------------------------------------------------------------

TEST(GateRuntime, CacheCapacityIsApplied) {
    std::ostringstream audit;
    GateConfig config;
    config.cache.capacity = 1;

    RuntimeOptions options;
    options.backend = std::make_shared<SlowFirstBackend>(std::chrono::milliseconds{0});
    options.logger  = memory_logger(audit);

    const GateRuntime runtime = build_runtime(config, std::move(options));
    ASSERT_NE(runtime.cache, nullptr);

    (void)runtime.pipeline->run(request_of("wf-1"));
    (void)runtime.pipeline->run(request_of("wf-2"));
    EXPECT_EQ(runtime.cache->size(), 1u) << "용량 1 이면 오래된 항목부터 제거";
}

// ---------------------------------------------------------------------------
// 게이트 전용 구성 + 로그 파일
// ---------------------------------------------------------------------------

TEST(GateRuntime, GateOnlyRuntimeWritesAuditFile) {
    const fs::path dir = fs::temp_directory_path() / "querygate_test_runtime";
    fs::remove_all(dir);

    GateConfig config;
    config.global.log_path = (dir / "audit.log").string();

    {
        RuntimeOptions options;
        options.echo_audit_to_stdout = false;
        const GateRuntime runtime = build_runtime(config, std::move(options));

        EXPECT_EQ(runtime.executor, nullptr);
        EXPECT_EQ(runtime.pipeline, nullptr);
        ASSERT_NE(runtime.gate, nullptr);

        const PipelineRequest request = request_of("");
        const GateResult result = runtime.gate->pre_execute(request.tenant_id, request.plan);
        EXPECT_TRUE(result.allowed);
        runtime.logger->log_decision(make_decision_log(request, result));
        runtime.logger->flush();
    }

    std::ifstream in(dir / "audit.log");
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
    EXPECT_NE(line.find(R"("event":"gate_decision")"), std::string::npos) << line;

    fs::remove_all(dir);
}

TEST(GateRuntime, InvalidConfigThrows) {
    GateConfig config;
    config.budget.hourly_budget_bytes = 0;
    EXPECT_THROW((void)build_runtime(config), std::invalid_argument);
}
