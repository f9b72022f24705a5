#include "common/canonical.hpp"
#include "pipeline/gate_runtime.hpp"
#include "pipeline/query_pipeline.hpp"
#include "policy/config_loader.hpp"
#include "policy/plan.hpp"
#include "policy/policy_gate.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

// ---------------------------------------------------------------------------
// querygate CLI
//
//   querygate <tenant_id> <sql>
//
// SQL 하나를 단일 스텝 계획으로 게이트에 통과시키고 판정을 JSON 한 줄로
// stdout 에 출력한다. 진단 로그는 stderr, 판정 감사 로그는 global.log_path
// 파일로 나간다.
//
// 환경변수:
//   QUERYGATE_CONFIG     설정 파일 경로 (기본 config/querygate.yaml)
//   QUERYGATE_LOG_LEVEL  진단 로그 레벨 (기본: 설정 파일의 global.log_level)
//
// 종료 코드: 0 = 허용, 2 = 거부, 1 = 사용법/설정 오류
// ---------------------------------------------------------------------------
namespace {

constexpr int kExitDenied = 2;

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

std::string decision_json(const GateResult& result) {
    std::string json = "{\"allowed\":";
    json += result.allowed ? "true" : "false";
    json += ",\"reasons\":[";
    for (std::size_t i = 0; i < result.reasons.size(); ++i) {
        if (i > 0) {
            json += ',';
        }
        json += '"' + escape_json_string(result.reasons[i]) + '"';
    }
    json += "],\"approval_required\":";
    json += result.decision.approval_required ? "true" : "false";
    json += ",\"next_action\":\"";
    json += to_string(result.decision.next_action);
    json += "\",\"estimated_bytes\":" + std::to_string(result.decision.estimated_bytes);
    json += ",\"estimated_cost_usd\":" + fmt::format("{}", result.decision.estimated_cost_usd);

    if (result.allowed && !result.plan.steps.empty()) {
        if (const auto* query = std::get_if<ExecuteQuery>(&result.plan.steps.front().tool)) {
            json += ",\"sql\":\"" + escape_json_string(query->sql) + '"';
        }
    }
    json += '}';
    return json;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_logger_mt("querygate"));

    if (argc != 3) {
        fmt::print(stderr, "usage: {} <tenant_id> <sql>\n", argc > 0 ? argv[0] : "querygate");
        return EXIT_FAILURE;
    }
    const std::string tenant_id = argv[1];
    const std::string sql       = argv[2];

    // ── 설정 로드 ───────────────────────────────────────────────────────
    const std::string config_path = env_str("QUERYGATE_CONFIG", "config/querygate.yaml");
    auto config = ConfigLoader::load(config_path);
    if (!config) {
        spdlog::critical("querygate: configuration rejected: {}", config.error());
        return EXIT_FAILURE;
    }

    const std::string log_level = env_str("QUERYGATE_LOG_LEVEL", config->global.log_level);
    spdlog::set_level(spdlog::level::from_str(log_level));

    // ── 게이트 구성 및 평가 ─────────────────────────────────────────────
    try {
        RuntimeOptions options{};
        options.echo_audit_to_stdout = false;
        const GateRuntime runtime = build_runtime(*config, std::move(options));

        PipelineRequest request{};
        request.tenant_id = tenant_id;
        request.plan.goal = "cli";
        request.plan.steps.push_back(PlanStep{1, ExecuteQuery{sql, std::nullopt}, {}});

        const GateResult result = runtime.gate->pre_execute(tenant_id, request.plan);
        runtime.logger->log_decision(make_decision_log(request, result));
        runtime.logger->flush();

        fmt::print("{}\n", decision_json(result));
        return result.allowed ? EXIT_SUCCESS : kExitDenied;
    } catch (const std::invalid_argument& e) {
        spdlog::critical("querygate: invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::runtime_error& e) {
        spdlog::critical("querygate: startup failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
