// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 GateConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 어느 섹션이든 파싱/검증 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다.
// - 스칼라 타입 불일치(문자열 자리에 map 등)는 YAML::BadConversion 으로
//   섹션 파싱 실패가 된다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [알려진 한계]
// - safety.partitioned_tables 가 주어지면 기본 테이블 목록을 대체한다
//   (병합하지 않는다). 빈 map 으로 파티션 필터를 끌 수 있다.
// ---------------------------------------------------------------------------

#include "policy/config_loader.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "executor/query_backend.hpp"

namespace {

constexpr std::array<std::string_view, 6> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical",
};

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 읽기. 노드가 없거나 null 이면 fallback.
// 변환 실패는 YAML::BadConversion 으로 호출자에게 전파된다.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] T read_scalar(const YAML::Node& node, const T& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<T>();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: string 시퀀스. 시퀀스가 아니면 BadConversion.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string>
read_string_sequence(const YAML::Node& node, const std::vector<std::string>& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<std::vector<std::string>>();
}

[[nodiscard]] GlobalConfig parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.log_level = read_scalar(node["log_level"], cfg.log_level);
    cfg.log_path  = read_scalar(node["log_path"],  cfg.log_path);
    return cfg;
}

// ---------------------------------------------------------------------------
// safety:
//   default_limit / max_join_depth / max_subquery_depth / partition_lookback_days
//   partitioned_tables: { "dataset.table": "column" }
// ---------------------------------------------------------------------------
[[nodiscard]] SafetyLimits parse_safety(const YAML::Node& node) {
    SafetyLimits cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.default_limit      = read_scalar(node["default_limit"],      cfg.default_limit);
    cfg.max_join_depth     = read_scalar(node["max_join_depth"],     cfg.max_join_depth);
    cfg.max_subquery_depth = read_scalar(node["max_subquery_depth"], cfg.max_subquery_depth);
    cfg.partition_lookback_days =
        read_scalar(node["partition_lookback_days"], cfg.partition_lookback_days);

    const YAML::Node& tables = node["partitioned_tables"];
    if (tables && !tables.IsNull()) {
        cfg.partitioned_tables = tables.as<std::map<std::string, std::string>>();
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// budget:
//   hourly_budget_bytes: <int>
//   tenants: { tenant_id: <int> }
// ---------------------------------------------------------------------------
[[nodiscard]] BudgetLimits parse_budget(const YAML::Node& node) {
    BudgetLimits cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.hourly_budget_bytes = read_scalar(node["hourly_budget_bytes"], cfg.hourly_budget_bytes);

    const YAML::Node& tenants = node["tenants"];
    if (tenants && !tenants.IsNull()) {
        for (const auto& [tenant, budget] :
             tenants.as<std::map<std::string, std::int64_t>>()) {
            cfg.tenant_budgets.emplace(tenant, budget);
        }
    }
    return cfg;
}

[[nodiscard]] CostLimits parse_cost(const YAML::Node& node) {
    CostLimits cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.per_query_max_bytes = read_scalar(node["per_query_max_bytes"], cfg.per_query_max_bytes);
    cfg.per_query_max_bytes_with_approval =
        read_scalar(node["per_query_max_bytes_with_approval"],
                    cfg.per_query_max_bytes_with_approval);
    cfg.bytes_per_sql_char = read_scalar(node["bytes_per_sql_char"], cfg.bytes_per_sql_char);
    cfg.usd_per_tib        = read_scalar(node["usd_per_tib"],        cfg.usd_per_tib);
    return cfg;
}

// ---------------------------------------------------------------------------
// executor:
//   max_retries / call_timeout_ms / retryable_errors / deadline_threads
// ---------------------------------------------------------------------------
[[nodiscard]] ExecutorConfig parse_executor(const YAML::Node& node) {
    ExecutorConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.max_retries = read_scalar(node["max_retries"], cfg.max_retries);
    cfg.call_timeout = std::chrono::milliseconds(
        read_scalar<std::int64_t>(node["call_timeout_ms"], cfg.call_timeout.count()));
    cfg.retryable_errors = read_string_sequence(node["retryable_errors"], cfg.retryable_errors);
    cfg.deadline_threads = read_scalar(node["deadline_threads"], cfg.deadline_threads);
    return cfg;
}

[[nodiscard]] CacheConfig parse_cache(const YAML::Node& node) {
    CacheConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.capacity = read_scalar<std::size_t>(node["capacity"], cfg.capacity);
    return cfg;
}

// ---------------------------------------------------------------------------
// 섹션 단위 파싱. 섹션 하나라도 실패하면 std::unexpected.
// ---------------------------------------------------------------------------
template <typename Fn>
[[nodiscard]] std::expected<void, std::string>
parse_section(std::string_view name, Fn&& fn) {
    try {
        fn();
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing '{}' section: {}", name, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return {};
}

[[nodiscard]] std::expected<GateConfig, std::string>
parse_root(const YAML::Node& root, std::string_view origin) {
    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)", origin);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    GateConfig cfg{};

    if (auto r = parse_section("global", [&] { cfg.global = parse_global(root["global"]); }); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = parse_section("safety", [&] { cfg.safety = parse_safety(root["safety"]); }); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = parse_section("budget", [&] { cfg.budget = parse_budget(root["budget"]); }); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = parse_section("cost", [&] { cfg.cost = parse_cost(root["cost"]); }); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = parse_section("executor",
                               [&] { cfg.executor = parse_executor(root["executor"]); });
        !r) {
        return std::unexpected(r.error());
    }
    if (auto r = parse_section("cache", [&] { cfg.cache = parse_cache(root["cache"]); }); !r) {
        return std::unexpected(r.error());
    }

    if (auto valid = ConfigLoader::validate(cfg); !valid) {
        spdlog::error("{}", valid.error());
        return std::unexpected(valid.error());
    }

    spdlog::info(
        "config_loader: config loaded from '{}' partitioned_tables={} tenant_budgets={} "
        "max_retries={}",
        origin,
        cfg.safety.partitioned_tables.size(),
        cfg.budget.tenant_budgets.size(),
        cfg.executor.max_retries
    );
    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<GateConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading config from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp 는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, canonical_path.string());
}

std::expected<GateConfig, std::string>
ConfigLoader::load_from_string(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("config_loader: YAML parse error: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return parse_root(root, "<string>");
}

// ---------------------------------------------------------------------------
// ConfigLoader::validate
// ---------------------------------------------------------------------------
std::expected<void, std::string> ConfigLoader::validate(const GateConfig& cfg) {
    bool known_level = false;
    for (const auto level : kLogLevels) {
        if (cfg.global.log_level == level) {
            known_level = true;
        }
    }
    if (!known_level) {
        return std::unexpected(fmt::format(
            "config_loader: global.log_level '{}' is not a known level", cfg.global.log_level));
    }

    if (cfg.safety.default_limit == 0) {
        return std::unexpected("config_loader: safety.default_limit must be greater than 0");
    }
    for (const auto& [table, column] : cfg.safety.partitioned_tables) {
        if (table.empty() || column.empty()) {
            return std::unexpected(
                "config_loader: safety.partitioned_tables entries must be non-empty");
        }
    }

    if (cfg.budget.hourly_budget_bytes <= 0) {
        return std::unexpected("config_loader: budget.hourly_budget_bytes must be greater than 0");
    }
    for (const auto& [tenant, budget] : cfg.budget.tenant_budgets) {
        if (budget <= 0) {
            return std::unexpected(fmt::format(
                "config_loader: budget.tenants.{} must be greater than 0", tenant));
        }
    }

    if (cfg.cost.per_query_max_bytes <= 0) {
        return std::unexpected("config_loader: cost.per_query_max_bytes must be greater than 0");
    }
    if (cfg.cost.per_query_max_bytes > cfg.cost.per_query_max_bytes_with_approval) {
        return std::unexpected(
            "config_loader: cost.per_query_max_bytes must not exceed "
            "cost.per_query_max_bytes_with_approval");
    }
    if (cfg.cost.bytes_per_sql_char <= 0) {
        return std::unexpected("config_loader: cost.bytes_per_sql_char must be greater than 0");
    }
    if (cfg.cost.usd_per_tib < 0.0) {
        return std::unexpected("config_loader: cost.usd_per_tib must not be negative");
    }

    if (cfg.executor.call_timeout.count() <= 0) {
        return std::unexpected("config_loader: executor.call_timeout_ms must be greater than 0");
    }
    for (const auto& name : cfg.executor.retryable_errors) {
        if (!backend_error_code_from_string(name)) {
            return std::unexpected(fmt::format(
                "config_loader: executor.retryable_errors contains unknown code '{}'", name));
        }
    }

    return {};
}
