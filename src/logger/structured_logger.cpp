// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/canonical.hpp"

namespace {

constexpr const char* kLoggerName = "querygate.audit";

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

std::string json_string(std::string_view value) {
    return "\"" + escape_json_string(value) + "\"";
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_logger(LogLevel min_level, std::vector<spdlog::sink_ptr> sinks) {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(to_spdlog_level(min_level));

    // 구조화 로그는 각 메서드에서 JSON 으로 생성하므로 패턴은 본문만
    logger->set_pattern("%v");
    logger->flush_on(spdlog::level::trace);
    return logger;
}

}  // namespace

LogLevel log_level_from_string(std::string_view name) noexcept {
    if (name == "trace" || name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "warn") {
        return LogLevel::kWarn;
    }
    if (name == "error" || name == "critical") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   bool                         echo_stdout)
    : min_level_(min_level) {
    try {
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (echo_stdout) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path.string(), max_file_size, max_files));

        logger_ = make_logger(min_level, std::move(sinks));
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::StructuredLogger(LogLevel min_level, std::vector<spdlog::sink_ptr> sinks)
    : min_level_(min_level)
    , logger_(make_logger(min_level, std::move(sinks))) {}

StructuredLogger::~StructuredLogger() = default;

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(level) >= static_cast<int>(min_level_);
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_decision: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_decision(const DecisionLog& entry) {
    const LogLevel level = entry.allowed ? LogLevel::kInfo : LogLevel::kWarn;
    if (!enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"gate_decision","tenant_id":)" << json_string(entry.tenant_id)
         << R"(,"workflow_id":)" << json_string(entry.workflow_id)
         << R"(,"allowed":)" << (entry.allowed ? "true" : "false")
         << R"(,"approval_required":)" << (entry.approval_required ? "true" : "false")
         << R"(,"next_action":)" << json_string(entry.next_action)
         << R"(,"reasons":[)";

    for (std::size_t i = 0; i < entry.reasons.size(); ++i) {
        if (i > 0) {
            json << ',';
        }
        json << json_string(entry.reasons[i]);
    }

    json << R"(],"estimated_bytes":)" << entry.estimated_bytes
         << R"(,"estimated_cost_usd":)" << fmt::format("{}", entry.estimated_cost_usd)
         << R"(,"sql_prefix":)" << json_string(entry.sql_prefix)
         << R"(,"timestamp":)" << json_string(format_iso8601(entry.timestamp)) << '}';

    if (entry.allowed) {
        logger_->info(json.str());
    } else {
        logger_->warn(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_step: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_step(const StepLog& entry) {
    const bool failed = entry.status == "failed";
    const LogLevel level = failed ? LogLevel::kError : LogLevel::kInfo;
    if (!enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"step_outcome","tenant_id":)" << json_string(entry.tenant_id)
         << R"(,"workflow_id":)" << json_string(entry.workflow_id)
         << R"(,"step_name":)" << json_string(entry.step_name)
         << R"(,"status":)" << json_string(entry.status)
         << R"(,"retry_count":)" << entry.retry_count
         << R"(,"replayed":)" << (entry.replayed ? "true" : "false")
         << R"(,"output_hash":)" << json_string(entry.output_hash);

    if (!entry.error.empty()) {
        json << R"(,"error":)" << json_string(entry.error);
    }

    json << R"(,"duration_us":)" << entry.duration.count()
         << R"(,"timestamp":)" << json_string(format_iso8601(entry.timestamp)) << '}';

    if (failed) {
        logger_->error(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_usage: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_usage(const UsageLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"usage_recorded","tenant_id":)" << json_string(entry.tenant_id)
         << R"(,"bytes":)" << entry.bytes
         << R"(,"window_usage":)" << entry.window_usage
         << R"(,"budget":)" << entry.budget
         << R"(,"timestamp":)" << json_string(format_iso8601(entry.timestamp)) << '}';

    logger_->info(json.str());
}
