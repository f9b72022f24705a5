#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   spdlog 전역 레지스트리에 등록하지 않으므로 여러 인스턴스가 공존할 수 있다.
// - 모든 레코드 필드는 snake_case JSON 키로 직렬화한다.
// - 한 줄에 JSON 객체 하나 (JSON lines).
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

// ---------------------------------------------------------------------------
// StructuredLogger
//   DecisionLog / StepLog / UsageLog 를 JSON 포맷으로 기록한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로. rotating file(100MB × 3) 싱크 사용.
    //   echo_stdout: true 면 stdout 싱크도 붙인다 (CLI 는 stdout 을 결과 출력에 쓴다).
    //   싱크 생성 실패 시 std::runtime_error.
    StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path, bool echo_stdout = true);

    // 싱크 주입 생성자 (테스트, 임베딩용)
    StructuredLogger(LogLevel min_level, std::vector<spdlog::sink_ptr> sinks);

    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // log_decision
    //   허용 판정은 info, 차단 판정은 warn 레벨로 기록한다.
    void log_decision(const DecisionLog& entry);

    // log_step
    //   성공/건너뜀은 info, 실패는 error 레벨.
    void log_step(const StepLog& entry);

    void log_usage(const UsageLog& entry);

    void flush();

private:
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    LogLevel                        min_level_;
    std::shared_ptr<spdlog::logger> logger_;
};
