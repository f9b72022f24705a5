#pragma once

// ---------------------------------------------------------------------------
// query_backend.hpp
//
// 쿼리 실행 백엔드 추상화 (외부 협력자 경계).
// 실제 웨어하우스 커넥터는 이 인터페이스를 구현한다.
//
// [오류 보고 규약]
// - 예상 가능한 실패(일시 오류, 타임아웃, 잘못된 쿼리)는 std::unexpected 로 반환.
// - 구현체가 예외를 던지면 RetryingExecutor 가 internal_error 로 변환한다
//   (재시도하지 않음).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// BackendErrorCode
//   문자열 표현(to_string)이 설정 파일의 retryable_errors 항목과 대응한다.
// ---------------------------------------------------------------------------
enum class BackendErrorCode : std::uint8_t {
    kTransientError = 0,
    kTimeout        = 1,
    kPermanent      = 2,
    kInvalidQuery   = 3,
    kInternalError  = 4,
};

[[nodiscard]] constexpr std::string_view to_string(BackendErrorCode code) noexcept {
    switch (code) {
        case BackendErrorCode::kTransientError: return "transient_error";
        case BackendErrorCode::kTimeout:        return "timeout";
        case BackendErrorCode::kPermanent:      return "permanent";
        case BackendErrorCode::kInvalidQuery:   return "invalid_query";
        case BackendErrorCode::kInternalError:  return "internal_error";
    }
    return "internal_error";
}

// 문자열 → 코드. 알 수 없는 이름이면 std::nullopt.
[[nodiscard]] inline std::optional<BackendErrorCode>
backend_error_code_from_string(std::string_view name) noexcept {
    for (const auto code : {BackendErrorCode::kTransientError, BackendErrorCode::kTimeout,
                            BackendErrorCode::kPermanent, BackendErrorCode::kInvalidQuery,
                            BackendErrorCode::kInternalError}) {
        if (to_string(code) == name) {
            return code;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// BackendError
// ---------------------------------------------------------------------------
struct BackendError {
    BackendErrorCode code{BackendErrorCode::kInternalError};
    std::string      message{};
};

// ---------------------------------------------------------------------------
// QueryBackend
// ---------------------------------------------------------------------------
class QueryBackend {
public:
    virtual ~QueryBackend() = default;

    // execute
    //   step_id: 실행 중인 스텝 식별자 (백엔드 측 추적용)
    //   sql    : 게이트를 통과한 (재작성된) SQL
    //   timeout: 호출 1회당 허용 시간. 초과 시 kTimeout 을 반환해야 한다.
    [[nodiscard]] virtual std::expected<QueryResult, BackendError>
    execute(std::string_view step_id, std::string_view sql, std::chrono::milliseconds timeout) = 0;
};
