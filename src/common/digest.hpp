#pragma once

// ---------------------------------------------------------------------------
// digest.hpp
//
// 콘텐츠 다이제스트 (SHA-256, 소문자 hex 64자).
// OpenSSL EVP 인터페이스를 사용한다.
//
// [용도]
// - StepOutcome::output_hash (결과 감사)
// - IdempotencyKey (멱등성 캐시 키)
// 두 용도 모두 입력은 canonical.hpp 의 정규화 JSON 이어야 한다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

// sha256_hex
//   payload 의 SHA-256 다이제스트를 hex 문자열로 반환한다.
//   OpenSSL 내부 오류(컨텍스트 할당 실패 등) 시 std::runtime_error 를 던진다.
//   정상 입력에서는 실패하지 않는다.
[[nodiscard]] std::string sha256_hex(std::string_view payload);
