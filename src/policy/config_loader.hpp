#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 GateConfig 로 로드하고 검증하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 부분 설정을 돌려주지
//   않는다 (all-or-nothing). 호출자는 실패 시 기동을 중단해야 한다.
// - 필드 누락은 구조체 기본값, 타입 불일치는 실패로 처리한다.
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되 YAML 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "policy/gate_config.hpp"

class ConfigLoader {
public:
    // load
    //   config_path 의 YAML 을 읽어 파싱 + validate() 까지 수행한다.
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   YAML 텍스트를 직접 파싱한다 (테스트 및 임베디드 설정용).
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load_from_string(const std::string& yaml_text);

    // validate
    //   값 범위 검증. 실패 시 첫 번째 위반 사유를 반환한다.
    [[nodiscard]] static std::expected<void, std::string> validate(const GateConfig& cfg);
};
