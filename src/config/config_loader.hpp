#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// dbsafe.yaml 을 읽어 GateConfig 로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 하나라도 잘못된 값이 있으면 std::unexpected(메시지).
//   호출자는 부분 설정으로 기동하지 않는다.
// - 누락된 섹션/필드는 GateConfig 기본값을 사용한다.
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 않는다
//   (database.url 에 자격 증명이 포함될 수 있음).
//
// [환경 변수]
//   DBSAFE_CONFIG  : --config 가 없을 때 사용할 설정 파일 경로
//   DATABASE_URL   : database.url 덮어쓰기
//   DBSAFE_DB_PATH : database.path 덮어쓰기
// ---------------------------------------------------------------------------

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "config/gate_config.hpp"

class ConfigLoader {
public:
    // load
    //   파일을 읽고 환경 변수 덮어쓰기까지 적용한다.
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_text
    //   YAML 문자열에서 직접 파싱한다 (환경 변수 덮어쓰기 포함).
    [[nodiscard]] static std::expected<GateConfig, std::string> load_text(std::string_view yaml_text);

    // resolve
    //   cli_path > DBSAFE_CONFIG > config/dbsafe.yaml 순으로 경로를 정한다.
    //   기본 경로 파일이 없으면 기본값 설정(환경 변수 적용)을 반환한다.
    [[nodiscard]] static std::expected<GateConfig, std::string>
    resolve(const std::optional<std::filesystem::path>& cli_path);

    // "300s", "5m", "1h", "45" (초). 0 또는 형식 오류는 std::nullopt.
    [[nodiscard]] static std::optional<std::chrono::seconds> parse_duration(std::string_view text);

    static void apply_env_overrides(GateConfig& cfg);
};
