#pragma once

// ---------------------------------------------------------------------------
// json_util.hpp
//
// 로거/감사 로그/스냅샷 카탈로그/승인 소켓이 공유하는 JSON 직렬화 헬퍼.
//
// [직렬화 방식]
// - 쓰기: 수동 직렬화 (escape_json_string + fmt::format).
// - 읽기: JSON 은 YAML 1.2 의 부분집합이므로 yaml-cpp(YAML::Load) 로 파싱한다.
//   호출자는 "key": value 사이에 공백을 두는 형태로만 출력해야 한다
//   (yaml-cpp 는 flow 매핑에서 ':' 뒤 공백을 요구한다).
// ---------------------------------------------------------------------------

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// JSON 문자열 값 이스케이프 (따옴표 없이 내용만 반환).
[[nodiscard]] std::string escape_json_string(std::string_view str);

// "value" 형태로 따옴표까지 감싼 JSON 문자열 리터럴을 반환한다.
[[nodiscard]] std::string json_quote(std::string_view str);

// ["a", "b"] 형태의 JSON 문자열 배열.
[[nodiscard]] std::string json_string_array(const std::vector<std::string>& items);

// ISO8601 UTC (밀리초 포함): 2024-01-02T03:04:05.678Z
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

// format_iso8601 의 역변환.
// 허용 형식: YYYY-MM-DD, YYYY-MM-DDTHH:MM:SS, 선택적 .mmm, 선택적 Z
// 형식 불일치 시 std::nullopt.
[[nodiscard]] std::optional<std::chrono::system_clock::time_point>
parse_iso8601(std::string_view text);

// 파일명/ID 용 압축 타임스탬프: 20240102T030405
[[nodiscard]] std::string format_compact_utc(const std::chrono::system_clock::time_point& tp);
