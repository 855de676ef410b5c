#pragma once

// ---------------------------------------------------------------------------
// fingerprint.hpp
//
// 구문 지문(fingerprint)과 실행/스냅샷 식별자 생성.
//
// [지문 정규화 규칙]
// 1. 주석 제거 (/* */, --, #)
// 2. 문자열 리터럴 밖 문자만 소문자화 (리터럴 값은 보존)
// 3. 연속 공백 → 공백 1개, 앞뒤 공백 제거
// 4. 끝 세미콜론 제거
// 정규화 결과를 SHA-256(OpenSSL EVP) 으로 해시하여 소문자 hex 64자로 반환한다.
// 대소문자/공백만 다른 두 구문은 같은 지문을 갖는다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

[[nodiscard]] std::string normalize_sql(std::string_view sql);

[[nodiscard]] std::string fingerprint(std::string_view sql);

// RUN_20240102T030405_a1b2c3d4
[[nodiscard]] std::string make_run_id();

// SNAPSHOT_20240102T030405_a1b2c3d4
[[nodiscard]] std::string make_snapshot_id();

// 소문자 hex n 바이트 난수 (OpenSSL RAND_bytes). 실패 시 std::random_device 폴백.
[[nodiscard]] std::string random_hex(std::size_t n_bytes);
