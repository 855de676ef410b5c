#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - RiskLevel, FinalStatus 등 게이트 타입을 직접 include 하지 않는다.
//   호출자가 *_to_string() 으로 변환한 문자열을 넘긴다.
//
// [민감정보 취급 주의]
// - sql 은 원문 SQL 전체를 포함한다. 운영 환경에서 로그 레벨/마스킹
//   정책을 별도로 적용할 것.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug" | "info" | "warn" | "error" (대소문자 무시). 그 외 std::nullopt.
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view text);

// ---------------------------------------------------------------------------
// RunLog
//   게이트 실행 1회가 종료되었을 때의 요약.
// ---------------------------------------------------------------------------
struct RunLog {
    std::string                           run_id{};
    std::string                           risk_level{};
    std::string                           approval_decision{};
    std::string                           final_status{};
    std::string                           abort_reason{};
    std::uint64_t                         affected_rows{0};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};  // 제출 ~ 감사 기록 완료
};

// ---------------------------------------------------------------------------
// BlockLog
//   차단 이벤트 로그.
//   matched_rule: 최종 등급을 결정한 규칙 식별자
//   reason: 사람이 읽을 수 있는 차단 사유
// ---------------------------------------------------------------------------
struct BlockLog {
    std::string                           run_id{};
    std::string                           sql{};           // 원문 SQL (마스킹 주의)
    std::string                           matched_rule{};
    std::string                           reason{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// SnapshotLog
//   event: "snapshot_created" | "snapshot_restored"
// ---------------------------------------------------------------------------
struct SnapshotLog {
    std::string                           event{};
    std::string                           snapshot_id{};
    std::string                           run_id{};         // 복원이면 롤백 run_id
    std::string                           strategy{};
    std::vector<std::string>              tables{};
    std::chrono::system_clock::time_point timestamp{};
};
