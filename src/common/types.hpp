#pragma once

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// ParseErrorCode
//   SQL 파싱 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class ParseErrorCode : std::uint8_t {
    kEmptyInput        = 0,  // 빈 입력 또는 주석만 존재
    kInvalidSql        = 1,  // SQL 문법 오류 (괄호/따옴표 불균형 등)
    kMultiStatement    = 2,  // 문자열/주석 밖 세미콜론으로 구분된 복수 구문
    kInternalError     = 3,  // 파서 내부 오류
};

// ---------------------------------------------------------------------------
// ParseError
//   파싱 실패 시 반환되는 오류 정보.
//   std::expected<T, ParseError> 패턴과 함께 사용한다.
//   호출자는 ParseError 를 절대 "안전"으로 해석하지 않는다 (fail-close).
// ---------------------------------------------------------------------------
struct ParseError {
    ParseErrorCode code{ParseErrorCode::kInternalError};
    std::string    message{};  // 사람이 읽을 수 있는 오류 설명
    std::string    context{};  // 오류가 발생한 위치/입력 단편 (로깅용)
};

// ---------------------------------------------------------------------------
// GateErrorCode
//   게이트 파이프라인과 주변 컴포넌트(스냅샷, 감사 로그, DB)의 오류 분류.
// ---------------------------------------------------------------------------
enum class GateErrorCode : std::uint8_t {
    kDryRunFailed     = 0,  // 추정 쿼리 재작성 또는 read-only 실행 실패
    kSnapshotFailed   = 1,  // 스냅샷 생성 실패 (실행 전 중단)
    kApprovalTimeout  = 2,  // 승인 대기 시간 초과
    kExecutionFailed  = 3,  // 승인 후 실제 쓰기 실패 (재시도 없음)
    kNotFound         = 4,  // 알 수 없는 run_id / snapshot id
    kBackendError     = 5,  // 복원 실패 등 DB 백엔드 오류
    kAuditWriteFailed = 6,  // 감사 로그 append 실패
    kInvalidConfig    = 7,  // 설정 오류
    kInternal         = 8,  // 잘못된 상태 전이 등 내부 오류
};

// ---------------------------------------------------------------------------
// GateError
//   std::expected<T, GateError> 의 오류 측 값.
// ---------------------------------------------------------------------------
struct GateError {
    GateErrorCode code{GateErrorCode::kInternal};
    std::string   message{};
};

[[nodiscard]] inline const char* gate_error_code_to_string(GateErrorCode code) noexcept {
    switch (code) {
        case GateErrorCode::kDryRunFailed:     return "DRY_RUN_FAILED";
        case GateErrorCode::kSnapshotFailed:   return "SNAPSHOT_FAILED";
        case GateErrorCode::kApprovalTimeout:  return "APPROVAL_TIMEOUT";
        case GateErrorCode::kExecutionFailed:  return "EXECUTION_FAILED";
        case GateErrorCode::kNotFound:         return "NOT_FOUND";
        case GateErrorCode::kBackendError:     return "BACKEND_ERROR";
        case GateErrorCode::kAuditWriteFailed: return "AUDIT_WRITE_FAILED";
        case GateErrorCode::kInvalidConfig:    return "INVALID_CONFIG";
        case GateErrorCode::kInternal:         return "INTERNAL";
    }
    return "INTERNAL";
}
