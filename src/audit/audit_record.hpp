#pragma once

// ---------------------------------------------------------------------------
// audit_record.hpp
//
// 게이트 실행 1회(또는 롤백 1회)의 최종 기록.
//
// [불변식]
// - final_status == kExecuted  →  approval ∈ {kAuto, kApproved}
// - risk.level >= HIGH 이고 final_status == kExecuted  →  snapshot 존재
// - CRITICAL 이며 override 없는 실행은 kExecuted 에 도달하지 않는다
// - kExecuted 는 "실행을 시도함" 을 뜻한다. execution.status 가 kFailed 일 수 있다.
//
// 기록은 추가 전용이며 수정/삭제 연산은 없다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dryrun/dry_run_estimator.hpp"
#include "risk/risk_classifier.hpp"
#include "snapshot/snapshot_ref.hpp"

enum class RecordKind : std::uint8_t {
    kStatement = 0,
    kRollback  = 1,
};

enum class ApprovalDecision : std::uint8_t {
    kNone     = 0,
    kAuto     = 1,
    kApproved = 2,
    kDenied   = 3,
    kTimedOut = 4,
};

enum class ExecutionStatus : std::uint8_t {
    kNotRun  = 0,
    kSuccess = 1,
    kFailed  = 2,
};

enum class FinalStatus : std::uint8_t {
    kExecuted = 0,
    kAborted  = 1,
    kBlocked  = 2,
};

// ABORTED 사유. 감사 레코드에는 문자열로 기록된다.
enum class AbortReason : std::uint8_t {
    kNone           = 0,
    kDenied         = 1,
    kTimeout        = 2,
    kDryRunFailed   = 3,
    kSnapshotFailed = 4,
    kCancelled      = 5,
    kLockFailed     = 6,
};

[[nodiscard]] const char* record_kind_to_string(RecordKind kind) noexcept;
[[nodiscard]] const char* approval_decision_to_string(ApprovalDecision decision) noexcept;
[[nodiscard]] const char* execution_status_to_string(ExecutionStatus status) noexcept;
[[nodiscard]] const char* final_status_to_string(FinalStatus status) noexcept;
[[nodiscard]] const char* abort_reason_to_string(AbortReason reason) noexcept;

[[nodiscard]] std::optional<RecordKind>       record_kind_from_string(std::string_view text);
[[nodiscard]] std::optional<ApprovalDecision> approval_decision_from_string(std::string_view text);
[[nodiscard]] std::optional<ExecutionStatus>  execution_status_from_string(std::string_view text);
[[nodiscard]] std::optional<FinalStatus>      final_status_from_string(std::string_view text);
[[nodiscard]] std::optional<AbortReason>      abort_reason_from_string(std::string_view text);

// CRITICAL 구문을 실행하기 위한 권한 상승. 제출 시에만 주어지며 별도로 감사된다.
struct ElevatedOverride {
    std::string authorized_by{};
    std::string reason{};

    bool operator==(const ElevatedOverride&) const = default;
};

struct ExecutionOutcome {
    ExecutionStatus status{ExecutionStatus::kNotRun};
    std::uint64_t   affected_rows{0};
    std::string     error{};

    bool operator==(const ExecutionOutcome&) const = default;
};

struct AuditRecord {
    std::string                           run_id{};
    std::chrono::system_clock::time_point timestamp{};
    RecordKind                            kind{RecordKind::kStatement};
    std::string                           sql{};
    std::string                           fingerprint{};
    RiskAssessment                        risk{};
    std::optional<DryRunResult>           dry_run{};
    std::string                           dry_run_error{};   // 드라이런 실패 메시지
    ApprovalDecision                      approval{ApprovalDecision::kNone};
    std::optional<SnapshotRef>            snapshot{};
    ExecutionOutcome                      execution{};
    FinalStatus                           final_status{FinalStatus::kBlocked};
    AbortReason                           abort_reason{AbortReason::kNone};
    std::optional<ElevatedOverride>       elevated_override{};
    std::string                           approved_by{};    // 롤백을 승인한 주체 (구문 레코드는 빈 문자열)
    std::vector<std::string>              transitions{};    // 거쳐간 게이트 상태 이름

    bool operator==(const AuditRecord&) const = default;
};
