#pragma once

// ---------------------------------------------------------------------------
// approval_gate.hpp
//
// 구문 하나를 받아 판정 → 승인 → 스냅샷 → 실행 → 감사까지 진행하는 상태 머신.
//
// [상태 전이]
//   RECEIVED → PARSED → DRYRUN_DONE → RISK_ASSESSED
//            → { AUTO_APPROVED | PENDING_APPROVAL | BLOCKED }
//            → { SNAPSHOTTED | SKIPPED_SNAPSHOT } → EXECUTED → AUDITED → DONE
//   ABORTED 는 PARSED(드라이런 실패) 또는 RISK_ASSESSED 이후에서 도달한다.
//   허용 목록(is_allowed_transition)에 없는 전이는 GateError{kInternal}.
//
// [결정 경로]
//   LOW               : AUTO_APPROVED → SKIPPED_SNAPSHOT → 실행
//   MEDIUM / HIGH     : PENDING_APPROVAL → (yes) SNAPSHOTTED → 실행
//                                        (no/timeout/cancel) ABORTED
//   CRITICAL          : BLOCKED. elevated override 가 있으면 HIGH 와 같은 경로.
//   파싱 실패         : RECEIVED → RISK_ASSESSED → BLOCKED (override 무시)
//
// [불변식]
// - 실행은 최대 한 번, 재시도 없음. 실행 실패도 EXECUTED(execution=FAILED) 로 끝난다.
// - 모든 종료 경로에서 감사 레코드를 정확히 한 번 append 한다.
// - 스냅샷 + 실행 구간 동안 대상 테이블 락을 보유한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "audit/audit_record.hpp"
#include "common/types.hpp"

class Approver;
class AuditLog;
class GateStatsCollector;
class SnapshotManager;
class StatementEvaluator;
class StatementExecutor;
class StructuredLogger;
class TableLockManager;

enum class GateState : std::uint8_t {
    kReceived        = 0,
    kParsed          = 1,
    kDryRunDone      = 2,
    kRiskAssessed    = 3,
    kAutoApproved    = 4,
    kPendingApproval = 5,
    kBlocked         = 6,
    kSnapshotted     = 7,
    kSkippedSnapshot = 8,
    kExecuted        = 9,
    kAborted         = 10,
    kAudited         = 11,
    kDone            = 12,
};

[[nodiscard]] const char* gate_state_to_string(GateState state) noexcept;

[[nodiscard]] bool is_allowed_transition(GateState from, GateState to) noexcept;

struct GateTimeouts {
    std::chrono::milliseconds approval{std::chrono::seconds{300}};
    std::chrono::milliseconds lock{std::chrono::seconds{30}};
};

// ---------------------------------------------------------------------------
// SubmitOptions
//   elevated_override : CRITICAL 구문을 승인 경로로 보낼 권한 부여 (감사 기록됨)
//   stop              : 승인 전 / 스냅샷 전 / 실행 전에 확인하는 취소 신호
// ---------------------------------------------------------------------------
struct SubmitOptions {
    std::optional<ElevatedOverride> elevated_override{};
    std::stop_token                 stop{};
};

class ApprovalGate {
public:
    ApprovalGate(const StatementEvaluator&           evaluator,
                 Approver&                           approver,
                 TableLockManager&                   locks,
                 SnapshotManager&                    snapshots,
                 StatementExecutor&                  executor,
                 AuditLog&                           audit,
                 std::shared_ptr<StructuredLogger>   logger,
                 std::shared_ptr<GateStatsCollector> stats,
                 GateTimeouts                        timeouts = {});

    ApprovalGate(const ApprovalGate&)            = delete;
    ApprovalGate& operator=(const ApprovalGate&) = delete;

    // submit
    //   구문 하나를 끝까지 처리하고 기록된 감사 레코드를 반환한다.
    //   BLOCKED/ABORTED/실행 실패도 정상 반환(레코드의 final_status 로 구분).
    //   오류 반환은 감사 기록 실패(kAuditWriteFailed) 또는 내부 오류(kInternal) 뿐이다.
    [[nodiscard]] std::expected<AuditRecord, GateError> submit(std::string_view     sql,
                                                               const SubmitOptions& options = {});

private:
    class Run;

    const StatementEvaluator&           evaluator_;
    Approver&                           approver_;
    TableLockManager&                   locks_;
    SnapshotManager&                    snapshots_;
    StatementExecutor&                  executor_;
    AuditLog&                           audit_;
    std::shared_ptr<StructuredLogger>   logger_;
    std::shared_ptr<GateStatsCollector> stats_;
    GateTimeouts                        timeouts_;
};
