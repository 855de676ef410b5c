// ---------------------------------------------------------------------------
// approval_gate.cpp
//
// 흐름:
//   1. run_id 발급, stats_.on_run_started()
//   2. StatementEvaluator::evaluate() (파싱 / 구조 분류 / 드라이런 / 최종 분류)
//   3. 위험도 분기 (AUTO_APPROVED / PENDING_APPROVAL / BLOCKED)
//   4. 테이블 락 → 스냅샷 (MEDIUM 이상) → 실행 1회
//   5. 감사 레코드 append → 구조화 로그 → stats 종료 카운터
// ---------------------------------------------------------------------------

#include "gate/approval_gate.hpp"

#include "approval/approver.hpp"
#include "audit/audit_log.hpp"
#include "common/fingerprint.hpp"
#include "db/statement_executor.hpp"
#include "gate/statement_evaluator.hpp"
#include "lock/table_lock_manager.hpp"
#include "logger/structured_logger.hpp"
#include "snapshot/snapshot_manager.hpp"
#include "stats/stats_collector.hpp"

#include <array>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

using State = GateState;

struct Edge {
    State from;
    State to;
};

// 허용 전이 목록. 이 표에 없는 전이는 프로그래밍 오류다.
constexpr std::array kAllowedEdges{
    Edge{State::kReceived,        State::kParsed},
    Edge{State::kReceived,        State::kRiskAssessed},     // 파싱 실패
    Edge{State::kParsed,          State::kDryRunDone},
    Edge{State::kParsed,          State::kRiskAssessed},     // 구조적 CRITICAL, 드라이런 생략
    Edge{State::kParsed,          State::kAborted},          // 드라이런 실패
    Edge{State::kDryRunDone,      State::kRiskAssessed},
    Edge{State::kRiskAssessed,    State::kAutoApproved},
    Edge{State::kRiskAssessed,    State::kPendingApproval},
    Edge{State::kRiskAssessed,    State::kBlocked},
    Edge{State::kRiskAssessed,    State::kAborted},          // 승인 전 취소
    Edge{State::kAutoApproved,    State::kSkippedSnapshot},
    Edge{State::kAutoApproved,    State::kAborted},
    Edge{State::kPendingApproval, State::kSnapshotted},
    Edge{State::kPendingApproval, State::kAborted},
    Edge{State::kSnapshotted,     State::kExecuted},
    Edge{State::kSnapshotted,     State::kAborted},
    Edge{State::kSkippedSnapshot, State::kExecuted},
    Edge{State::kSkippedSnapshot, State::kAborted},
    Edge{State::kExecuted,        State::kAudited},
    Edge{State::kBlocked,         State::kAudited},
    Edge{State::kAborted,         State::kAudited},
    Edge{State::kAudited,         State::kDone},
};

std::string join_rule_ids(const RiskAssessment& risk) {
    std::string out;
    for (const auto& match : risk.matches) {
        if (!out.empty()) {
            out += ',';
        }
        out += match.rule_id;
    }
    return out;
}

}  // namespace

const char* gate_state_to_string(GateState state) noexcept {
    switch (state) {
        case GateState::kReceived:        return "RECEIVED";
        case GateState::kParsed:          return "PARSED";
        case GateState::kDryRunDone:      return "DRYRUN_DONE";
        case GateState::kRiskAssessed:    return "RISK_ASSESSED";
        case GateState::kAutoApproved:    return "AUTO_APPROVED";
        case GateState::kPendingApproval: return "PENDING_APPROVAL";
        case GateState::kBlocked:         return "BLOCKED";
        case GateState::kSnapshotted:     return "SNAPSHOTTED";
        case GateState::kSkippedSnapshot: return "SKIPPED_SNAPSHOT";
        case GateState::kExecuted:        return "EXECUTED";
        case GateState::kAborted:         return "ABORTED";
        case GateState::kAudited:         return "AUDITED";
        case GateState::kDone:            return "DONE";
    }
    return "UNKNOWN";
}

bool is_allowed_transition(GateState from, GateState to) noexcept {
    for (const auto& edge : kAllowedEdges) {
        if (edge.from == from && edge.to == to) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// ApprovalGate::Run
//   실행 단위 하나의 상태와 누적 중인 감사 레코드.
// ---------------------------------------------------------------------------
class ApprovalGate::Run {
public:
    explicit Run(std::string_view sql) {
        record.run_id      = make_run_id();
        record.timestamp   = std::chrono::time_point_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now());
        record.kind        = RecordKind::kStatement;
        record.sql         = std::string(sql);
        record.fingerprint = fingerprint(sql);
        record.transitions.emplace_back(gate_state_to_string(GateState::kReceived));
    }

    [[nodiscard]] std::expected<void, GateError> advance(GateState next) {
        if (!is_allowed_transition(state_, next)) {
            return std::unexpected(GateError{
                GateErrorCode::kInternal,
                fmt::format("invalid gate transition {} -> {} (run {})",
                            gate_state_to_string(state_), gate_state_to_string(next), record.run_id)
            });
        }
        state_ = next;
        record.transitions.emplace_back(gate_state_to_string(next));
        return {};
    }

    // 종료 상태로 이동하면서 최종 상태/사유를 함께 기록한다.
    [[nodiscard]] std::expected<void, GateError> abort(AbortReason reason) {
        record.final_status = FinalStatus::kAborted;
        record.abort_reason = reason;
        return advance(GateState::kAborted);
    }

    [[nodiscard]] std::expected<void, GateError> block() {
        record.final_status = FinalStatus::kBlocked;
        return advance(GateState::kBlocked);
    }

    [[nodiscard]] GateState state() const noexcept { return state_; }

    AuditRecord                                 record;
    const std::chrono::steady_clock::time_point started{std::chrono::steady_clock::now()};

private:
    GateState state_{GateState::kReceived};
};

// ---------------------------------------------------------------------------
// ApprovalGate 생성자
// ---------------------------------------------------------------------------
ApprovalGate::ApprovalGate(const StatementEvaluator&           evaluator,
                           Approver&                           approver,
                           TableLockManager&                   locks,
                           SnapshotManager&                    snapshots,
                           StatementExecutor&                  executor,
                           AuditLog&                           audit,
                           std::shared_ptr<StructuredLogger>   logger,
                           std::shared_ptr<GateStatsCollector> stats,
                           GateTimeouts                        timeouts)
    : evaluator_{evaluator}
    , approver_{approver}
    , locks_{locks}
    , snapshots_{snapshots}
    , executor_{executor}
    , audit_{audit}
    , logger_{std::move(logger)}
    , stats_{std::move(stats)}
    , timeouts_{timeouts}
{}

// ---------------------------------------------------------------------------
// submit
// ---------------------------------------------------------------------------
std::expected<AuditRecord, GateError> ApprovalGate::submit(std::string_view     sql,
                                                           const SubmitOptions& options) {
    stats_->on_run_started();
    Run run(sql);
    auto& rec = run.record;

    // 종료 처리: AUDITED → DONE, 감사 append, 로그, 카운터.
    auto finish = [&]() -> std::expected<AuditRecord, GateError> {
        if (auto ok = run.advance(GateState::kAudited); !ok) {
            return std::unexpected(ok.error());
        }
        if (auto ok = run.advance(GateState::kDone); !ok) {
            return std::unexpected(ok.error());
        }

        if (auto appended = audit_.append(rec); !appended) {
            spdlog::error("gate: audit append failed for {}: {}", rec.run_id, appended.error().message);
            logger_->error(fmt::format("audit append failed for {}: {}", rec.run_id, appended.error().message));
            return std::unexpected(GateError{GateErrorCode::kAuditWriteFailed, appended.error().message});
        }

        switch (rec.final_status) {
            case FinalStatus::kExecuted:
                stats_->on_executed(rec.execution.status == ExecutionStatus::kFailed);
                break;
            case FinalStatus::kBlocked:
                stats_->on_blocked();
                logger_->log_block(BlockLog{
                    .run_id       = rec.run_id,
                    .sql          = rec.sql,
                    .matched_rule = join_rule_ids(rec.risk),
                    .reason       = rec.risk.matches.empty() ? std::string{}
                                                             : rec.risk.matches.back().rationale,
                    .timestamp    = rec.timestamp,
                });
                break;
            case FinalStatus::kAborted:
                stats_->on_aborted();
                break;
        }

        logger_->log_run(RunLog{
            .run_id            = rec.run_id,
            .risk_level        = risk_level_to_string(rec.risk.level),
            .approval_decision = approval_decision_to_string(rec.approval),
            .final_status      = final_status_to_string(rec.final_status),
            .abort_reason      = abort_reason_to_string(rec.abort_reason),
            .affected_rows     = rec.execution.affected_rows,
            .timestamp         = rec.timestamp,
            .duration          = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - run.started),
        });
        return rec;
    };

    // -----------------------------------------------------------------------
    // 1. 판정 단계
    // -----------------------------------------------------------------------
    const auto eval = evaluator_.evaluate(sql, options.elevated_override.has_value());
    rec.risk          = eval.risk;
    rec.dry_run       = eval.dry_run;
    rec.dry_run_error = eval.dry_run_error;

    if (eval.parse_error) {
        // 분석 불가 구문에는 override 를 적용하지 않는다.
        spdlog::warn("gate: {} parse error: {}", rec.run_id, eval.parse_error->message);
        if (auto ok = run.advance(GateState::kRiskAssessed); !ok) {
            return std::unexpected(ok.error());
        }
        if (auto ok = run.block(); !ok) {
            return std::unexpected(ok.error());
        }
        return finish();
    }

    rec.elevated_override = options.elevated_override;

    if (auto ok = run.advance(GateState::kParsed); !ok) {
        return std::unexpected(ok.error());
    }

    if (eval.dry_run_failed()) {
        if (auto ok = run.abort(AbortReason::kDryRunFailed); !ok) {
            return std::unexpected(ok.error());
        }
        return finish();
    }

    if (eval.dry_run) {
        if (auto ok = run.advance(GateState::kDryRunDone); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (auto ok = run.advance(GateState::kRiskAssessed); !ok) {
        return std::unexpected(ok.error());
    }

    spdlog::info("gate: {} risk={} rules=[{}]",
                 rec.run_id, risk_level_to_string(rec.risk.level), join_rule_ids(rec.risk));

    // -----------------------------------------------------------------------
    // 2. 위험도 분기
    // -----------------------------------------------------------------------
    if (rec.risk.level == RiskLevel::kCritical && !options.elevated_override) {
        if (auto ok = run.block(); !ok) {
            return std::unexpected(ok.error());
        }
        return finish();
    }
    if (rec.risk.level == RiskLevel::kCritical) {
        spdlog::warn("gate: {} CRITICAL overridden by '{}': {}", rec.run_id,
                     options.elevated_override->authorized_by, options.elevated_override->reason);
    }

    if (options.stop.stop_requested()) {
        if (auto ok = run.abort(AbortReason::kCancelled); !ok) {
            return std::unexpected(ok.error());
        }
        return finish();
    }

    const bool needs_approval = rec.risk.level != RiskLevel::kLow;
    if (!needs_approval) {
        rec.approval = ApprovalDecision::kAuto;
        if (auto ok = run.advance(GateState::kAutoApproved); !ok) {
            return std::unexpected(ok.error());
        }
    } else {
        if (auto ok = run.advance(GateState::kPendingApproval); !ok) {
            return std::unexpected(ok.error());
        }

        stats_->on_approval_wait_begin();
        const auto verdict = approver_.request_approval(
            ApprovalRequest{
                .run_id  = rec.run_id,
                .sql     = rec.sql,
                .risk    = rec.risk,
                .dry_run = rec.dry_run,
            },
            timeouts_.approval, options.stop);
        stats_->on_approval_wait_end();

        spdlog::info("gate: {} approval verdict={}", rec.run_id, approval_verdict_to_string(verdict));

        std::optional<AbortReason> refused;
        switch (verdict) {
            case ApprovalVerdict::kYes:
                rec.approval = ApprovalDecision::kApproved;
                break;
            case ApprovalVerdict::kNo:
                rec.approval = ApprovalDecision::kDenied;
                refused      = AbortReason::kDenied;
                break;
            case ApprovalVerdict::kTimeout:
                rec.approval = ApprovalDecision::kTimedOut;
                refused      = AbortReason::kTimeout;
                break;
            case ApprovalVerdict::kCancelled:
                refused = AbortReason::kCancelled;
                break;
        }
        if (refused) {
            if (auto ok = run.abort(*refused); !ok) {
                return std::unexpected(ok.error());
            }
            return finish();
        }
    }

    // -----------------------------------------------------------------------
    // 3. 락 → 스냅샷 → 실행
    //    락은 이 블록 끝에서 해제된다 (감사 기록은 락 밖).
    // -----------------------------------------------------------------------
    {
        const auto& tables = eval.parsed->tables;
        auto guard = locks_.try_acquire_for(tables, timeouts_.lock);
        if (!guard) {
            spdlog::warn("gate: {} could not lock tables within {}ms",
                         rec.run_id, timeouts_.lock.count());
            if (auto ok = run.abort(AbortReason::kLockFailed); !ok) {
                return std::unexpected(ok.error());
            }
            return finish();
        }

        if (options.stop.stop_requested()) {
            if (auto ok = run.abort(AbortReason::kCancelled); !ok) {
                return std::unexpected(ok.error());
            }
            return finish();
        }

        if (!needs_approval) {
            if (auto ok = run.advance(GateState::kSkippedSnapshot); !ok) {
                return std::unexpected(ok.error());
            }
        } else {
            // CREATE 대상만 아직 없어도 된다.
            std::vector<std::string> creatable;
            if (eval.parsed->command == SqlCommand::kCreate && !eval.parsed->target_table.empty()) {
                creatable.push_back(eval.parsed->target_table);
            }
            auto snap = snapshots_.snapshot(tables, creatable);
            if (!snap) {
                spdlog::error("gate: {} snapshot failed: {}", rec.run_id, snap.error().message);
                if (auto ok = run.abort(AbortReason::kSnapshotFailed); !ok) {
                    return std::unexpected(ok.error());
                }
                return finish();
            }
            rec.snapshot = *snap;
            stats_->on_snapshot();
            logger_->log_snapshot(SnapshotLog{
                .event       = "snapshot_created",
                .snapshot_id = snap->id,
                .run_id      = rec.run_id,
                .strategy    = snapshot_strategy_to_string(snap->strategy),
                .tables      = snap->tables,
                .timestamp   = snap->created_at,
            });
            if (auto ok = run.advance(GateState::kSnapshotted); !ok) {
                return std::unexpected(ok.error());
            }
        }

        // 스냅샷 이후 취소: 스냅샷은 보존하고 중단한다.
        if (options.stop.stop_requested()) {
            if (auto ok = run.abort(AbortReason::kCancelled); !ok) {
                return std::unexpected(ok.error());
            }
            return finish();
        }

        auto executed = executor_.execute(rec.sql);
        if (executed) {
            rec.execution = ExecutionOutcome{
                .status        = ExecutionStatus::kSuccess,
                .affected_rows = *executed,
                .error         = {},
            };
        } else {
            spdlog::error("gate: {} execution failed: {}", rec.run_id, executed.error().message);
            rec.execution = ExecutionOutcome{
                .status        = ExecutionStatus::kFailed,
                .affected_rows = 0,
                .error         = executed.error().message,
            };
        }
        rec.final_status = FinalStatus::kExecuted;
        if (auto ok = run.advance(GateState::kExecuted); !ok) {
            return std::unexpected(ok.error());
        }
    }

    return finish();
}
