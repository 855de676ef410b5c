#include "rollback/rollback_service.hpp"

#include "audit/audit_log.hpp"
#include "common/fingerprint.hpp"
#include "lock/table_lock_manager.hpp"
#include "logger/structured_logger.hpp"
#include "snapshot/snapshot_manager.hpp"
#include "stats/stats_collector.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

RollbackService::RollbackService(SnapshotManager&                    snapshots,
                                 TableLockManager&                   locks,
                                 AuditLog&                           audit,
                                 std::shared_ptr<StructuredLogger>   logger,
                                 std::shared_ptr<GateStatsCollector> stats) noexcept
    : snapshots_{snapshots}
    , locks_{locks}
    , audit_{audit}
    , logger_{std::move(logger)}
    , stats_{std::move(stats)}
{}

std::expected<AuditRecord, GateError> RollbackService::rollback(const std::string& snapshot_id,
                                                                const std::string& approved_by) {
    auto ref = snapshots_.find(snapshot_id);
    if (!ref) {
        return std::unexpected(ref.error());
    }

    AuditRecord rec;
    rec.run_id      = make_run_id();
    rec.timestamp   = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    rec.kind        = RecordKind::kRollback;
    rec.sql         = fmt::format("ROLLBACK TO SNAPSHOT {}", ref->id);
    rec.fingerprint = fingerprint(rec.sql);
    // 복원은 데이터를 되돌리는 쓰기이므로 HIGH 로 기록한다.
    rec.risk = RiskAssessment{
        .level   = RiskLevel::kHigh,
        .matches = {RiskMatch{"rollback", fmt::format("restores {} table(s) from {}",
                                                      ref->tables.size(), ref->id)}},
    };
    rec.approval    = ApprovalDecision::kApproved;
    rec.approved_by = approved_by;
    rec.snapshot    = *ref;

    spdlog::info("rollback: {} restoring {} approved_by={}", rec.run_id, ref->id, approved_by);

    {
        auto guard    = locks_.acquire(ref->tables);
        auto restored = snapshots_.restore(*ref);
        // 게이트와 같은 규칙: 복원을 시도했으면 결과와 무관하게 EXECUTED, 실패는 execution 에 남긴다.
        rec.final_status = FinalStatus::kExecuted;
        rec.transitions  = {"RECEIVED", "APPROVED", "RESTORED", "AUDITED", "DONE"};
        if (restored) {
            rec.execution = ExecutionOutcome{ExecutionStatus::kSuccess, 0, {}};
        } else {
            spdlog::error("rollback: {} restore of {} failed: {}",
                          rec.run_id, ref->id, restored.error().message);
            rec.execution = ExecutionOutcome{ExecutionStatus::kFailed, 0, restored.error().message};
        }
    }

    if (auto appended = audit_.append(rec); !appended) {
        spdlog::error("rollback: audit append failed for {}: {}", rec.run_id, appended.error().message);
        return std::unexpected(GateError{GateErrorCode::kAuditWriteFailed, appended.error().message});
    }

    if (rec.execution.status == ExecutionStatus::kSuccess) {
        stats_->on_rollback();
        logger_->log_snapshot(SnapshotLog{
            .event       = "snapshot_restored",
            .snapshot_id = ref->id,
            .run_id      = rec.run_id,
            .strategy    = snapshot_strategy_to_string(ref->strategy),
            .tables      = ref->tables,
            .timestamp   = rec.timestamp,
        });
    }
    return rec;
}
