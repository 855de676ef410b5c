#pragma once

// ---------------------------------------------------------------------------
// rollback_service.hpp
//
// 스냅샷 id 로 대상 테이블을 복원하고, 그 자체를 감사 레코드(kind=rollback)로 남긴다.
//
// [규칙]
// - 원래 SQL 은 다시 실행하지 않는다. 복원은 스냅샷 내용으로만 이루어진다.
// - 알 수 없는 id 는 GateError{kNotFound} 이며 감사 레코드를 만들지 않는다.
// - 복원 중에는 스냅샷 테이블 전체에 테이블 락을 보유한다.
// - 복원 실패: 게이트의 실행 실패와 같이 final_status=EXECUTED, execution.status=FAILED.
// - 승인자는 approved_by 에 기록한다. elevated_override 는 쓰지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <string>

#include "audit/audit_record.hpp"
#include "common/types.hpp"

class AuditLog;
class GateStatsCollector;
class SnapshotManager;
class StructuredLogger;
class TableLockManager;

class RollbackService {
public:
    RollbackService(SnapshotManager&                    snapshots,
                    TableLockManager&                   locks,
                    AuditLog&                           audit,
                    std::shared_ptr<StructuredLogger>   logger,
                    std::shared_ptr<GateStatsCollector> stats) noexcept;

    // rollback
    //   approved_by: 복원을 승인한 주체 (감사 레코드의 approved_by)
    //   반환: 기록된 감사 레코드. 복원 실패도 레코드로 반환한다.
    [[nodiscard]] std::expected<AuditRecord, GateError> rollback(const std::string& snapshot_id,
                                                                 const std::string& approved_by);

private:
    SnapshotManager&                    snapshots_;
    TableLockManager&                   locks_;
    AuditLog&                           audit_;
    std::shared_ptr<StructuredLogger>   logger_;
    std::shared_ptr<GateStatsCollector> stats_;
};
