#pragma once

// ---------------------------------------------------------------------------
// runtime.hpp
//
// GateConfig 로부터 게이트 구성요소 전체를 만들고 소유한다.
// CLI(dbsafe, dbsafe-rollback) 와 통합 테스트가 같은 배선을 사용한다.
//
// [생성 순서]
//   logger → stats → database → registry/classifier → parser/estimator
//   → snapshot manager → locks → audit log → approver → gate/replay/rollback
// 소멸은 역순이며, 참조로 연결된 구성요소는 모두 이 객체가 수명을 보장한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <iosfwd>
#include <memory>

#include "common/types.hpp"
#include "config/gate_config.hpp"

class ApprovalBroker;
class ApprovalGate;
class Approver;
class AuditLog;
class Database;
class DryRunEstimator;
class GateStatsCollector;
class ReplayEngine;
class RollbackService;
class RiskClassifier;
class SnapshotManager;
class SqlParser;
class StatementEvaluator;
class StatementExecutor;
class StructuredLogger;
class TableLockManager;

// ---------------------------------------------------------------------------
// ApproverMode
//   kConsole   : 터미널에서 y/N 입력 (stdin poll + timeout)
//   kAlwaysYes : --yes
//   kAlwaysNo  : --no
//   kSocket    : ApprovalBroker, 승인 소켓의 approve/deny 명령으로 결정
// ---------------------------------------------------------------------------
enum class ApproverMode : std::uint8_t {
    kConsole   = 0,
    kAlwaysYes = 1,
    kAlwaysNo  = 2,
    kSocket    = 3,
};

struct RuntimeOptions {
    ApproverMode approver{ApproverMode::kConsole};
    bool         log_to_stdout{false};
};

class Runtime {
public:
    // create
    //   DB 연결 실패, 스냅샷 전략 불가, 감사 로그 열기 실패 → GateError.
    //   로거 초기화 실패도 GateError{kInvalidConfig} 로 변환한다.
    [[nodiscard]] static std::expected<std::unique_ptr<Runtime>, GateError>
    create(const GateConfig& config, const RuntimeOptions& options = {}, std::ostream* prompt = nullptr);

    ~Runtime();

    Runtime(const Runtime&)            = delete;
    Runtime& operator=(const Runtime&) = delete;

    [[nodiscard]] ApprovalGate&       gate() noexcept { return *gate_; }
    [[nodiscard]] ReplayEngine&       replay() noexcept { return *replay_; }
    [[nodiscard]] RollbackService&    rollback() noexcept { return *rollback_; }
    [[nodiscard]] SnapshotManager&    snapshots() noexcept { return *snapshots_; }
    [[nodiscard]] AuditLog&           audit() noexcept { return *audit_; }
    [[nodiscard]] Database&           database() noexcept { return *db_; }
    [[nodiscard]] const GateConfig&   config() const noexcept { return config_; }

    [[nodiscard]] std::shared_ptr<GateStatsCollector> stats() const noexcept { return stats_; }
    [[nodiscard]] std::shared_ptr<StructuredLogger>   logger() const noexcept { return logger_; }

    // ApproverMode::kSocket 일 때만 non-null.
    [[nodiscard]] std::shared_ptr<ApprovalBroker> broker() const noexcept { return broker_; }

private:
    explicit Runtime(GateConfig config);

    GateConfig                          config_;
    std::shared_ptr<StructuredLogger>   logger_;
    std::shared_ptr<GateStatsCollector> stats_;
    std::unique_ptr<Database>           db_;
    std::unique_ptr<RiskClassifier>     classifier_;
    std::unique_ptr<SqlParser>          parser_;
    std::unique_ptr<DryRunEstimator>    estimator_;
    std::unique_ptr<StatementEvaluator> evaluator_;
    std::unique_ptr<SnapshotManager>    snapshots_;
    std::unique_ptr<TableLockManager>   locks_;
    std::unique_ptr<AuditLog>           audit_;
    std::unique_ptr<StatementExecutor>  executor_;
    std::shared_ptr<ApprovalBroker>     broker_;
    std::unique_ptr<Approver>           owned_approver_;
    Approver*                           approver_{nullptr};
    std::unique_ptr<ApprovalGate>       gate_;
    std::unique_ptr<ReplayEngine>       replay_;
    std::unique_ptr<RollbackService>    rollback_;
};
