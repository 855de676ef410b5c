#include "app/runtime.hpp"

#include "approval/approval_broker.hpp"
#include "approval/approver.hpp"
#include "audit/audit_log.hpp"
#include "db/pg_database.hpp"
#include "db/sqlite_database.hpp"
#include "db/statement_executor.hpp"
#include "dryrun/dry_run_estimator.hpp"
#include "gate/approval_gate.hpp"
#include "gate/statement_evaluator.hpp"
#include "lock/table_lock_manager.hpp"
#include "logger/structured_logger.hpp"
#include "parser/sql_parser.hpp"
#include "replay/replay_engine.hpp"
#include "risk/risk_classifier.hpp"
#include "rollback/rollback_service.hpp"
#include "snapshot/snapshot_manager.hpp"
#include "stats/stats_collector.hpp"

#include <iostream>
#include <stdexcept>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::expected<std::unique_ptr<Database>, GateError> open_database(const DatabaseConfig& cfg) {
    if (cfg.backend == Backend::kPostgres) {
        if (cfg.url.empty()) {
            return std::unexpected(GateError{
                GateErrorCode::kInvalidConfig,
                "database.url (or DATABASE_URL) is required for the postgres backend"
            });
        }
        auto pg = PgDatabase::connect(cfg.url);
        if (!pg) {
            return std::unexpected(pg.error());
        }
        return std::unique_ptr<Database>(std::move(*pg));
    }

    if (cfg.path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(cfg.path.parent_path(), ec);
    }
    auto sqlite = SqliteDatabase::open(cfg.path);
    if (!sqlite) {
        return std::unexpected(sqlite.error());
    }
    return std::unique_ptr<Database>(std::move(*sqlite));
}

}  // namespace

Runtime::Runtime(GateConfig config)
    : config_{std::move(config)}
{}

Runtime::~Runtime() = default;

// ---------------------------------------------------------------------------
// Runtime::create
// ---------------------------------------------------------------------------
std::expected<std::unique_ptr<Runtime>, GateError>
Runtime::create(const GateConfig& config, const RuntimeOptions& options, std::ostream* prompt) {
    std::unique_ptr<Runtime> rt(new Runtime(config));

    // -----------------------------------------------------------------------
    // 1. logger / stats
    // -----------------------------------------------------------------------
    const auto level = log_level_from_string(config.global.log_level).value_or(LogLevel::kInfo);
    try {
        rt->logger_ = std::make_shared<StructuredLogger>(level, config.global.log_path, options.log_to_stdout);
    } catch (const std::runtime_error& e) {
        return std::unexpected(GateError{GateErrorCode::kInvalidConfig, e.what()});
    }
    rt->stats_ = std::make_shared<GateStatsCollector>();

    // -----------------------------------------------------------------------
    // 2. database
    // -----------------------------------------------------------------------
    auto db = open_database(config.database);
    if (!db) {
        spdlog::error("runtime: database open failed: {}", db.error().message);
        return std::unexpected(db.error());
    }
    rt->db_ = std::move(*db);

    // -----------------------------------------------------------------------
    // 3. 판정 구성요소
    // -----------------------------------------------------------------------
    rt->classifier_ = std::make_unique<RiskClassifier>(config.make_registry(), config.gate.thresholds);
    rt->parser_     = std::make_unique<SqlParser>();
    rt->estimator_  = std::make_unique<DryRunEstimator>(*rt->db_);
    rt->evaluator_  = std::make_unique<StatementEvaluator>(*rt->parser_, *rt->classifier_, *rt->estimator_);

    // -----------------------------------------------------------------------
    // 4. snapshot / locks / audit / executor
    // -----------------------------------------------------------------------
    auto snapshots = SnapshotManager::create(*rt->db_, config.snapshot.dir, config.snapshot.strategy);
    if (!snapshots) {
        spdlog::error("runtime: snapshot manager: {}", snapshots.error().message);
        return std::unexpected(snapshots.error());
    }
    rt->snapshots_ = std::move(*snapshots);
    rt->locks_     = std::make_unique<TableLockManager>();

    auto audit = FileAuditLog::open(config.audit.path);
    if (!audit) {
        spdlog::error("runtime: audit log: {}", audit.error().message);
        return std::unexpected(audit.error());
    }
    rt->audit_    = std::move(*audit);
    rt->executor_ = std::make_unique<DatabaseExecutor>(*rt->db_);

    // -----------------------------------------------------------------------
    // 5. approver
    // -----------------------------------------------------------------------
    switch (options.approver) {
        case ApproverMode::kConsole:
            rt->owned_approver_ = std::make_unique<ConsoleApprover>(
                STDIN_FILENO, prompt != nullptr ? *prompt : std::cerr);
            rt->approver_ = rt->owned_approver_.get();
            break;
        case ApproverMode::kAlwaysYes:
            rt->owned_approver_ = std::make_unique<FixedApprover>(ApprovalVerdict::kYes);
            rt->approver_ = rt->owned_approver_.get();
            break;
        case ApproverMode::kAlwaysNo:
            rt->owned_approver_ = std::make_unique<FixedApprover>(ApprovalVerdict::kNo);
            rt->approver_ = rt->owned_approver_.get();
            break;
        case ApproverMode::kSocket:
            rt->broker_   = std::make_shared<ApprovalBroker>();
            rt->approver_ = rt->broker_.get();
            break;
    }

    // -----------------------------------------------------------------------
    // 6. gate / replay / rollback
    // -----------------------------------------------------------------------
    rt->gate_ = std::make_unique<ApprovalGate>(
        *rt->evaluator_, *rt->approver_, *rt->locks_, *rt->snapshots_, *rt->executor_,
        *rt->audit_, rt->logger_, rt->stats_,
        GateTimeouts{.approval = config.gate.approval_timeout, .lock = std::chrono::seconds{30}});
    rt->replay_   = std::make_unique<ReplayEngine>(*rt->audit_, *rt->evaluator_);
    rt->rollback_ = std::make_unique<RollbackService>(*rt->snapshots_, *rt->locks_, *rt->audit_,
                                                      rt->logger_, rt->stats_);

    spdlog::info("runtime: ready (backend={}, protected_tables={}, snapshot={})",
                 backend_to_string(rt->db_->backend()), config.protected_tables.size(),
                 snapshot_strategy_to_string(rt->snapshots_->active_strategy()));
    return rt;
}
