// ---------------------------------------------------------------------------
// test_approval_gate.cpp
//
// ApprovalGate 시나리오 테스트.
// 실제 파서/분류기/드라이런/스냅샷/감사 로그를 임시 SQLite DB 위에 조립하고,
// 승인자와 실행기만 테스트용 구현으로 바꿔 끼운다.
//
// [시나리오]
// - LOW 조회          : 자동 승인, 스냅샷 없음, 실행
// - HIGH 대량 삭제    : 승인 → 스냅샷 → 실행, 영향 행 수 기록
// - CRITICAL          : 차단, 드라이런/실행 없음
// - 거부 / 시간 초과 / 취소 : ABORTED, 실행 없음
// - 파싱 실패         : override 가 있어도 차단
// - 드라이런 실패     : ABORTED(DRY_RUN_FAILED)
// - elevated override : CRITICAL 을 승인 경로로 보냄
// - 실행 실패         : EXECUTED + execution=FAILED, 재시도 없음
// - 락 시간 초과 / 감사 기록 실패
// - 스냅샷 이후 취소     : ABORTED(CANCELLED), 스냅샷은 레코드와 카탈로그에 남음
// - 겹치는 테이블 동시 제출 : 스냅샷 + 실행 구간이 섞이지 않음
// ---------------------------------------------------------------------------

#include "approval/approver.hpp"
#include "audit/audit_log.hpp"
#include "db/sqlite_database.hpp"
#include "db/statement_executor.hpp"
#include "dryrun/dry_run_estimator.hpp"
#include "gate/approval_gate.hpp"
#include "gate/statement_evaluator.hpp"
#include "lock/table_lock_manager.hpp"
#include "logger/structured_logger.hpp"
#include "parser/sql_parser.hpp"
#include "risk/risk_classifier.hpp"
#include "snapshot/snapshot_manager.hpp"
#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

const std::string kOldVisits = "DELETE FROM visits WHERE visited_at < '2020-01-01'";

// 정해진 답을 돌려주고 받은 요청을 기록한다.
class ScriptedApprover final : public Approver {
public:
    explicit ScriptedApprover(ApprovalVerdict verdict) : verdict_(verdict) {}

    ApprovalVerdict request_approval(const ApprovalRequest& request,
                                     std::chrono::milliseconds /*timeout*/,
                                     std::stop_token /*stop*/) override {
        requests.push_back(request);
        return verdict_;
    }

    std::vector<ApprovalRequest> requests;

private:
    ApprovalVerdict verdict_;
};

// 실제 실행기를 감싸 호출 횟수를 센다. fail 이면 DB 에 닿지 않고 실패한다.
class RecordingExecutor final : public StatementExecutor {
public:
    RecordingExecutor(StatementExecutor& inner, bool fail) : inner_(inner), fail_(fail) {}

    std::expected<std::uint64_t, GateError> execute(std::string_view sql) override {
        executed.emplace_back(sql);
        if (fail_) {
            return std::unexpected(GateError{GateErrorCode::kExecutionFailed, "disk I/O error"});
        }
        return inner_.execute(sql);
    }

    std::vector<std::string> executed;

private:
    StatementExecutor& inner_;
    bool               fail_;
};

// 실행 구간에 머무는 동안 다른 실행 단위가 실행하거나 스냅샷을 만들면 overlapped.
class OverlapCheckingExecutor final : public StatementExecutor {
public:
    OverlapCheckingExecutor(StatementExecutor& inner, const SnapshotManager& snapshots)
        : inner_(inner), snapshots_(snapshots) {}

    std::expected<std::uint64_t, GateError> execute(std::string_view sql) override {
        if (in_flight_.fetch_add(1) != 0) {
            overlapped = true;
        }
        const auto before = snapshots_.list().size();
        std::this_thread::sleep_for(100ms);
        auto res = inner_.execute(sql);
        if (snapshots_.list().size() != before) {
            overlapped = true;
        }
        in_flight_.fetch_sub(1);
        return res;
    }

    std::atomic<bool> overlapped{false};

private:
    StatementExecutor&     inner_;
    const SnapshotManager& snapshots_;
    std::atomic<int>       in_flight_{0};
};

// 같은 SQLite 연결로 전달하되, 스냅샷이 대상 테이블을 확인하는 순간 취소를 요청한다.
class CancelOnSnapshotDatabase final : public Database {
public:
    CancelOnSnapshotDatabase(SqliteDatabase& inner, std::stop_source& stop) : inner_(inner), stop_(stop) {}

    [[nodiscard]] Backend backend() const noexcept override { return Backend::kSqlite; }

    [[nodiscard]] std::expected<bool, GateError> table_exists(std::string_view table) override {
        stop_.request_stop();
        return inner_.table_exists(table);
    }

protected:
    [[nodiscard]] std::expected<QueryResult, GateError> run_locked(std::string_view sql) override {
        return inner_.run(sql);
    }

    [[nodiscard]] std::expected<void, GateError> open_read_only_locked() override {
        auto scope = inner_.begin_read_only();
        if (!scope) {
            return std::unexpected(scope.error());
        }
        scope_.emplace(std::move(*scope));
        return {};
    }

    void close_read_only_locked() noexcept override { scope_.reset(); }

private:
    SqliteDatabase&              inner_;
    std::stop_source&            stop_;
    std::optional<ReadOnlyScope> scope_;
};

class FailingAuditLog final : public AuditLog {
public:
    std::expected<void, GateError> append(const AuditRecord&) override {
        return std::unexpected(GateError{GateErrorCode::kAuditWriteFailed, "No space left on device"});
    }
    std::expected<AuditRecord, GateError> get(const std::string& run_id) const override {
        return std::unexpected(GateError{GateErrorCode::kNotFound, run_id});
    }
    std::expected<std::vector<AuditRecord>, GateError> query(const AuditQuery&) const override {
        return std::vector<AuditRecord>{};
    }
};

std::vector<std::string> states(std::initializer_list<const char*> names) {
    return {names.begin(), names.end()};
}

class ApprovalGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                (std::string("dbsafe_gate_") +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);

        auto db = SqliteDatabase::open(root_ / "app.db");
        ASSERT_TRUE(db.has_value()) << db.error().message;
        db_ = std::move(*db);

        exec("CREATE TABLE person (id INTEGER PRIMARY KEY, name TEXT)");
        exec("CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT)");
        exec("CREATE TABLE visits (id INTEGER PRIMARY KEY, person_id INTEGER, visited_at TEXT)");
        exec("INSERT INTO person (name) VALUES ('a'), ('b'), ('c'), ('d'), ('e')");
        exec("INSERT INTO users (name) VALUES ('alice'), ('bob'), ('carol')");
        // 3214 행은 2020 년 이전, 786 행은 이후
        exec("INSERT INTO visits (person_id, visited_at) "
             "WITH RECURSIVE n(i) AS (SELECT 1 UNION ALL SELECT i + 1 FROM n WHERE i < 4000) "
             "SELECT (i % 5) + 1, CASE WHEN i <= 3214 THEN '2019-06-01' ELSE '2021-06-01' END FROM n");

        ProtectedTableRegistry registry;
        registry.add("users");
        classifier_ = std::make_unique<RiskClassifier>(std::move(registry), RiskThresholds{100, 1000});
        estimator_  = std::make_unique<DryRunEstimator>(*db_);
        evaluator_  = std::make_unique<StatementEvaluator>(parser_, *classifier_, *estimator_);

        auto snapshots = SnapshotManager::create(*db_, root_ / "snapshots", std::nullopt);
        ASSERT_TRUE(snapshots.has_value()) << snapshots.error().message;
        snapshots_ = std::move(*snapshots);

        auto audit = FileAuditLog::open(root_ / "audit.ndjson");
        ASSERT_TRUE(audit.has_value()) << audit.error().message;
        audit_ = std::move(*audit);

        db_executor_ = std::make_unique<DatabaseExecutor>(*db_);
        logger_      = std::make_shared<StructuredLogger>(LogLevel::kDebug, root_ / "events.log", false);
        stats_       = std::make_shared<GateStatsCollector>();
    }

    void TearDown() override {
        snapshots_.reset();
        db_.reset();
        std::filesystem::remove_all(root_);
    }

    void exec(const std::string& sql) {
        auto res = db_->run(sql);
        ASSERT_TRUE(res.has_value()) << sql << ": " << res.error().message;
    }

    std::string scalar(const std::string& sql) {
        auto res = db_->run(sql);
        EXPECT_TRUE(res.has_value()) << sql;
        if (!res || res->rows.empty() || !res->rows.front().front()) {
            return {};
        }
        return *res->rows.front().front();
    }

    std::unique_ptr<ApprovalGate> make_gate(Approver&          approver,
                                            StatementExecutor& executor,
                                            AuditLog*          audit    = nullptr,
                                            GateTimeouts       timeouts = {}) {
        return std::make_unique<ApprovalGate>(*evaluator_, approver, locks_, *snapshots_, executor,
                                              audit != nullptr ? *audit : *audit_,
                                              logger_, stats_, timeouts);
    }

    AuditRecord submit(ApprovalVerdict verdict, const std::string& sql, const SubmitOptions& opts = {}) {
        approver_ = std::make_unique<ScriptedApprover>(verdict);
        executor_ = std::make_unique<RecordingExecutor>(*db_executor_, false);
        auto gate = make_gate(*approver_, *executor_);
        auto rec  = gate->submit(sql, opts);
        EXPECT_TRUE(rec.has_value()) << (rec ? "" : rec.error().message);
        return rec.value_or(AuditRecord{});
    }

    std::filesystem::path               root_;
    std::unique_ptr<SqliteDatabase>     db_;
    SqlParser                           parser_;
    std::unique_ptr<RiskClassifier>     classifier_;
    std::unique_ptr<DryRunEstimator>    estimator_;
    std::unique_ptr<StatementEvaluator> evaluator_;
    std::unique_ptr<SnapshotManager>    snapshots_;
    TableLockManager                    locks_;
    std::unique_ptr<FileAuditLog>       audit_;
    std::unique_ptr<DatabaseExecutor>   db_executor_;
    std::shared_ptr<StructuredLogger>   logger_;
    std::shared_ptr<GateStatsCollector> stats_;

    std::unique_ptr<ScriptedApprover>  approver_;
    std::unique_ptr<RecordingExecutor> executor_;
};

}  // namespace

// ---------------------------------------------------------------------------
// 전이 표
// ---------------------------------------------------------------------------

TEST(GateTransitions, AllowedEdges) {
    EXPECT_TRUE(is_allowed_transition(GateState::kReceived, GateState::kParsed));
    EXPECT_TRUE(is_allowed_transition(GateState::kRiskAssessed, GateState::kBlocked));
    EXPECT_TRUE(is_allowed_transition(GateState::kSnapshotted, GateState::kExecuted));
    EXPECT_TRUE(is_allowed_transition(GateState::kAudited, GateState::kDone));
}

TEST(GateTransitions, ForbiddenEdges) {
    EXPECT_FALSE(is_allowed_transition(GateState::kBlocked, GateState::kExecuted));
    EXPECT_FALSE(is_allowed_transition(GateState::kPendingApproval, GateState::kExecuted))
        << "approved statements must pass through SNAPSHOTTED";
    EXPECT_FALSE(is_allowed_transition(GateState::kExecuted, GateState::kExecuted));
    EXPECT_FALSE(is_allowed_transition(GateState::kDone, GateState::kReceived));
}

TEST(GateTransitions, StateNames) {
    EXPECT_STREQ(gate_state_to_string(GateState::kDryRunDone), "DRYRUN_DONE");
    EXPECT_STREQ(gate_state_to_string(GateState::kSkippedSnapshot), "SKIPPED_SNAPSHOT");
}

// ---------------------------------------------------------------------------
// 결정 경로
// ---------------------------------------------------------------------------

TEST_F(ApprovalGateTest, LowRiskSelectIsAutoApproved) {
    const auto rec = submit(ApprovalVerdict::kNo, "SELECT * FROM person");

    EXPECT_EQ(rec.risk.level, RiskLevel::kLow);
    EXPECT_EQ(rec.approval, ApprovalDecision::kAuto);
    EXPECT_EQ(rec.final_status, FinalStatus::kExecuted);
    EXPECT_EQ(rec.execution.status, ExecutionStatus::kSuccess);
    EXPECT_EQ(rec.execution.affected_rows, 5u);
    EXPECT_FALSE(rec.snapshot.has_value());
    ASSERT_TRUE(rec.dry_run.has_value());
    EXPECT_EQ(rec.dry_run->estimated_rows, 5u);
    EXPECT_TRUE(rec.dry_run->exact);
    EXPECT_TRUE(approver_->requests.empty()) << "LOW never asks for approval";
    EXPECT_EQ(rec.transitions,
              states({"RECEIVED", "PARSED", "DRYRUN_DONE", "RISK_ASSESSED", "AUTO_APPROVED",
                      "SKIPPED_SNAPSHOT", "EXECUTED", "AUDITED", "DONE"}));
}

TEST_F(ApprovalGateTest, HighRiskDeleteApprovedIsSnapshottedThenExecuted) {
    const auto rec = submit(ApprovalVerdict::kYes, kOldVisits);

    EXPECT_EQ(rec.risk.level, RiskLevel::kHigh);
    EXPECT_TRUE(rec.risk.has_rule("row-impact-high"));
    ASSERT_TRUE(rec.dry_run.has_value());
    EXPECT_EQ(rec.dry_run->estimated_rows, 3214u);

    ASSERT_EQ(approver_->requests.size(), 1u);
    const auto& request = approver_->requests.front();
    EXPECT_EQ(request.run_id, rec.run_id);
    ASSERT_TRUE(request.dry_run.has_value());
    EXPECT_EQ(request.dry_run->estimated_rows, 3214u);

    EXPECT_EQ(rec.approval, ApprovalDecision::kApproved);
    ASSERT_TRUE(rec.snapshot.has_value());
    EXPECT_EQ(rec.snapshot->tables, std::vector<std::string>{"visits"});
    EXPECT_EQ(rec.final_status, FinalStatus::kExecuted);
    EXPECT_EQ(rec.execution.affected_rows, 3214u);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM visits"), "786");
    EXPECT_EQ(executor_->executed.size(), 1u);
    EXPECT_EQ(rec.transitions,
              states({"RECEIVED", "PARSED", "DRYRUN_DONE", "RISK_ASSESSED", "PENDING_APPROVAL",
                      "SNAPSHOTTED", "EXECUTED", "AUDITED", "DONE"}));

    // 스냅샷은 카탈로그에 남아 있어 나중에 복원할 수 있다.
    EXPECT_TRUE(snapshots_->find(rec.snapshot->id).has_value());
}

TEST_F(ApprovalGateTest, UnfilteredDeleteOnProtectedTableIsBlocked) {
    const auto rec = submit(ApprovalVerdict::kYes, "DELETE FROM users;");

    EXPECT_EQ(rec.risk.level, RiskLevel::kCritical);
    EXPECT_EQ(rec.final_status, FinalStatus::kBlocked);
    EXPECT_EQ(rec.execution.status, ExecutionStatus::kNotRun);
    EXPECT_FALSE(rec.dry_run.has_value()) << "blocked statements never reach the database";
    EXPECT_TRUE(approver_->requests.empty());
    EXPECT_TRUE(executor_->executed.empty());
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM users"), "3");
    EXPECT_EQ(rec.transitions,
              states({"RECEIVED", "PARSED", "RISK_ASSESSED", "BLOCKED", "AUDITED", "DONE"}));
}

TEST_F(ApprovalGateTest, DropTableIsBlocked) {
    const auto rec = submit(ApprovalVerdict::kYes, "DROP TABLE visits");
    EXPECT_EQ(rec.final_status, FinalStatus::kBlocked);
    EXPECT_TRUE(rec.risk.has_rule("ddl"));
    EXPECT_EQ(db_->table_exists("visits"), true);
}

TEST_F(ApprovalGateTest, DeniedApprovalAborts) {
    const auto rec = submit(ApprovalVerdict::kNo, kOldVisits);

    EXPECT_EQ(rec.approval, ApprovalDecision::kDenied);
    EXPECT_EQ(rec.final_status, FinalStatus::kAborted);
    EXPECT_EQ(rec.abort_reason, AbortReason::kDenied);
    EXPECT_EQ(rec.execution.status, ExecutionStatus::kNotRun);
    EXPECT_FALSE(rec.snapshot.has_value());
    EXPECT_TRUE(executor_->executed.empty());
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM visits"), "4000");
}

TEST_F(ApprovalGateTest, ApprovalTimeoutAborts) {
    const auto rec = submit(ApprovalVerdict::kTimeout, kOldVisits);
    EXPECT_EQ(rec.approval, ApprovalDecision::kTimedOut);
    EXPECT_EQ(rec.abort_reason, AbortReason::kTimeout);
    EXPECT_TRUE(executor_->executed.empty());
}

TEST_F(ApprovalGateTest, CancelledWhileWaitingForApproval) {
    const auto rec = submit(ApprovalVerdict::kCancelled, kOldVisits);
    EXPECT_EQ(rec.approval, ApprovalDecision::kNone);
    EXPECT_EQ(rec.final_status, FinalStatus::kAborted);
    EXPECT_EQ(rec.abort_reason, AbortReason::kCancelled);
}

TEST_F(ApprovalGateTest, CancelledBeforeApprovalNeverAsks) {
    std::stop_source source;
    source.request_stop();

    const auto rec = submit(ApprovalVerdict::kYes, kOldVisits, SubmitOptions{.stop = source.get_token()});
    EXPECT_EQ(rec.abort_reason, AbortReason::kCancelled);
    EXPECT_TRUE(approver_->requests.empty());
    EXPECT_TRUE(executor_->executed.empty());
    EXPECT_EQ(rec.transitions,
              states({"RECEIVED", "PARSED", "DRYRUN_DONE", "RISK_ASSESSED", "ABORTED", "AUDITED", "DONE"}));
}

// ---------------------------------------------------------------------------
// 판정 실패 경로
// ---------------------------------------------------------------------------

TEST_F(ApprovalGateTest, ParseErrorIsBlockedEvenWithOverride) {
    const auto rec = submit(ApprovalVerdict::kYes, "SELECT 1; DROP TABLE person",
                            SubmitOptions{.elevated_override = ElevatedOverride{"dba", "trust me"}});

    EXPECT_EQ(rec.risk.level, RiskLevel::kCritical);
    EXPECT_TRUE(rec.risk.has_rule("parse-error"));
    EXPECT_EQ(rec.final_status, FinalStatus::kBlocked);
    EXPECT_FALSE(rec.elevated_override.has_value()) << "override does not apply to unparseable input";
    EXPECT_TRUE(executor_->executed.empty());
    EXPECT_EQ(rec.transitions, states({"RECEIVED", "RISK_ASSESSED", "BLOCKED", "AUDITED", "DONE"}));
}

TEST_F(ApprovalGateTest, EmptyInputIsBlocked) {
    const auto rec = submit(ApprovalVerdict::kYes, "  ;  ");
    EXPECT_EQ(rec.final_status, FinalStatus::kBlocked);
}

// SQLite 에서 #p 는 바인드 파라미터다. 주석으로 읽으면 뒤의 DROP 이 숨는다.
TEST_F(ApprovalGateTest, HashDoesNotHideSecondStatement) {
    const auto rec = submit(ApprovalVerdict::kNo,
                            "INSERT INTO person (name) VALUES ('x' || #p); DROP TABLE users; "
                            "SELECT ('y' ||\n'z')");

    EXPECT_EQ(rec.risk.level, RiskLevel::kCritical);
    EXPECT_TRUE(rec.risk.has_rule("parse-error"));
    EXPECT_EQ(rec.final_status, FinalStatus::kBlocked);
    EXPECT_NE(rec.approval, ApprovalDecision::kAuto);
    EXPECT_TRUE(executor_->executed.empty());
    EXPECT_EQ(db_->table_exists("users"), true);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM users"), "3");
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM person"), "5");
}

TEST_F(ApprovalGateTest, DollarQuotedBodyIsBlocked) {
    const auto rec = submit(ApprovalVerdict::kYes,
                            "SELECT $x$ ; DROP TABLE users; $x$ FROM person");
    EXPECT_EQ(rec.final_status, FinalStatus::kBlocked);
    EXPECT_TRUE(executor_->executed.empty());
    EXPECT_EQ(db_->table_exists("users"), true);
}

TEST_F(ApprovalGateTest, DryRunFailureAborts) {
    const auto rec = submit(ApprovalVerdict::kYes, "DELETE FROM archive WHERE id = 1");

    EXPECT_EQ(rec.final_status, FinalStatus::kAborted);
    EXPECT_EQ(rec.abort_reason, AbortReason::kDryRunFailed);
    EXPECT_FALSE(rec.dry_run.has_value());
    EXPECT_FALSE(rec.dry_run_error.empty());
    EXPECT_TRUE(approver_->requests.empty());
    EXPECT_TRUE(executor_->executed.empty());
    EXPECT_EQ(rec.transitions, states({"RECEIVED", "PARSED", "ABORTED", "AUDITED", "DONE"}));
}

// ---------------------------------------------------------------------------
// override / 보호 테이블
// ---------------------------------------------------------------------------

TEST_F(ApprovalGateTest, ElevatedOverrideRoutesCriticalToApproval) {
    const auto rec = submit(ApprovalVerdict::kYes, "DELETE FROM users;",
                            SubmitOptions{.elevated_override = ElevatedOverride{"dba-on-call", "GDPR purge"}});

    EXPECT_EQ(rec.risk.level, RiskLevel::kCritical);
    ASSERT_TRUE(rec.elevated_override.has_value());
    EXPECT_EQ(rec.elevated_override->authorized_by, "dba-on-call");
    ASSERT_TRUE(rec.dry_run.has_value()) << "override runs the dry run so the approver sees the impact";
    EXPECT_EQ(rec.dry_run->estimated_rows, 3u);
    ASSERT_EQ(approver_->requests.size(), 1u);
    ASSERT_TRUE(rec.snapshot.has_value());
    EXPECT_EQ(rec.final_status, FinalStatus::kExecuted);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM users"), "0");
}

TEST_F(ApprovalGateTest, OverrideStillNeedsApproverConsent) {
    const auto rec = submit(ApprovalVerdict::kNo, "DELETE FROM users;",
                            SubmitOptions{.elevated_override = ElevatedOverride{"dba", "cleanup"}});
    EXPECT_EQ(rec.final_status, FinalStatus::kAborted);
    EXPECT_EQ(rec.abort_reason, AbortReason::kDenied);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM users"), "3");
}

TEST_F(ApprovalGateTest, CreateTargetNeedNotExistForSnapshot) {
    const auto rec = submit(ApprovalVerdict::kYes,
                            "CREATE TABLE archive AS SELECT * FROM visits WHERE visited_at < '2020-01-01'",
                            SubmitOptions{.elevated_override = ElevatedOverride{"dba", "archive old visits"}});

    EXPECT_EQ(rec.final_status, FinalStatus::kExecuted);
    EXPECT_EQ(rec.execution.status, ExecutionStatus::kSuccess) << rec.execution.error;
    ASSERT_TRUE(rec.snapshot.has_value());
    EXPECT_EQ(rec.snapshot->tables, std::vector<std::string>{"visits"});
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM archive"), "3214");
}

TEST_F(ApprovalGateTest, FilteredWriteOnProtectedTableNeedsApproval) {
    const auto rec = submit(ApprovalVerdict::kYes, "UPDATE users SET name = 'x' WHERE id = 1");
    EXPECT_EQ(rec.risk.level, RiskLevel::kMedium);
    EXPECT_EQ(approver_->requests.size(), 1u);
    ASSERT_TRUE(rec.snapshot.has_value());
    EXPECT_EQ(rec.snapshot->tables, std::vector<std::string>{"users"});
    EXPECT_EQ(rec.execution.affected_rows, 1u);
}

// ---------------------------------------------------------------------------
// 실행 / 락 / 감사 실패
// ---------------------------------------------------------------------------

TEST_F(ApprovalGateTest, ExecutionFailureIsRecordedWithoutRetry) {
    ScriptedApprover  approver{ApprovalVerdict::kYes};
    RecordingExecutor failing{*db_executor_, true};
    auto gate = make_gate(approver, failing);

    const auto rec = gate->submit(kOldVisits);
    ASSERT_TRUE(rec.has_value()) << rec.error().message;
    EXPECT_EQ(rec->final_status, FinalStatus::kExecuted);
    EXPECT_EQ(rec->execution.status, ExecutionStatus::kFailed);
    EXPECT_EQ(rec->execution.error, "disk I/O error");
    EXPECT_EQ(failing.executed.size(), 1u) << "execution is attempted exactly once";
    EXPECT_TRUE(rec->snapshot.has_value());
    EXPECT_EQ(stats_->snapshot().execution_failed, 1u);
}

TEST_F(ApprovalGateTest, LockTimeoutAborts) {
    ScriptedApprover  approver{ApprovalVerdict::kYes};
    RecordingExecutor executor{*db_executor_, false};
    auto gate = make_gate(approver, executor, nullptr, GateTimeouts{.approval = 1s, .lock = 20ms});

    auto held = locks_.acquire({"VISITS"});
    const auto rec = gate->submit(kOldVisits);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->abort_reason, AbortReason::kLockFailed);
    EXPECT_FALSE(rec->snapshot.has_value());
    EXPECT_TRUE(executor.executed.empty());
}

TEST_F(ApprovalGateTest, SchemaQualifiedNameSharesTableLock) {
    ScriptedApprover  approver{ApprovalVerdict::kYes};
    RecordingExecutor executor{*db_executor_, false};
    auto gate = make_gate(approver, executor, nullptr, GateTimeouts{.approval = 1s, .lock = 50ms});

    auto held = locks_.acquire({"visits"});
    const auto rec = gate->submit("DELETE FROM main.visits WHERE visited_at < '2020-01-01'");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->abort_reason, AbortReason::kLockFailed) << "main.visits is the table visits";
    EXPECT_TRUE(executor.executed.empty());
}

TEST_F(ApprovalGateTest, CancelledAfterSnapshotKeepsSnapshot) {
    std::stop_source         source;
    CancelOnSnapshotDatabase observed{*db_, source};
    auto snapshots = SnapshotManager::create(observed, root_ / "cancel_snapshots",
                                             SnapshotStrategyKind::kTableCopy);
    ASSERT_TRUE(snapshots.has_value()) << snapshots.error().message;

    ScriptedApprover  approver{ApprovalVerdict::kYes};
    RecordingExecutor executor{*db_executor_, false};
    ApprovalGate gate{*evaluator_, approver, locks_, **snapshots, executor, *audit_, logger_, stats_};

    const auto rec = gate.submit(kOldVisits, SubmitOptions{.stop = source.get_token()});
    ASSERT_TRUE(rec.has_value()) << rec.error().message;
    EXPECT_EQ(rec->approval, ApprovalDecision::kApproved);
    EXPECT_EQ(rec->final_status, FinalStatus::kAborted);
    EXPECT_EQ(rec->abort_reason, AbortReason::kCancelled);
    EXPECT_EQ(rec->execution.status, ExecutionStatus::kNotRun);
    ASSERT_TRUE(rec->snapshot.has_value()) << "snapshot taken before the cancel stays on the record";
    EXPECT_TRUE((*snapshots)->find(rec->snapshot->id).has_value());
    EXPECT_TRUE(executor.executed.empty());
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM visits"), "4000");
    EXPECT_EQ(rec->transitions,
              states({"RECEIVED", "PARSED", "DRYRUN_DONE", "RISK_ASSESSED", "PENDING_APPROVAL",
                      "SNAPSHOTTED", "ABORTED", "AUDITED", "DONE"}));

    const auto stored = audit_->get(rec->run_id);
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->snapshot.has_value());
    EXPECT_EQ(stored->snapshot->id, rec->snapshot->id);
}

TEST_F(ApprovalGateTest, OverlappingRunsDoNotInterleave) {
    ScriptedApprover        first_approver{ApprovalVerdict::kYes};
    ScriptedApprover        second_approver{ApprovalVerdict::kYes};
    OverlapCheckingExecutor executor{*db_executor_, *snapshots_};
    auto first_gate  = make_gate(first_approver, executor);
    auto second_gate = make_gate(second_approver, executor);

    // 같은 테이블을 한쪽은 비한정, 다른 쪽은 스키마 한정 이름으로 참조한다.
    auto first = std::async(std::launch::async, [&] { return first_gate->submit(kOldVisits); });
    auto second = std::async(std::launch::async, [&] {
        return second_gate->submit("UPDATE main.visits SET person_id = 9 WHERE visited_at >= '2020-01-01'");
    });

    const auto a = first.get();
    const auto b = second.get();
    ASSERT_TRUE(a.has_value()) << a.error().message;
    ASSERT_TRUE(b.has_value()) << b.error().message;
    EXPECT_EQ(a->execution.status, ExecutionStatus::kSuccess);
    EXPECT_EQ(b->execution.status, ExecutionStatus::kSuccess);
    EXPECT_TRUE(a->snapshot.has_value());
    EXPECT_TRUE(b->snapshot.has_value());
    EXPECT_FALSE(executor.overlapped.load()) << "snapshot + execute of one run must not interleave with another";

    EXPECT_EQ(scalar("SELECT COUNT(*) FROM visits"), "786");
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM visits WHERE person_id = 9"), "786");
    EXPECT_EQ(locks_.held_count(), 0u);
}

TEST_F(ApprovalGateTest, AuditFailureIsReported) {
    ScriptedApprover  approver{ApprovalVerdict::kYes};
    RecordingExecutor executor{*db_executor_, false};
    FailingAuditLog   broken;
    auto gate = make_gate(approver, executor, &broken);

    const auto rec = gate->submit("SELECT * FROM person");
    ASSERT_FALSE(rec.has_value());
    EXPECT_EQ(rec.error().code, GateErrorCode::kAuditWriteFailed);
}

TEST_F(ApprovalGateTest, EveryRunIsAuditedOnce) {
    const auto a = submit(ApprovalVerdict::kYes, "SELECT * FROM person");
    const auto b = submit(ApprovalVerdict::kNo, kOldVisits);
    const auto c = submit(ApprovalVerdict::kYes, "DROP TABLE person");

    const auto all = audit_->query(AuditQuery{});
    ASSERT_TRUE(all.has_value());
    ASSERT_EQ(all->size(), 3u);
    EXPECT_EQ((*all)[0].run_id, a.run_id);
    EXPECT_EQ((*all)[1].run_id, b.run_id);
    EXPECT_EQ((*all)[2].run_id, c.run_id);

    const auto stored = audit_->get(b.run_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, b);

    const auto stats = stats_->snapshot();
    EXPECT_EQ(stats.total_runs, 3u);
    EXPECT_EQ(stats.executed, 1u);
    EXPECT_EQ(stats.aborted, 1u);
    EXPECT_EQ(stats.blocked, 1u);
    EXPECT_EQ(stats.pending_approvals, 0u);
}

TEST_F(ApprovalGateTest, FingerprintIgnoresCaseAndWhitespace) {
    const auto a = submit(ApprovalVerdict::kYes, "SELECT * FROM person");
    const auto b = submit(ApprovalVerdict::kYes, "select *\n  from PERSON;");
    EXPECT_EQ(a.fingerprint, b.fingerprint);
    EXPECT_NE(a.run_id, b.run_id);
}
