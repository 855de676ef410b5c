#pragma once

// ---------------------------------------------------------------------------
// replay_engine.hpp
//
// 감사 레코드의 SQL 을 현재 레지스트리/임계값/데이터로 다시 판정하고, 저장된
// 판정과 비교한다.
//
// [보장]
// - 실행 협력자(StatementExecutor)에 대한 참조가 없다. 리플레이는 쓰기를 수행할 수 없다.
// - 드라이런은 read-only 스코프에서만 실행된다 (DryRunEstimator 규율).
// - 불일치(divergence)는 trace 에 기록될 뿐 오류가 아니다.
// - kind=rollback 레코드는 재계산 없이 replayable=false 로 보고한다.
//
// [비교 필드]
//   risk_level, risk_reasons, dry_run.estimated_rows, dry_run.exact,
//   dry_run.error, fingerprint
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <vector>

#include "audit/audit_record.hpp"
#include "common/types.hpp"

class AuditLog;
class StatementEvaluator;

struct ReplayDivergence {
    std::string field{};
    std::string stored{};
    std::string recomputed{};

    bool operator==(const ReplayDivergence&) const = default;
};

struct ReplayTrace {
    std::string                   run_id{};
    bool                          replayable{true};
    AuditRecord                   stored{};
    RiskAssessment                recomputed_risk{};
    std::optional<DryRunResult>   recomputed_dry_run{};
    std::string                   recomputed_dry_run_error{};
    std::string                   recomputed_fingerprint{};
    std::vector<ReplayDivergence> divergences{};

    [[nodiscard]] bool diverged() const noexcept { return !divergences.empty(); }
};

class ReplayEngine {
public:
    ReplayEngine(const AuditLog& audit, const StatementEvaluator& evaluator) noexcept
        : audit_(audit), evaluator_(evaluator) {}

    // replay
    //   알 수 없는 run_id 는 GateError{kNotFound}.
    [[nodiscard]] std::expected<ReplayTrace, GateError> replay(const std::string& run_id) const;

    // compare
    //   저장된 레코드 하나를 재판정한다 (감사 로그 조회 없이).
    [[nodiscard]] ReplayTrace compare(const AuditRecord& stored) const;

private:
    const AuditLog&           audit_;
    const StatementEvaluator& evaluator_;
};

// 사람이 읽는 trace 출력 (CLI 용).
[[nodiscard]] std::string format_replay_trace(const ReplayTrace& trace);
