#include "replay/replay_engine.hpp"

#include "audit/audit_log.hpp"
#include "common/fingerprint.hpp"
#include "gate/statement_evaluator.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::string format_reasons(const RiskAssessment& risk) {
    std::string out = "[";
    for (std::size_t i = 0; i < risk.matches.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += risk.matches[i].rule_id;
    }
    out += "]";
    return out;
}

std::string format_optional_rows(const std::optional<DryRunResult>& dry_run) {
    return dry_run ? std::to_string(dry_run->estimated_rows) : std::string{"null"};
}

std::string format_optional_exact(const std::optional<DryRunResult>& dry_run) {
    if (!dry_run) {
        return "null";
    }
    return dry_run->exact ? "true" : "false";
}

void diff(std::vector<ReplayDivergence>& out, const char* field,
          std::string stored, std::string recomputed) {
    if (stored != recomputed) {
        out.push_back(ReplayDivergence{field, std::move(stored), std::move(recomputed)});
    }
}

}  // namespace

std::expected<ReplayTrace, GateError> ReplayEngine::replay(const std::string& run_id) const {
    auto stored = audit_.get(run_id);
    if (!stored) {
        return std::unexpected(stored.error());
    }
    return compare(*stored);
}

ReplayTrace ReplayEngine::compare(const AuditRecord& stored) const {
    ReplayTrace trace;
    trace.run_id = stored.run_id;
    trace.stored = stored;

    if (stored.kind == RecordKind::kRollback) {
        trace.replayable = false;
        return trace;
    }

    const auto eval = evaluator_.evaluate(stored.sql, stored.elevated_override.has_value());
    trace.recomputed_risk          = eval.risk;
    trace.recomputed_dry_run       = eval.dry_run;
    trace.recomputed_dry_run_error = eval.dry_run_error;
    trace.recomputed_fingerprint   = fingerprint(stored.sql);

    auto& out = trace.divergences;
    diff(out, "risk_level", risk_level_to_string(stored.risk.level),
         risk_level_to_string(eval.risk.level));
    diff(out, "risk_reasons", format_reasons(stored.risk), format_reasons(eval.risk));
    diff(out, "dry_run.estimated_rows", format_optional_rows(stored.dry_run),
         format_optional_rows(eval.dry_run));
    diff(out, "dry_run.exact", format_optional_exact(stored.dry_run),
         format_optional_exact(eval.dry_run));
    diff(out, "dry_run.error", stored.dry_run_error, eval.dry_run_error);
    diff(out, "fingerprint", stored.fingerprint, trace.recomputed_fingerprint);

    spdlog::info("replay: {} divergences={}", stored.run_id, out.size());
    return trace;
}

std::string format_replay_trace(const ReplayTrace& trace) {
    if (!trace.replayable) {
        return fmt::format("run {}: {} record, not replayable\n",
                           trace.run_id, record_kind_to_string(trace.stored.kind));
    }

    std::string out = fmt::format(
        "run {}\n"
        "  stored     : risk={} reasons={} rows={} final={}\n"
        "  recomputed : risk={} reasons={} rows={}\n",
        trace.run_id,
        risk_level_to_string(trace.stored.risk.level), format_reasons(trace.stored.risk),
        format_optional_rows(trace.stored.dry_run), final_status_to_string(trace.stored.final_status),
        risk_level_to_string(trace.recomputed_risk.level), format_reasons(trace.recomputed_risk),
        format_optional_rows(trace.recomputed_dry_run));

    if (trace.divergences.empty()) {
        out += "  no divergence\n";
        return out;
    }
    for (const auto& d : trace.divergences) {
        out += fmt::format("  DIVERGED {}: stored={} recomputed={}\n", d.field, d.stored, d.recomputed);
    }
    return out;
}
