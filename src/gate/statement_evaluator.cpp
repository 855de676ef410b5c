#include "gate/statement_evaluator.hpp"

#include <spdlog/spdlog.h>

Evaluation StatementEvaluator::evaluate(std::string_view sql, bool has_override) const {
    Evaluation out;

    auto parsed = parser_.parse(sql);
    if (!parsed) {
        out.parse_error = parsed.error();
        out.structural  = classifier_.classify_parse_error(parsed.error());
        out.risk        = out.structural;
        return out;
    }
    out.parsed     = std::move(*parsed);
    out.structural = classifier_.classify(*out.parsed);

    if (out.structural.level == RiskLevel::kCritical && !has_override) {
        out.risk = out.structural;
        return out;
    }

    out.dry_run_attempted = true;
    auto estimate = estimator_.estimate(*out.parsed);
    if (!estimate) {
        spdlog::warn("evaluator: dry run failed: {}", estimate.error().message);
        out.dry_run_error = estimate.error().message;
        out.risk          = out.structural;
        return out;
    }

    out.dry_run = *estimate;
    out.risk    = classifier_.assess(*out.parsed, out.dry_run->estimated_rows);
    return out;
}
