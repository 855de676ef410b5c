// ---------------------------------------------------------------------------
// dry_run_estimator.cpp
// ---------------------------------------------------------------------------

#include "dryrun/dry_run_estimator.hpp"

#include "db/database.hpp"

#include <charconv>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kCountAlias = "estimated_rows";

GateError dry_run_error(std::string message) {
    return GateError{GateErrorCode::kDryRunFailed, std::move(message)};
}

std::string wrap_count(const std::string& subquery) {
    return fmt::format("SELECT COUNT(*) AS {} FROM ({}) AS dbsafe_t", kCountAlias, subquery);
}

// 테이블별 COUNT 합: SELECT (SELECT COUNT(*) FROM "a") + (SELECT COUNT(*) FROM "b") AS estimated_rows
std::string sum_of_counts(const std::vector<std::string>& tables) {
    std::string expr;
    for (std::size_t i = 0; i < tables.size(); ++i) {
        if (i > 0) {
            expr += " + ";
        }
        expr += fmt::format("(SELECT COUNT(*) FROM {})", Database::quote_identifier(tables[i]));
    }
    return fmt::format("SELECT {} AS {}", expr, kCountAlias);
}

}  // namespace

std::expected<RewritePlan, GateError> DryRunEstimator::rewrite(const ParsedQuery& query) {
    RewritePlan plan;

    switch (query.command) {
        case SqlCommand::kSelect:
            plan.count_query = wrap_count(query.statement_sql);
            plan.exact       = true;
            return plan;

        case SqlCommand::kDelete:
        case SqlCommand::kUpdate:
            if (query.from_clause.empty()) {
                return std::unexpected(dry_run_error(
                    fmt::format("cannot derive row source for {}", command_to_string(query.command))));
            }
            plan.count_query = query.has_where_clause
                ? fmt::format("SELECT COUNT(*) AS {} FROM {} WHERE {}", kCountAlias,
                              query.from_clause, query.where_clause)
                : fmt::format("SELECT COUNT(*) AS {} FROM {}", kCountAlias, query.from_clause);
            plan.exact = !query.is_multi_table && !query.row_limited;
            return plan;

        case SqlCommand::kInsert:
            switch (query.insert_source) {
                case InsertSource::kValues:
                case InsertSource::kDefaultValues:
                    plan.literal_rows = query.insert_value_rows;
                    plan.exact        = true;
                    return plan;
                case InsertSource::kSelect:
                    plan.count_query = wrap_count(query.insert_select_sql);
                    plan.exact       = false;
                    return plan;
                case InsertSource::kNone:
                    break;
            }
            return std::unexpected(dry_run_error("INSERT source could not be determined"));

        case SqlCommand::kTruncate:
        case SqlCommand::kDrop:
            if (query.tables.empty()) {
                // DROP INDEX/VIEW 등 행을 직접 지우지 않는 객체
                plan.exact = false;
                return plan;
            }
            plan.count_query = sum_of_counts(query.tables);
            plan.exact       = query.command == SqlCommand::kTruncate;
            return plan;

        case SqlCommand::kAlter:
        case SqlCommand::kCreate:
        case SqlCommand::kGrant:
        case SqlCommand::kRevoke:
            plan.exact = false;
            return plan;

        case SqlCommand::kCall:
        case SqlCommand::kPrepare:
        case SqlCommand::kExecute:
        case SqlCommand::kUnknown:
            break;
    }

    return std::unexpected(dry_run_error(
        fmt::format("{} statement has no non-mutating equivalent", command_to_string(query.command))));
}

std::expected<DryRunResult, GateError> DryRunEstimator::estimate(const ParsedQuery& query) {
    auto plan = rewrite(query);
    if (!plan) {
        return std::unexpected(plan.error());
    }

    // DROP TABLE IF EXISTS 처럼 존재하지 않는 테이블은 0 행으로 본다.
    if ((query.command == SqlCommand::kDrop || query.command == SqlCommand::kTruncate) &&
        !plan->count_query.empty()) {
        std::vector<std::string> existing;
        for (const auto& table : query.tables) {
            auto exists = db_.table_exists(table);
            if (!exists) {
                return std::unexpected(dry_run_error(exists.error().message));
            }
            if (*exists) {
                existing.push_back(table);
            }
        }
        plan->count_query = existing.empty() ? std::string{} : sum_of_counts(existing);
    }

    DryRunResult result;
    result.exact           = plan->exact;
    result.rewritten_query = plan->count_query;

    if (plan->count_query.empty()) {
        result.estimated_rows = plan->literal_rows;
        return result;
    }

    auto scope = db_.begin_read_only();
    if (!scope) {
        return std::unexpected(dry_run_error(
            fmt::format("cannot open read-only scope: {}", scope.error().message)));
    }

    auto res = db_.run(plan->count_query);
    if (!res) {
        spdlog::warn("dry_run: estimation query failed: {} query='{}'",
                     res.error().message, plan->count_query);
        return std::unexpected(dry_run_error(res.error().message));
    }
    if (res->rows.empty() || res->rows.front().empty() || !res->rows.front().front()) {
        return std::unexpected(dry_run_error("estimation query returned no count"));
    }

    const std::string& text = *res->rows.front().front();
    std::uint64_t count = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), count);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(dry_run_error(fmt::format("non-numeric count '{}'", text)));
    }
    result.estimated_rows = count;
    return result;
}
