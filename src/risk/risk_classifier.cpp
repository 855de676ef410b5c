// ---------------------------------------------------------------------------
// risk_classifier.cpp
// ---------------------------------------------------------------------------

#include "risk/risk_classifier.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

std::vector<std::string> RiskAssessment::rule_ids() const {
    std::vector<std::string> ids;
    ids.reserve(matches.size());
    for (const auto& m : matches) {
        ids.push_back(m.rule_id);
    }
    return ids;
}

bool RiskAssessment::has_rule(const std::string& rule_id) const {
    return std::any_of(matches.begin(), matches.end(),
                       [&](const RiskMatch& m) { return m.rule_id == rule_id; });
}

RiskClassifier::RiskClassifier(ProtectedTableRegistry registry, RiskThresholds thresholds)
    : registry_(std::move(registry))
    , thresholds_(thresholds)
{}

RiskAssessment RiskClassifier::classify(const ParsedQuery& query) const {
    return assess(query, std::nullopt);
}

RiskAssessment RiskClassifier::assess(const ParsedQuery&          query,
                                      std::optional<std::uint64_t> estimated_rows) const {
    RiskAssessment result;
    result.level = RiskLevel::kLow;

    const auto match = [&](RiskLevel level, std::string rule_id, std::string rationale) {
        result.level = max_level(result.level, level);
        result.matches.push_back(RiskMatch{std::move(rule_id), std::move(rationale)});
    };

    const char* cmd = command_to_string(query.command);

    // 1. 구문 종류
    switch (query.command) {
        case SqlCommand::kDrop:
        case SqlCommand::kTruncate:
        case SqlCommand::kAlter:
        case SqlCommand::kCreate:
            match(RiskLevel::kCritical, "ddl",
                  fmt::format("{} is a schema-level operation", cmd));
            break;

        case SqlCommand::kCall:
        case SqlCommand::kPrepare:
        case SqlCommand::kExecute:
        case SqlCommand::kUnknown:
            match(RiskLevel::kCritical, "opaque-statement",
                  fmt::format("{} statement cannot be analyzed; treated as destructive", cmd));
            break;

        case SqlCommand::kGrant:
        case SqlCommand::kRevoke:
            match(RiskLevel::kHigh, "dcl",
                  fmt::format("{} changes access privileges", cmd));
            break;

        case SqlCommand::kUpdate:
        case SqlCommand::kDelete:
            if (!query.has_where_clause) {
                match(RiskLevel::kHigh, "unfiltered-write",
                      fmt::format("{} without WHERE affects every row of {}", cmd, query.target_table));
            }
            break;

        case SqlCommand::kSelect:
        case SqlCommand::kInsert:
            break;
    }

    // 2. 추정 행 수 (쓰기 DML 만)
    if (query.is_dml_write() && estimated_rows.has_value()) {
        const auto rows = *estimated_rows;
        if (rows > thresholds_.medium_high) {
            match(RiskLevel::kHigh, "row-impact-high",
                  fmt::format("estimated {} rows exceeds threshold {}", rows, thresholds_.medium_high));
        } else if (rows > thresholds_.low_medium) {
            match(RiskLevel::kMedium, "row-impact-medium",
                  fmt::format("estimated {} rows exceeds threshold {}", rows, thresholds_.low_medium));
        }
    }

    // 3. 기본값
    if (result.matches.empty()) {
        if (query.is_mutating()) {
            match(RiskLevel::kLow, "filtered-write",
                  fmt::format("filtered single-table {}", cmd));
        } else {
            match(RiskLevel::kLow, "read-only", "read-only statement");
        }
    }

    if (!query.is_mutating()) {
        return result;
    }

    // 4. 보호 테이블 상향 (구문당 한 번)
    //    단일 테이블 DML 은 쓰기 대상만, 다중 테이블/DDL/DCL 은 참조 테이블 전체를 본다.
    std::vector<std::string> targets;
    if (query.is_dml_write() && !query.is_multi_table) {
        if (!query.target_table.empty()) {
            targets.push_back(query.target_table);
        }
    } else {
        targets = query.tables;
    }

    std::optional<ElevationPolicy> strongest;
    std::string                    protected_name;
    for (const auto& table : targets) {
        const auto policy = registry_.lookup(table);
        if (!policy) {
            continue;
        }
        if (!strongest ||
            (*policy == ElevationPolicy::kEscalateToCritical &&
             *strongest != ElevationPolicy::kEscalateToCritical)) {
            strongest      = policy;
            protected_name = table;
        }
    }
    if (strongest) {
        const RiskLevel before = result.level;
        result.level = (*strongest == ElevationPolicy::kEscalateToCritical)
            ? RiskLevel::kCritical
            : escalate(result.level);
        result.matches.push_back(RiskMatch{
            "protected-table",
            fmt::format("{} is protected ({}): {} -> {}", protected_name,
                        elevation_policy_to_string(*strongest),
                        risk_level_to_string(before), risk_level_to_string(result.level))
        });
    }

    // 5. 다중 테이블 쓰기 상향
    if (query.is_multi_table) {
        const RiskLevel before = result.level;
        result.level = escalate(result.level);
        result.matches.push_back(RiskMatch{
            "multi-table-write",
            fmt::format("statement writes across more than one table: {} -> {}",
                        risk_level_to_string(before), risk_level_to_string(result.level))
        });
    }

    return result;
}

RiskAssessment RiskClassifier::classify_parse_error(const ParseError& error) const {
    RiskAssessment result;
    result.level = RiskLevel::kCritical;
    result.matches.push_back(RiskMatch{
        "parse-error",
        fmt::format("unparseable statement: {}", error.message)
    });
    return result;
}
