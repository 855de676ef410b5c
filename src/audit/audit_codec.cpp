// ---------------------------------------------------------------------------
// audit_codec.cpp
//
// 쓰기는 fmt 로 직접 직렬화하고, 읽기는 yaml-cpp 로 파싱한다
// (JSON 은 YAML flow 문법의 부분집합).
// ---------------------------------------------------------------------------

#include "audit/audit_codec.hpp"

#include "common/json_util.hpp"

#include <stdexcept>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace {

std::string risk_reasons_json(const RiskAssessment& risk) {
    std::string out = "[";
    for (std::size_t i = 0; i < risk.matches.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += fmt::format(R"({{"rule": {}, "reason": {}}})",
                           json_quote(risk.matches[i].rule_id),
                           json_quote(risk.matches[i].rationale));
    }
    out += ']';
    return out;
}

std::string dry_run_json(const std::optional<DryRunResult>& dry_run) {
    if (!dry_run) {
        return "null";
    }
    return fmt::format(R"({{"estimated_rows": {}, "exact": {}, "rewritten_query": {}}})",
                       dry_run->estimated_rows,
                       dry_run->exact ? "true" : "false",
                       json_quote(dry_run->rewritten_query));
}

std::string override_json(const std::optional<ElevatedOverride>& ov) {
    if (!ov) {
        return "null";
    }
    return fmt::format(R"({{"authorized_by": {}, "reason": {}}})",
                       json_quote(ov->authorized_by), json_quote(ov->reason));
}

// 필수 문자열 필드. 누락/null 이면 std::invalid_argument.
std::string require_string(const YAML::Node& node, const char* key) {
    const auto value = node[key];
    if (!value || value.IsNull()) {
        throw std::invalid_argument(fmt::format("missing field '{}'", key));
    }
    return value.as<std::string>();
}

template <typename E>
E require_enum(const YAML::Node& node, const char* key, std::optional<E> (*parse)(std::string_view)) {
    const auto text  = require_string(node, key);
    const auto value = parse(text);
    if (!value) {
        throw std::invalid_argument(fmt::format("invalid value '{}' for '{}'", text, key));
    }
    return *value;
}

}  // namespace

std::string audit_record_to_json(const AuditRecord& r) {
    return fmt::format(
        R"({{"run_id": {}, "timestamp": {}, "kind": {}, "sql": {}, "fingerprint": {}, )"
        R"("risk_level": {}, "risk_reasons": {}, "dry_run": {}, "dry_run_error": {}, )"
        R"("approval_decision": {}, "snapshot_ref": {}, )"
        R"("execution": {{"status": {}, "affected_rows": {}, "error": {}}}, )"
        R"("final_status": {}, "abort_reason": {}, "elevated_override": {}, "approved_by": {}, )"
        R"("transitions": {}}})",
        json_quote(r.run_id),
        json_quote(format_iso8601(r.timestamp)),
        json_quote(record_kind_to_string(r.kind)),
        json_quote(r.sql),
        json_quote(r.fingerprint),
        json_quote(risk_level_to_string(r.risk.level)),
        risk_reasons_json(r.risk),
        dry_run_json(r.dry_run),
        json_quote(r.dry_run_error),
        json_quote(approval_decision_to_string(r.approval)),
        r.snapshot ? snapshot_ref_to_json(*r.snapshot) : std::string{"null"},
        json_quote(execution_status_to_string(r.execution.status)),
        r.execution.affected_rows,
        json_quote(r.execution.error),
        json_quote(final_status_to_string(r.final_status)),
        json_quote(abort_reason_to_string(r.abort_reason)),
        override_json(r.elevated_override),
        json_quote(r.approved_by),
        json_string_array(r.transitions));
}

std::expected<AuditRecord, std::string> audit_record_from_json(std::string_view line) {
    try {
        const YAML::Node root = YAML::Load(std::string(line));
        if (!root.IsMap()) {
            return std::unexpected(std::string{"audit record is not a JSON object"});
        }

        AuditRecord r;
        r.run_id = require_string(root, "run_id");

        const auto ts = parse_iso8601(require_string(root, "timestamp"));
        if (!ts) {
            return std::unexpected(fmt::format("{}: invalid timestamp", r.run_id));
        }
        r.timestamp   = *ts;
        r.kind        = require_enum(root, "kind", &record_kind_from_string);
        r.sql         = require_string(root, "sql");
        r.fingerprint = require_string(root, "fingerprint");

        const auto level_text = require_string(root, "risk_level");
        const auto level      = risk_level_from_string(level_text);
        if (!level) {
            return std::unexpected(fmt::format("{}: invalid risk_level '{}'", r.run_id, level_text));
        }
        r.risk.level = *level;
        if (const auto reasons = root["risk_reasons"]; reasons && reasons.IsSequence()) {
            for (const auto& item : reasons) {
                r.risk.matches.push_back(RiskMatch{
                    item["rule"].as<std::string>(), item["reason"].as<std::string>()});
            }
        }

        if (const auto dry = root["dry_run"]; dry && dry.IsMap()) {
            DryRunResult d;
            d.estimated_rows  = dry["estimated_rows"].as<std::uint64_t>();
            d.exact           = dry["exact"].as<bool>();
            d.rewritten_query = dry["rewritten_query"].as<std::string>();
            r.dry_run         = std::move(d);
        }
        if (const auto err = root["dry_run_error"]; err && !err.IsNull()) {
            r.dry_run_error = err.as<std::string>();
        }

        r.approval = require_enum(root, "approval_decision", &approval_decision_from_string);

        if (const auto snap = root["snapshot_ref"]; snap && snap.IsMap()) {
            auto ref = snapshot_ref_from_node(snap);
            if (!ref) {
                return std::unexpected(fmt::format("{}: {}", r.run_id, ref.error()));
            }
            r.snapshot = std::move(*ref);
        }

        const auto exec = root["execution"];
        if (!exec || !exec.IsMap()) {
            return std::unexpected(fmt::format("{}: missing execution", r.run_id));
        }
        r.execution.status        = require_enum(exec, "status", &execution_status_from_string);
        r.execution.affected_rows = exec["affected_rows"].as<std::uint64_t>(0);
        if (const auto err = exec["error"]; err && !err.IsNull()) {
            r.execution.error = err.as<std::string>();
        }

        r.final_status = require_enum(root, "final_status", &final_status_from_string);
        r.abort_reason = require_enum(root, "abort_reason", &abort_reason_from_string);

        if (const auto ov = root["elevated_override"]; ov && ov.IsMap()) {
            r.elevated_override = ElevatedOverride{
                ov["authorized_by"].as<std::string>(), ov["reason"].as<std::string>()};
        }
        if (const auto by = root["approved_by"]; by && !by.IsNull()) {
            r.approved_by = by.as<std::string>();
        }
        if (const auto tr = root["transitions"]; tr && tr.IsSequence()) {
            for (const auto& item : tr) {
                r.transitions.push_back(item.as<std::string>());
            }
        }
        return r;

    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("malformed audit record: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        return std::unexpected(fmt::format("malformed audit record: {}", e.what()));
    }
}
