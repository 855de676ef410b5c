#pragma once

// ---------------------------------------------------------------------------
// audit_codec.hpp
//
// AuditRecord ↔ JSON 한 줄 변환.
//
// [출력 필드 순서]
//   run_id, timestamp, kind, sql, fingerprint, risk_level, risk_reasons,
//   dry_run, dry_run_error, approval_decision, snapshot_ref, execution,
//   final_status, abort_reason, elevated_override, approved_by, transitions
// dry_run / snapshot_ref / elevated_override 는 없으면 null.
// approved_by 는 롤백 레코드에만 채워지며, 없는 줄을 읽으면 빈 문자열이다.
// 출력은 개행을 포함하지 않는다 (NDJSON 한 줄).
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>

#include "audit/audit_record.hpp"

[[nodiscard]] std::string audit_record_to_json(const AuditRecord& record);

// 실패 시 사람이 읽을 수 있는 오류 문자열.
[[nodiscard]] std::expected<AuditRecord, std::string> audit_record_from_json(std::string_view line);
