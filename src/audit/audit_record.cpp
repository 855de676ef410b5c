#include "audit/audit_record.hpp"

const char* record_kind_to_string(RecordKind kind) noexcept {
    switch (kind) {
        case RecordKind::kStatement: return "statement";
        case RecordKind::kRollback:  return "rollback";
    }
    return "statement";
}

const char* approval_decision_to_string(ApprovalDecision decision) noexcept {
    switch (decision) {
        case ApprovalDecision::kNone:     return "NONE";
        case ApprovalDecision::kAuto:     return "AUTO";
        case ApprovalDecision::kApproved: return "APPROVED";
        case ApprovalDecision::kDenied:   return "DENIED";
        case ApprovalDecision::kTimedOut: return "TIMED_OUT";
    }
    return "NONE";
}

const char* execution_status_to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::kNotRun:  return "NOT_RUN";
        case ExecutionStatus::kSuccess: return "SUCCESS";
        case ExecutionStatus::kFailed:  return "FAILED";
    }
    return "NOT_RUN";
}

const char* final_status_to_string(FinalStatus status) noexcept {
    switch (status) {
        case FinalStatus::kExecuted: return "EXECUTED";
        case FinalStatus::kAborted:  return "ABORTED";
        case FinalStatus::kBlocked:  return "BLOCKED";
    }
    return "BLOCKED";
}

const char* abort_reason_to_string(AbortReason reason) noexcept {
    switch (reason) {
        case AbortReason::kNone:           return "";
        case AbortReason::kDenied:         return "DENIED";
        case AbortReason::kTimeout:        return "TIMEOUT";
        case AbortReason::kDryRunFailed:   return "DRY_RUN_FAILED";
        case AbortReason::kSnapshotFailed: return "SNAPSHOT_FAILED";
        case AbortReason::kCancelled:      return "CANCELLED";
        case AbortReason::kLockFailed:     return "LOCK_FAILED";
    }
    return "";
}

std::optional<RecordKind> record_kind_from_string(std::string_view text) {
    if (text == "statement") { return RecordKind::kStatement; }
    if (text == "rollback")  { return RecordKind::kRollback; }
    return std::nullopt;
}

std::optional<ApprovalDecision> approval_decision_from_string(std::string_view text) {
    for (auto d : {ApprovalDecision::kNone, ApprovalDecision::kAuto, ApprovalDecision::kApproved,
                   ApprovalDecision::kDenied, ApprovalDecision::kTimedOut}) {
        if (text == approval_decision_to_string(d)) {
            return d;
        }
    }
    return std::nullopt;
}

std::optional<ExecutionStatus> execution_status_from_string(std::string_view text) {
    for (auto s : {ExecutionStatus::kNotRun, ExecutionStatus::kSuccess, ExecutionStatus::kFailed}) {
        if (text == execution_status_to_string(s)) {
            return s;
        }
    }
    return std::nullopt;
}

std::optional<FinalStatus> final_status_from_string(std::string_view text) {
    for (auto s : {FinalStatus::kExecuted, FinalStatus::kAborted, FinalStatus::kBlocked}) {
        if (text == final_status_to_string(s)) {
            return s;
        }
    }
    return std::nullopt;
}

std::optional<AbortReason> abort_reason_from_string(std::string_view text) {
    for (auto r : {AbortReason::kNone, AbortReason::kDenied, AbortReason::kTimeout,
                   AbortReason::kDryRunFailed, AbortReason::kSnapshotFailed,
                   AbortReason::kCancelled, AbortReason::kLockFailed}) {
        if (text == abort_reason_to_string(r)) {
            return r;
        }
    }
    return std::nullopt;
}
