#pragma once

// ---------------------------------------------------------------------------
// audit_log.hpp
//
// 추가 전용 감사 로그.
//
// [내구성]
// append() 는 레코드가 디스크에 기록된 뒤 반환한다.
//   O_APPEND 로 연 파일에 한 줄 write → fsync, 뮤텍스로 직렬화.
// 반환 이전에 실패하면 GateError{kAuditWriteFailed}. 부분 기록된 줄은
// 읽기 시 건너뛰고 경고 로그를 남긴다.
//
// [조회]
// get()/query() 는 매 호출마다 파일을 처음부터 읽는다. 별도 인덱스 없음.
// ---------------------------------------------------------------------------

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "audit/audit_record.hpp"
#include "common/types.hpp"

// ---------------------------------------------------------------------------
// AuditQuery
//   from/to: timestamp 포함 범위 [from, to]. 없으면 제한 없음.
//   min_level: 이 등급 이상만.
// ---------------------------------------------------------------------------
struct AuditQuery {
    std::optional<std::chrono::system_clock::time_point> from{};
    std::optional<std::chrono::system_clock::time_point> to{};
    std::optional<RiskLevel>                             min_level{};
};

class AuditLog {
public:
    virtual ~AuditLog() = default;

    // 같은 run_id 가 이미 있으면 GateError{kAuditWriteFailed}.
    [[nodiscard]] virtual std::expected<void, GateError> append(const AuditRecord& record) = 0;

    // 없으면 GateError{kNotFound}.
    [[nodiscard]] virtual std::expected<AuditRecord, GateError> get(const std::string& run_id) const = 0;

    // 기록 순서대로 반환.
    [[nodiscard]] virtual std::expected<std::vector<AuditRecord>, GateError>
    query(const AuditQuery& filter) const = 0;
};

// ---------------------------------------------------------------------------
// FileAuditLog
//   NDJSON 파일 구현.
// ---------------------------------------------------------------------------
class FileAuditLog final : public AuditLog {
public:
    // open
    //   상위 디렉터리를 만들고 기존 레코드의 run_id 를 적재한다.
    [[nodiscard]] static std::expected<std::unique_ptr<FileAuditLog>, GateError>
    open(const std::filesystem::path& path);

    [[nodiscard]] std::expected<void, GateError> append(const AuditRecord& record) override;
    [[nodiscard]] std::expected<AuditRecord, GateError> get(const std::string& run_id) const override;
    [[nodiscard]] std::expected<std::vector<AuditRecord>, GateError>
    query(const AuditQuery& filter) const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit FileAuditLog(std::filesystem::path path) : path_(std::move(path)) {}

    [[nodiscard]] std::expected<std::vector<AuditRecord>, GateError> read_all() const;

    std::filesystem::path           path_;
    mutable std::mutex              mutex_;
    std::unordered_set<std::string> run_ids_;
};
