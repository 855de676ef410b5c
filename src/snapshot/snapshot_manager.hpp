#pragma once

// ---------------------------------------------------------------------------
// snapshot_manager.hpp
//
// 실행 직전 대상 테이블의 스냅샷을 만들고, 롤백 요청 시 복원한다.
//
// [카탈로그]
// 스냅샷마다 <dir>/<id>.json 에 SnapshotRef 를 기록한다. 임시 파일에 쓴 뒤
// rename 하므로 부분 기록된 카탈로그 항목은 존재하지 않는다.
// 스냅샷은 자동으로 삭제되지 않는다 (보존 정책 없음).
//
// [전략 선택]
//   table_copy : 모든 백엔드
//   file_copy  : SQLite 파일 DB 전용 (":memory:" 불가)
//   auto       : SQLite 파일 DB 이면 file_copy, 그 외 table_copy
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "snapshot/snapshot_ref.hpp"
#include "snapshot/snapshot_strategy.hpp"

class Database;

class SnapshotManager {
public:
    // create
    //   preferred: nullopt 이면 auto.
    //   백엔드가 지원하지 않는 전략을 요구하면 GateError{kInvalidConfig}.
    [[nodiscard]] static std::expected<std::unique_ptr<SnapshotManager>, GateError>
    create(Database& db, std::filesystem::path dir, std::optional<SnapshotStrategyKind> preferred);

    SnapshotManager(const SnapshotManager&)            = delete;
    SnapshotManager& operator=(const SnapshotManager&) = delete;

    // snapshot
    //   tables 는 정렬/중복 제거 후 보존된다 (SQLite 는 소문자화까지).
    //   may_be_missing 에 있는 테이블만 존재하지 않을 때 제외한다. 그 외 테이블이
    //   없거나 조회에 실패하면 GateError{kSnapshotFailed}. 빈 집합은 허용된다.
    [[nodiscard]] std::expected<SnapshotRef, GateError>
    snapshot(const std::vector<std::string>& tables, const std::vector<std::string>& may_be_missing = {});

    // restore
    //   카탈로그에 없는 id 는 GateError{kNotFound}, 복원 실패는 GateError{kBackendError}.
    [[nodiscard]] std::expected<void, GateError> restore(const SnapshotRef& ref);
    [[nodiscard]] std::expected<void, GateError> restore(const std::string& snapshot_id);

    [[nodiscard]] std::expected<SnapshotRef, GateError> find(const std::string& snapshot_id) const;

    // 최신순.
    [[nodiscard]] std::vector<SnapshotRef> list() const;

    [[nodiscard]] SnapshotStrategyKind active_strategy() const noexcept { return active_; }
    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

private:
    SnapshotManager(Database& db, std::filesystem::path dir) : db_(db), dir_(std::move(dir)) {}

    [[nodiscard]] std::expected<void, GateError> write_catalog(const SnapshotRef& ref) const;
    [[nodiscard]] std::filesystem::path catalog_path(const std::string& snapshot_id) const;

    Database&                                                     db_;
    std::filesystem::path                                         dir_;
    std::map<SnapshotStrategyKind, std::unique_ptr<SnapshotStrategy>> strategies_;
    SnapshotStrategyKind                                          active_{SnapshotStrategyKind::kTableCopy};
};
