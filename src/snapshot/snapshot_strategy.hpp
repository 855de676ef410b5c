#pragma once

// ---------------------------------------------------------------------------
// snapshot_strategy.hpp
//
// 스냅샷 생성/복원 전략.
//
// [전략]
//   TableCopyStrategy  : 대상 테이블마다 CREATE TABLE <사본> AS SELECT * 를
//                        하나의 트랜잭션 안에서 수행한다. 모든 백엔드에서 동작.
//   SqliteFileStrategy : sqlite3_backup 으로 데이터베이스 파일 전체를 복사한다.
//                        SQLite 전용. 복원은 백업 파일을 ATTACH 하여 대상
//                        테이블만 되돌린다.
//
// [복원 규칙]
// 복원은 대상 테이블 전체를 하나의 트랜잭션으로 처리한다 (all-or-nothing).
// 현재 테이블이 있으면 내용을 비우고 사본 행을 다시 넣고, 없으면 (DROP 된 경우)
// 사본으로부터 테이블을 다시 만든다.
// 사본 이후 추가된 컬럼은 INSERT ... SELECT * 의 컬럼 수 불일치로 실패하며,
// 그 경우 복원 전체가 롤백된다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "snapshot/snapshot_ref.hpp"

class Database;
class SqliteDatabase;

class SnapshotStrategy {
public:
    virtual ~SnapshotStrategy() = default;

    [[nodiscard]] virtual SnapshotStrategyKind kind() const noexcept = 0;

    // capture
    //   tables 의 현재 상태를 보존하고 location 문자열을 반환한다.
    //   실패 시 GateError{kBackendError}. 부분 사본은 남기지 않는다.
    [[nodiscard]] virtual std::expected<std::string, GateError>
    capture(const std::string& snapshot_id, const std::vector<std::string>& tables) = 0;

    [[nodiscard]] virtual std::expected<void, GateError> restore(const SnapshotRef& ref) = 0;
};

class TableCopyStrategy final : public SnapshotStrategy {
public:
    explicit TableCopyStrategy(Database& db) noexcept : db_(db) {}

    [[nodiscard]] SnapshotStrategyKind kind() const noexcept override {
        return SnapshotStrategyKind::kTableCopy;
    }

    [[nodiscard]] std::expected<std::string, GateError>
    capture(const std::string& snapshot_id, const std::vector<std::string>& tables) override;

    [[nodiscard]] std::expected<void, GateError> restore(const SnapshotRef& ref) override;

    // dbsafe_snapshot_20240102t030405_a1b2c3d4_0
    [[nodiscard]] static std::string copy_table_name(const std::string& snapshot_id, std::size_t index);

private:
    Database& db_;
};

class SqliteFileStrategy final : public SnapshotStrategy {
public:
    SqliteFileStrategy(SqliteDatabase& db, std::filesystem::path dir)
        : db_(db)
        , dir_(std::move(dir))
    {}

    [[nodiscard]] SnapshotStrategyKind kind() const noexcept override {
        return SnapshotStrategyKind::kFileCopy;
    }

    [[nodiscard]] std::expected<std::string, GateError>
    capture(const std::string& snapshot_id, const std::vector<std::string>& tables) override;

    [[nodiscard]] std::expected<void, GateError> restore(const SnapshotRef& ref) override;

private:
    [[nodiscard]] std::expected<void, GateError> restore_attached(const SnapshotRef& ref);

    SqliteDatabase&       db_;
    std::filesystem::path dir_;
};
