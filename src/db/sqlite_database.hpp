#pragma once

// ---------------------------------------------------------------------------
// sqlite_database.hpp
//
// sqlite3 기반 Database 구현.
//
// [엔진 고유 기능]
// - backup_to(): sqlite3_backup API 로 온라인 백업 (file_copy 스냅샷 전략).
// - attach()/detach(): 스냅샷 파일을 별칭 스키마로 붙여 복원 시 사용.
//
// [격리 수준 주의]
// SQLite 는 데이터베이스 파일 단위 잠금을 사용한다. 같은 파일을 여는 다른
// 프로세스의 쓰기와 backup_to() 가 겹치면 sqlite3_backup_step 이 재시작되어
// 일관된 사본을 만든다. 단 이 보장은 "파일 전체" 기준이다.
// ---------------------------------------------------------------------------

#include "db/database.hpp"

#include <expected>
#include <filesystem>
#include <memory>

struct sqlite3;

class SqliteDatabase final : public Database {
public:
    // open
    //   파일이 없으면 생성한다. ":memory:" 도 허용.
    [[nodiscard]] static std::expected<std::unique_ptr<SqliteDatabase>, GateError>
    open(const std::filesystem::path& path);

    ~SqliteDatabase() override;

    [[nodiscard]] Backend backend() const noexcept override { return Backend::kSqlite; }

    [[nodiscard]] std::expected<bool, GateError> table_exists(std::string_view table) override;

    // backup_to
    //   현재 main 데이터베이스 전체를 dest 파일로 복사한다 (기존 파일은 덮어씀).
    [[nodiscard]] std::expected<void, GateError> backup_to(const std::filesystem::path& dest);

    [[nodiscard]] std::expected<void, GateError> attach(const std::filesystem::path& file,
                                                        std::string_view alias);
    [[nodiscard]] std::expected<void, GateError> detach(std::string_view alias);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

protected:
    [[nodiscard]] std::expected<QueryResult, GateError> run_locked(std::string_view sql) override;
    [[nodiscard]] std::expected<void, GateError> open_read_only_locked() override;
    void close_read_only_locked() noexcept override;

private:
    SqliteDatabase(sqlite3* db, std::filesystem::path path) noexcept;

    sqlite3*              db_;
    std::filesystem::path path_;
};
