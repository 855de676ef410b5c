#pragma once

// ---------------------------------------------------------------------------
// pg_database.hpp
//
// libpq 기반 Database 구현 (트랜잭션 엔진 백엔드).
// 스냅샷은 table_copy 전략만 지원한다 (엔진 고유 파일 백업 없음).
// ---------------------------------------------------------------------------

#include "db/database.hpp"

#include <expected>
#include <memory>
#include <string>

typedef struct pg_conn PGconn;  // libpq-fe.h 전방 선언과 동일

class PgDatabase final : public Database {
public:
    // connect
    //   conninfo: "postgresql://user:pw@host/db" 또는 "host=... dbname=..."
    [[nodiscard]] static std::expected<std::unique_ptr<PgDatabase>, GateError>
    connect(const std::string& conninfo);

    ~PgDatabase() override;

    [[nodiscard]] Backend backend() const noexcept override { return Backend::kPostgres; }

    [[nodiscard]] std::expected<bool, GateError> table_exists(std::string_view table) override;

protected:
    [[nodiscard]] std::expected<QueryResult, GateError> run_locked(std::string_view sql) override;
    [[nodiscard]] std::expected<void, GateError> open_read_only_locked() override;
    void close_read_only_locked() noexcept override;

private:
    explicit PgDatabase(PGconn* conn) noexcept;

    PGconn* conn_;
};
