#pragma once

// ---------------------------------------------------------------------------
// database.hpp
//
// 게이트가 사용하는 DB 연결 추상화.
//
// [연결 공유 모델]
// 연결 하나를 여러 실행 단위(드라이런/스냅샷/실행)가 공유한다.
// 모든 공개 연산은 연결별 recursive_mutex 로 직렬화되며, ReadOnlyScope 와
// transaction() 은 스코프 전체 동안 락을 유지한다. 같은 스레드의 중첩 호출
// (트랜잭션 안에서 run) 은 recursive 락으로 허용된다.
//
// [read-only 스코프 보장]
// begin_read_only() 가 반환한 ReadOnlyScope 는 소멸 시 항상 롤백한다.
// 성공/오류/예외/취소 어떤 경로로 빠져나가도 관찰 가능한 부작용이 남지 않는다.
//   SQLite     : BEGIN + PRAGMA query_only = ON   → query_only OFF + ROLLBACK
//   PostgreSQL : BEGIN TRANSACTION READ ONLY      → ROLLBACK
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

enum class Backend : std::uint8_t {
    kSqlite   = 0,
    kPostgres = 1,
};

[[nodiscard]] const char* backend_to_string(Backend backend) noexcept;
[[nodiscard]] std::optional<Backend> backend_from_string(std::string_view text);

// ---------------------------------------------------------------------------
// QueryResult
//   rows: NULL 값은 std::nullopt.
//   affected_rows: 쓰기 구문은 엔진이 보고한 변경 행 수, 조회 구문은 반환 행 수.
// ---------------------------------------------------------------------------
struct QueryResult {
    std::vector<std::string>                             columns{};
    std::vector<std::vector<std::optional<std::string>>> rows{};
    std::uint64_t                                        affected_rows{0};
};

class Database;

// ---------------------------------------------------------------------------
// ReadOnlyScope
//   읽기 전용 트랜잭션의 RAII 가드. 소멸자에서 롤백한다.
//   이동 가능, 복사 불가.
// ---------------------------------------------------------------------------
class ReadOnlyScope {
public:
    ReadOnlyScope(Database& db, std::unique_lock<std::recursive_mutex> lock) noexcept;
    ~ReadOnlyScope();

    ReadOnlyScope(const ReadOnlyScope&)            = delete;
    ReadOnlyScope& operator=(const ReadOnlyScope&) = delete;
    ReadOnlyScope(ReadOnlyScope&& other) noexcept;
    ReadOnlyScope& operator=(ReadOnlyScope&&) = delete;

private:
    Database*                              db_;
    std::unique_lock<std::recursive_mutex> lock_;
};

class Database {
public:
    using TxnBody = std::function<std::expected<void, GateError>()>;

    virtual ~Database() = default;

    Database(const Database&)            = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] virtual Backend backend() const noexcept = 0;

    // run
    //   구문 하나를 실행한다. 실패 시 GateError{kBackendError, 엔진 메시지}.
    [[nodiscard]] std::expected<QueryResult, GateError> run(std::string_view sql);

    // begin_read_only
    //   읽기 전용 트랜잭션을 열고 가드를 반환한다.
    [[nodiscard]] std::expected<ReadOnlyScope, GateError> begin_read_only();

    // transaction
    //   body 를 하나의 쓰기 트랜잭션 안에서 실행한다 (all-or-nothing).
    //   body 실패 시 롤백 후 body 의 오류를 그대로 반환한다.
    [[nodiscard]] std::expected<void, GateError> transaction(const TxnBody& body);

    [[nodiscard]] virtual std::expected<bool, GateError> table_exists(std::string_view table) = 0;

    // "schema"."table" 형태로 인용한다. 내부 " 는 "" 로 이스케이프.
    [[nodiscard]] static std::string quote_identifier(std::string_view name);

    // 'value' 형태 문자열 리터럴. 내부 ' 는 '' 로 이스케이프.
    [[nodiscard]] static std::string quote_literal(std::string_view value);

    // hold
    //   여러 호출(ATTACH → 트랜잭션 → DETACH 등)을 다른 실행 단위와 섞이지 않게
    //   묶을 때 사용한다. 같은 스레드의 후속 호출은 recursive 락으로 통과한다.
    [[nodiscard]] std::unique_lock<std::recursive_mutex> hold() {
        return std::unique_lock<std::recursive_mutex>{mutex_};
    }

protected:
    Database() = default;

    // 락을 이미 보유한 상태에서 호출된다.
    [[nodiscard]] virtual std::expected<QueryResult, GateError> run_locked(std::string_view sql) = 0;
    [[nodiscard]] virtual std::expected<void, GateError> open_read_only_locked() = 0;
    virtual void close_read_only_locked() noexcept = 0;

private:
    friend class ReadOnlyScope;

    std::recursive_mutex mutex_;
};
