#pragma once

// ---------------------------------------------------------------------------
// statement_executor.hpp
//
// 실행 협력자 인터페이스. 게이트는 승인/스냅샷 이후 execute() 를 정확히 한 번
// 호출하며, 실패해도 재시도하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string_view>

#include "common/types.hpp"

class Database;

class StatementExecutor {
public:
    virtual ~StatementExecutor() = default;

    // execute
    //   성공: 영향받은 행 수 (조회 구문은 반환 행 수)
    //   실패: GateError{kExecutionFailed, 엔진 메시지}
    [[nodiscard]] virtual std::expected<std::uint64_t, GateError>
    execute(std::string_view sql) = 0;
};

// ---------------------------------------------------------------------------
// DatabaseExecutor
//   Database 연결 위에서 원문 구문을 그대로 실행한다.
// ---------------------------------------------------------------------------
class DatabaseExecutor final : public StatementExecutor {
public:
    explicit DatabaseExecutor(Database& db) noexcept : db_(db) {}

    [[nodiscard]] std::expected<std::uint64_t, GateError>
    execute(std::string_view sql) override;

private:
    Database& db_;
};
