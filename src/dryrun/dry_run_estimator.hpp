#pragma once

// ---------------------------------------------------------------------------
// dry_run_estimator.hpp
//
// 쓰기 구문을 "영향 행 수를 세는 읽기 전용 쿼리"로 재작성하고, read-only
// 트랜잭션 안에서 실행하여 영향 범위를 추정한다.
//
// [재작성 정책]
//   SELECT / WITH          → SELECT COUNT(*) FROM (<원문>) AS dbsafe_t          exact
//   DELETE                 → SELECT COUNT(*) FROM <원천> [WHERE <술어>]           exact*
//   UPDATE                 → 같은 방식, UPDATE 의 대상/술어 사용                  exact*
//   INSERT VALUES          → 리터럴 행 수 (DB 미접근)                              exact
//   INSERT DEFAULT VALUES  → 1 (DB 미접근)                                         exact
//   INSERT SELECT          → SELECT COUNT(*) FROM (<서브쿼리>) AS dbsafe_t        근사
//   TRUNCATE               → 대상 테이블 행 수 합                                  exact
//   DROP TABLE             → 대상 테이블 행 수 합 (스키마 손실은 행 수로 표현 불가) 근사
//   ALTER/CREATE/GRANT/REVOKE → 0 행, 쿼리 없음                                    근사
//   CALL/PREPARE/EXECUTE/UNKNOWN → DryRunError
//   (*) 다중 테이블 조인이거나 ORDER BY/LIMIT 가 있으면 근사로 표시한다.
//
// [실행 규율: 절대 위반 금지]
// 재작성 쿼리는 항상 Database::begin_read_only() 스코프 안에서 실행된다.
// 스코프는 성공/실패/예외 모든 경로에서 롤백되므로 추정기는 부작용을 남기지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>

#include "common/types.hpp"
#include "parser/sql_parser.hpp"

class Database;

struct DryRunResult {
    std::uint64_t estimated_rows{0};
    bool          exact{false};
    std::string   rewritten_query{};  // DB 를 거치지 않은 추정이면 빈 문자열

    bool operator==(const DryRunResult&) const = default;
};

// ---------------------------------------------------------------------------
// RewritePlan
//   rewrite() 의 순수 결과. count_query 가 비어 있으면 literal_rows 를 그대로 쓴다.
// ---------------------------------------------------------------------------
struct RewritePlan {
    std::string   count_query{};
    std::uint64_t literal_rows{0};
    bool          exact{false};
};

class DryRunEstimator {
public:
    explicit DryRunEstimator(Database& db) noexcept : db_(db) {}

    // rewrite
    //   I/O 없는 재작성. 재작성 불가 구문은 GateError{kDryRunFailed}.
    [[nodiscard]] static std::expected<RewritePlan, GateError> rewrite(const ParsedQuery& query);

    // estimate
    //   rewrite + read-only 실행.
    [[nodiscard]] std::expected<DryRunResult, GateError> estimate(const ParsedQuery& query);

private:
    Database& db_;
};
