#pragma once

// ---------------------------------------------------------------------------
// sql_parser.hpp
//
// 구문 분류, 테이블명/술어 추출을 담당하는 "최상위 토큰 스캔" 수준의 경량 파서.
// 게이트는 StatementParser 인터페이스만 의존하므로 방언별 정식 파서로 교체할 수 있다.
//
// [설계 한계 / 알려진 미탐 가능성]
// 1. 동적 SQL: PREPARE/EXECUTE/CALL 내부는 분석하지 않는다 (분류기에서 CRITICAL).
// 2. 방언 전용 구문: Oracle INSERT ALL, MySQL 다중 테이블 DELETE 는 최소한으로만
//    인식하며, 인식하지 못한 형태는 is_multi_table 로 보수적으로 표시한다.
// 3. 달러 인용($$...$$) 문자열은 지원하지 않는다. 사용 시 괄호/따옴표 불균형으로
//    ParseError 가 되어 fail-close 처리된다.
//
// [보수적 기본값]
// - 분석이 불확실하면 ParseError 또는 kUnknown 을 반환한다. 둘 다 분류기에서
//   CRITICAL 로 처리되므로 "안전"으로 오판되는 경로는 없다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // ParseError, ParseErrorCode

// ---------------------------------------------------------------------------
// SqlCommand
//   구문 첫 키워드 기반 분류.
//   kUnknown 은 분류 실패를 나타내며, 분류기에서 fail-close(CRITICAL) 처리한다.
// ---------------------------------------------------------------------------
enum class SqlCommand : std::uint8_t {
    kSelect   = 0,  // SELECT, 읽기 전용 WITH
    kInsert   = 1,  // INSERT, REPLACE
    kUpdate   = 2,
    kDelete   = 3,
    kDrop     = 4,
    kTruncate = 5,
    kAlter    = 6,
    kCreate   = 7,
    kGrant    = 8,
    kRevoke   = 9,
    kCall     = 10,
    kPrepare  = 11,
    kExecute  = 12,
    kUnknown  = 13,
};

// ---------------------------------------------------------------------------
// InsertSource
//   INSERT 의 데이터 원천. 드라이런 추정 방식을 결정한다.
// ---------------------------------------------------------------------------
enum class InsertSource : std::uint8_t {
    kNone          = 0,  // INSERT 가 아니거나 원천을 인식하지 못함
    kValues        = 1,  // VALUES (...), (...) 리터럴 행
    kSelect        = 2,  // INSERT ... SELECT 서브쿼리
    kDefaultValues = 3,  // DEFAULT VALUES
};

// ---------------------------------------------------------------------------
// ParsedQuery
//   파싱 성공 시 반환되는 구문 분석 결과.
//   raw_sql 은 원문 그대로 보존하며 실행/감사에 사용한다.
//   statement_sql 은 주석과 끝 세미콜론을 제거한 본문으로, 드라이런 재작성의 입력이다.
// ---------------------------------------------------------------------------
struct ParsedQuery {
    SqlCommand               command{SqlCommand::kUnknown};
    std::vector<std::string> tables{};            // 구문이 참조하는 모든 테이블 (중복 제거)
    std::string              target_table{};      // 쓰기/DDL 대상 테이블 (없으면 빈 문자열)
    std::string              raw_sql{};
    std::string              statement_sql{};
    bool                     has_where_clause{false};
    std::string              where_clause{};      // WHERE 뒤 술어 (키워드 제외)
    std::string              from_clause{};       // DELETE/UPDATE 카운트 쿼리의 FROM 원천
    InsertSource             insert_source{InsertSource::kNone};
    std::uint64_t            insert_value_rows{0};
    std::string              insert_select_sql{}; // INSERT ... SELECT 의 SELECT 부분
    bool                     is_multi_table{false};
    bool                     row_limited{false};  // DELETE/UPDATE ... ORDER BY / LIMIT

    // SELECT 를 제외한 모든 구문은 상태를 변경할 수 있는 것으로 본다.
    [[nodiscard]] bool is_mutating() const noexcept { return command != SqlCommand::kSelect; }

    // INSERT/UPDATE/DELETE
    [[nodiscard]] bool is_dml_write() const noexcept {
        return command == SqlCommand::kInsert || command == SqlCommand::kUpdate ||
               command == SqlCommand::kDelete;
    }
};

[[nodiscard]] const char* command_to_string(SqlCommand cmd) noexcept;

// ---------------------------------------------------------------------------
// StatementParser
//   파서 협력자 인터페이스. 실패 시 std::unexpected(ParseError).
//
//   [파서 보안 원칙]
//   파싱 실패는 절대 실행으로 이어지지 않는다. 호출자는 error path 에서
//   RiskClassifier::classify_parse_error 를 통해 CRITICAL 을 적용해야 한다.
// ---------------------------------------------------------------------------
class StatementParser {
public:
    virtual ~StatementParser() = default;

    [[nodiscard]] virtual std::expected<ParsedQuery, ParseError>
    parse(std::string_view sql) const = 0;
};

// ---------------------------------------------------------------------------
// SqlParser
//   SQLite / PostgreSQL / MySQL 공통 부분집합을 다루는 기본 파서. stateless.
// ---------------------------------------------------------------------------
class SqlParser final : public StatementParser {
public:
    SqlParser()           = default;
    ~SqlParser() override = default;

    SqlParser(const SqlParser&)            = default;
    SqlParser& operator=(const SqlParser&) = default;
    SqlParser(SqlParser&&)                 = default;
    SqlParser& operator=(SqlParser&&)      = default;

    // parse
    //   sql: 원문 SQL (단일 구문, 끝 세미콜론 허용)
    //   반환: ParsedQuery 또는 ParseError
    //
    //   ParseError 조건:
    //   - 빈 입력, 주석만 있는 입력
    //   - 문자열/주석 밖 세미콜론으로 구분된 복수 구문
    //   - 닫히지 않은 따옴표, 괄호 불균형
    [[nodiscard]] std::expected<ParsedQuery, ParseError>
    parse(std::string_view sql) const override;
};
