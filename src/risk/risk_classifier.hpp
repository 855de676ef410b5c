#pragma once

// ---------------------------------------------------------------------------
// risk_classifier.hpp
//
// 파싱된 구문 + 보호 테이블 레지스트리 → RiskAssessment.
//
// [fail-close 원칙: 절대 위반 금지]
// 1. 파서 오류 → classify_parse_error() → 반드시 CRITICAL
// 2. 분석 불가 구문(CALL/PREPARE/EXECUTE/알 수 없는 키워드) → CRITICAL
// 3. 어떤 규칙도 위험도를 "낮추지" 않는다. 최종 레벨 = 일치 규칙의 최댓값,
//    그 뒤 상향 규칙을 순서대로 적용한다.
//
// [규칙 평가 순서]
//   ddl / opaque-statement  → CRITICAL
//   dcl                     → HIGH
//   unfiltered-write        → HIGH   (WHERE 없는 UPDATE/DELETE)
//   row-impact-medium/high  → MEDIUM/HIGH (드라이런 추정 행 수, assess 전용)
//   read-only / filtered-write → LOW (위 규칙 불일치 시)
//   protected-table         → 한 단계 상향 또는 CRITICAL (엔트리 정책)
//   multi-table-write       → 한 단계 상향
//
// [순수성]
// I/O 없음. 같은 (구문, 레지스트리, 임계값, 추정 행 수) 입력은 항상 같은 결과.
// Replay Engine 이 이 성질에 의존하여 저장된 판정과 재계산 결과를 비교한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "parser/sql_parser.hpp"
#include "risk/protected_table_registry.hpp"
#include "risk/risk_level.hpp"

// ---------------------------------------------------------------------------
// RiskMatch
//   일치한 규칙 하나. rule_id 는 감사 로그/리플레이 비교 키로 사용된다.
// ---------------------------------------------------------------------------
struct RiskMatch {
    std::string rule_id{};
    std::string rationale{};

    bool operator==(const RiskMatch&) const = default;
};

// ---------------------------------------------------------------------------
// RiskAssessment
//   기본값 CRITICAL (fail-close): 채워지지 않은 판정은 안전하지 않은 것으로 본다.
// ---------------------------------------------------------------------------
struct RiskAssessment {
    RiskLevel              level{RiskLevel::kCritical};
    std::vector<RiskMatch> matches{};

    bool operator==(const RiskAssessment&) const = default;

    [[nodiscard]] std::vector<std::string> rule_ids() const;
    [[nodiscard]] bool has_rule(const std::string& rule_id) const;
};

// ---------------------------------------------------------------------------
// RiskThresholds
//   드라이런 추정 행 수 기반 레벨 경계. "초과"일 때 상위 레벨이 된다.
//   low_medium < medium_high 는 설정 로더가 보장한다.
// ---------------------------------------------------------------------------
struct RiskThresholds {
    std::uint64_t low_medium{100};
    std::uint64_t medium_high{1000};
};

class RiskClassifier {
public:
    explicit RiskClassifier(ProtectedTableRegistry registry, RiskThresholds thresholds = {});

    // classify
    //   구문 구조만으로 판정한다 (추정 행 수 규칙 미적용).
    [[nodiscard]] RiskAssessment classify(const ParsedQuery& query) const;

    // assess
    //   classify + 드라이런 추정 행 수 규칙. estimated_rows 가 없으면 classify 와 같다.
    [[nodiscard]] RiskAssessment assess(const ParsedQuery&          query,
                                        std::optional<std::uint64_t> estimated_rows) const;

    // classify_parse_error
    //   파서 오류 시 호출. 반드시 CRITICAL 을 반환한다.
    [[nodiscard]] RiskAssessment classify_parse_error(const ParseError& error) const;

    [[nodiscard]] const ProtectedTableRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const RiskThresholds& thresholds() const noexcept { return thresholds_; }

private:
    ProtectedTableRegistry registry_;
    RiskThresholds         thresholds_;
};
