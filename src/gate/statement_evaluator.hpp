#pragma once

// ---------------------------------------------------------------------------
// statement_evaluator.hpp
//
// 구문 하나에 대한 "판정 단계"(파싱 → 구조 분류 → 드라이런 → 최종 분류).
// ApprovalGate 와 ReplayEngine 이 같은 경로를 공유하므로, 리플레이는 게이트가
// 실제로 거친 판정을 그대로 재현한다.
//
// [분기 규칙]
//   파싱 실패                           → classify_parse_error (CRITICAL), 드라이런 없음
//   구조 분류 CRITICAL + override 없음  → 드라이런 없음 (DB 미접근)
//   드라이런 실패                       → 구조 분류 결과 유지, dry_run_error 기록
//   그 외                               → assess(구문, 추정 행 수)
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "dryrun/dry_run_estimator.hpp"
#include "parser/sql_parser.hpp"
#include "risk/risk_classifier.hpp"

struct Evaluation {
    std::optional<ParsedQuery>  parsed{};          // 파싱 실패 시 nullopt
    std::optional<ParseError>   parse_error{};
    RiskAssessment              structural{};      // 드라이런 이전 구조 분류
    RiskAssessment              risk{};            // 최종 판정
    bool                        dry_run_attempted{false};
    std::optional<DryRunResult> dry_run{};
    std::string                 dry_run_error{};

    [[nodiscard]] bool dry_run_failed() const noexcept { return dry_run_attempted && !dry_run; }
};

class StatementEvaluator {
public:
    StatementEvaluator(const StatementParser& parser,
                       const RiskClassifier&  classifier,
                       DryRunEstimator&       estimator) noexcept
        : parser_(parser), classifier_(classifier), estimator_(estimator) {}

    // evaluate
    //   has_override: 제출 시 elevated override 가 있었는지. 구조적으로 CRITICAL 인
    //   구문도 override 가 있으면 승인자에게 보여줄 드라이런을 수행한다.
    [[nodiscard]] Evaluation evaluate(std::string_view sql, bool has_override) const;

    [[nodiscard]] const RiskClassifier& classifier() const noexcept { return classifier_; }

private:
    const StatementParser& parser_;
    const RiskClassifier&  classifier_;
    DryRunEstimator&       estimator_;
};
