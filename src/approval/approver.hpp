#pragma once

// ---------------------------------------------------------------------------
// approver.hpp
//
// 승인 협력자 포트.
//
// [계약]
// - request_approval() 은 timeout 안에 yes/no 를 돌려주거나 kTimeout 을 반환한다.
// - stop 이 요청되면 가능한 빨리 kCancelled 를 반환한다.
// - 구현은 예외를 던지지 않는다. 입력 채널 오류는 kNo 로 처리한다 (fail-closed).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stop_token>
#include <string>

#include "dryrun/dry_run_estimator.hpp"
#include "risk/risk_classifier.hpp"

struct ApprovalRequest {
    std::string                 run_id{};
    std::string                 sql{};
    RiskAssessment              risk{};
    std::optional<DryRunResult> dry_run{};
};

enum class ApprovalVerdict : std::uint8_t {
    kYes       = 0,
    kNo        = 1,
    kTimeout   = 2,
    kCancelled = 3,
};

[[nodiscard]] const char* approval_verdict_to_string(ApprovalVerdict verdict) noexcept;

// 사람이 읽는 요약: 위험 등급, 규칙 근거, 추정 행 수.
[[nodiscard]] std::string describe_request(const ApprovalRequest& request);

class Approver {
public:
    virtual ~Approver() = default;

    [[nodiscard]] virtual ApprovalVerdict request_approval(const ApprovalRequest&    request,
                                                           std::chrono::milliseconds timeout,
                                                           std::stop_token           stop) = 0;
};

// ---------------------------------------------------------------------------
// FixedApprover
//   미리 정한 답을 즉시 반환한다 (--yes / --no, 테스트).
// ---------------------------------------------------------------------------
class FixedApprover final : public Approver {
public:
    explicit FixedApprover(ApprovalVerdict verdict) noexcept : verdict_(verdict) {}

    [[nodiscard]] ApprovalVerdict request_approval(const ApprovalRequest&    request,
                                                   std::chrono::milliseconds timeout,
                                                   std::stop_token           stop) override;

    // 호출 횟수 (테스트용).
    [[nodiscard]] std::size_t calls() const noexcept { return calls_; }

private:
    ApprovalVerdict verdict_;
    std::size_t     calls_{0};
};

// ---------------------------------------------------------------------------
// ConsoleApprover
//   out 에 요청 요약을 출력하고 input_fd 에서 y/n 한 줄을 poll() 로 기다린다.
//   "y" / "yes" 만 승인으로 본다 (대소문자 무시). EOF 는 거부.
// ---------------------------------------------------------------------------
class ConsoleApprover final : public Approver {
public:
    ConsoleApprover(int input_fd, std::ostream& out) noexcept : input_fd_(input_fd), out_(out) {}

    [[nodiscard]] ApprovalVerdict request_approval(const ApprovalRequest&    request,
                                                   std::chrono::milliseconds timeout,
                                                   std::stop_token           stop) override;

private:
    int           input_fd_;
    std::ostream& out_;
};
