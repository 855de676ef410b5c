// ---------------------------------------------------------------------------
// test_approval_broker.cpp
//
// Approver 구현체 단위 테스트.
//
// [테스트 범위]
// - FixedApprover: 고정 답 반환, stop 요청 시 kCancelled
// - ConsoleApprover: pipe 로 y/n 입력, EOF → kNo, 무응답 → kTimeout
// - ApprovalBroker: decide() 로 승인/거부, timeout, stop 요청,
//   pending() 목록과 대기 종료 후 정리, 대기 중이 아닌 run_id 거부
// - describe_request: 위험 등급/규칙/추정 행 수 포함
// ---------------------------------------------------------------------------

#include "approval/approval_broker.hpp"
#include "approval/approver.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <chrono>
#include <future>
#include <sstream>
#include <stop_token>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

ApprovalRequest make_request(const std::string& run_id) {
    ApprovalRequest request;
    request.run_id     = run_id;
    request.sql        = "DELETE FROM visits WHERE visited_at < '2020-01-01'";
    request.risk.level = RiskLevel::kHigh;
    request.risk.matches.push_back(RiskMatch{"row-count-high", "estimated 3214 rows"});
    request.dry_run = DryRunResult{.estimated_rows = 3214, .exact = true, .rewritten_query = "SELECT 1"};
    return request;
}

// 대기열에 run_id 가 올라올 때까지 기다린다.
bool wait_until_pending(const ApprovalBroker& broker, const std::string& run_id) {
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        for (const auto& r : broker.pending()) {
            if (r.run_id == run_id) {
                return true;
            }
        }
        std::this_thread::sleep_for(5ms);
    }
    return false;
}

// 테스트용 pipe. 읽기 끝은 ConsoleApprover 에, 쓰기 끝은 테스트가 쓴다.
class Pipe {
public:
    Pipe() {
        int fds[2];
        if (::pipe(fds) == 0) {
            read_fd_  = fds[0];
            write_fd_ = fds[1];
        }
    }
    ~Pipe() {
        close_write();
        if (read_fd_ >= 0) {
            ::close(read_fd_);
        }
    }

    Pipe(const Pipe&)            = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] int read_fd() const noexcept { return read_fd_; }

    bool write(const std::string& text) {
        return ::write(write_fd_, text.data(), text.size()) == static_cast<ssize_t>(text.size());
    }

    void close_write() {
        if (write_fd_ >= 0) {
            ::close(write_fd_);
            write_fd_ = -1;
        }
    }

private:
    int read_fd_{-1};
    int write_fd_{-1};
};

}  // namespace

// ---------------------------------------------------------------------------
// FixedApprover
// ---------------------------------------------------------------------------
TEST(FixedApprover, ReturnsConfiguredVerdict) {
    FixedApprover yes{ApprovalVerdict::kYes};
    FixedApprover no{ApprovalVerdict::kNo};

    EXPECT_EQ(yes.request_approval(make_request("RUN_1"), 1s, {}), ApprovalVerdict::kYes);
    EXPECT_EQ(no.request_approval(make_request("RUN_2"), 1s, {}), ApprovalVerdict::kNo);
    EXPECT_EQ(yes.calls(), 1u);
}

TEST(FixedApprover, StopRequestedIsCancelled) {
    FixedApprover     approver{ApprovalVerdict::kYes};
    std::stop_source  source;
    source.request_stop();
    EXPECT_EQ(approver.request_approval(make_request("RUN_1"), 1s, source.get_token()),
              ApprovalVerdict::kCancelled);
}

// ---------------------------------------------------------------------------
// ConsoleApprover
// ---------------------------------------------------------------------------
TEST(ConsoleApprover, YesLineApproves) {
    Pipe pipe;
    ASSERT_GE(pipe.read_fd(), 0);
    ASSERT_TRUE(pipe.write(" YES \n"));

    std::ostringstream out;
    ConsoleApprover    approver{pipe.read_fd(), out};
    EXPECT_EQ(approver.request_approval(make_request("RUN_1"), 2s, {}), ApprovalVerdict::kYes);
    EXPECT_NE(out.str().find("HIGH"), std::string::npos) << out.str();
    EXPECT_NE(out.str().find("[y/N]"), std::string::npos) << out.str();
}

TEST(ConsoleApprover, AnythingElseDenies) {
    Pipe pipe;
    ASSERT_TRUE(pipe.write("maybe\n"));

    std::ostringstream out;
    ConsoleApprover    approver{pipe.read_fd(), out};
    EXPECT_EQ(approver.request_approval(make_request("RUN_1"), 2s, {}), ApprovalVerdict::kNo);
}

TEST(ConsoleApprover, EndOfInputDenies) {
    Pipe pipe;
    ASSERT_TRUE(pipe.write("y"));
    pipe.close_write();

    std::ostringstream out;
    ConsoleApprover    approver{pipe.read_fd(), out};
    EXPECT_EQ(approver.request_approval(make_request("RUN_1"), 2s, {}), ApprovalVerdict::kNo);
}

TEST(ConsoleApprover, SilenceTimesOut) {
    Pipe pipe;

    std::ostringstream out;
    ConsoleApprover    approver{pipe.read_fd(), out};
    const auto start   = std::chrono::steady_clock::now();
    EXPECT_EQ(approver.request_approval(make_request("RUN_1"), 50ms, {}), ApprovalVerdict::kTimeout);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

// ---------------------------------------------------------------------------
// ApprovalBroker
// ---------------------------------------------------------------------------
TEST(ApprovalBroker, DecideApprovesWaitingRun) {
    ApprovalBroker broker;

    auto verdict = std::async(std::launch::async, [&broker] {
        return broker.request_approval(make_request("RUN_A"), 5s, {});
    });
    ASSERT_TRUE(wait_until_pending(broker, "RUN_A"));

    const auto pending = broker.pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending.front().risk.level, RiskLevel::kHigh);
    ASSERT_TRUE(pending.front().dry_run.has_value());
    EXPECT_EQ(pending.front().dry_run->estimated_rows, 3214u);

    EXPECT_TRUE(broker.decide("RUN_A", true));
    EXPECT_EQ(verdict.get(), ApprovalVerdict::kYes);
    EXPECT_TRUE(broker.pending().empty()) << "decided run must leave the queue";
}

TEST(ApprovalBroker, DecideDeniesWaitingRun) {
    ApprovalBroker broker;

    auto verdict = std::async(std::launch::async, [&broker] {
        return broker.request_approval(make_request("RUN_B"), 5s, {});
    });
    ASSERT_TRUE(wait_until_pending(broker, "RUN_B"));

    EXPECT_TRUE(broker.decide("RUN_B", false));
    EXPECT_FALSE(broker.decide("RUN_B", true)) << "second decision must be rejected";
    EXPECT_EQ(verdict.get(), ApprovalVerdict::kNo);
}

TEST(ApprovalBroker, UnknownRunIsRejected) {
    ApprovalBroker broker;
    EXPECT_FALSE(broker.decide("RUN_NOBODY", true));
}

TEST(ApprovalBroker, NoDecisionTimesOut) {
    ApprovalBroker broker;
    EXPECT_EQ(broker.request_approval(make_request("RUN_C"), 30ms, {}), ApprovalVerdict::kTimeout);
    EXPECT_TRUE(broker.pending().empty());
    EXPECT_FALSE(broker.decide("RUN_C", true)) << "late decision must not be accepted";
}

TEST(ApprovalBroker, StopRequestCancelsWait) {
    ApprovalBroker   broker;
    std::stop_source source;

    auto verdict = std::async(std::launch::async, [&broker, token = source.get_token()] {
        return broker.request_approval(make_request("RUN_D"), 5s, token);
    });
    ASSERT_TRUE(wait_until_pending(broker, "RUN_D"));

    source.request_stop();
    ASSERT_EQ(verdict.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(verdict.get(), ApprovalVerdict::kCancelled);
    EXPECT_TRUE(broker.pending().empty());
}

TEST(ApprovalBroker, IndependentWaiters) {
    ApprovalBroker broker;

    auto first = std::async(std::launch::async, [&broker] {
        return broker.request_approval(make_request("RUN_E1"), 5s, {});
    });
    auto second = std::async(std::launch::async, [&broker] {
        return broker.request_approval(make_request("RUN_E2"), 5s, {});
    });
    ASSERT_TRUE(wait_until_pending(broker, "RUN_E1"));
    ASSERT_TRUE(wait_until_pending(broker, "RUN_E2"));

    EXPECT_TRUE(broker.decide("RUN_E2", false));
    EXPECT_EQ(second.get(), ApprovalVerdict::kNo);
    EXPECT_EQ(broker.pending().size(), 1u);

    EXPECT_TRUE(broker.decide("RUN_E1", true));
    EXPECT_EQ(first.get(), ApprovalVerdict::kYes);
}

// ---------------------------------------------------------------------------
// describe_request
// ---------------------------------------------------------------------------
TEST(DescribeRequest, IncludesRiskRulesAndEstimate) {
    auto request = make_request("RUN_F");
    request.dry_run->exact = false;

    const auto text = describe_request(request);
    EXPECT_NE(text.find("RUN_F"), std::string::npos);
    EXPECT_NE(text.find("HIGH"), std::string::npos);
    EXPECT_NE(text.find("[row-count-high] estimated 3214 rows"), std::string::npos) << text;
    EXPECT_NE(text.find("estimated rows: 3214 (approximate)"), std::string::npos) << text;
}
