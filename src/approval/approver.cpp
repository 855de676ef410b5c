#include "approval/approver.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <ostream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

// poll() 한 번의 최대 대기. stop 요청을 확인하는 주기이기도 하다.
constexpr std::chrono::milliseconds kPollSlice{200};

bool is_yes(std::string answer) {
    answer.erase(std::remove_if(answer.begin(), answer.end(),
                                [](unsigned char c) { return std::isspace(c) != 0; }),
                 answer.end());
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

}  // namespace

const char* approval_verdict_to_string(ApprovalVerdict verdict) noexcept {
    switch (verdict) {
        case ApprovalVerdict::kYes:       return "yes";
        case ApprovalVerdict::kNo:        return "no";
        case ApprovalVerdict::kTimeout:   return "timeout";
        case ApprovalVerdict::kCancelled: return "cancelled";
    }
    return "no";
}

std::string describe_request(const ApprovalRequest& request) {
    std::string text = fmt::format("run {}\n  sql:  {}\n  risk: {}\n",
                                   request.run_id, request.sql,
                                   risk_level_to_string(request.risk.level));
    for (const auto& match : request.risk.matches) {
        text += fmt::format("    - [{}] {}\n", match.rule_id, match.rationale);
    }
    if (request.dry_run) {
        text += fmt::format("  estimated rows: {}{}\n", request.dry_run->estimated_rows,
                            request.dry_run->exact ? "" : " (approximate)");
    }
    return text;
}

ApprovalVerdict FixedApprover::request_approval(const ApprovalRequest& request,
                                                std::chrono::milliseconds /*timeout*/,
                                                std::stop_token stop) {
    ++calls_;
    if (stop.stop_requested()) {
        return ApprovalVerdict::kCancelled;
    }
    spdlog::debug("approval: fixed answer '{}' for {}", approval_verdict_to_string(verdict_), request.run_id);
    return verdict_;
}

ApprovalVerdict ConsoleApprover::request_approval(const ApprovalRequest&    request,
                                                  std::chrono::milliseconds timeout,
                                                  std::stop_token           stop) {
    out_ << describe_request(request)
         << fmt::format("Approve execution? [y/N] (timeout {}s): ",
                        std::chrono::duration_cast<std::chrono::seconds>(timeout).count())
         << std::flush;

    const auto  deadline = std::chrono::steady_clock::now() + timeout;
    std::string line;

    for (;;) {
        if (stop.stop_requested()) {
            out_ << "\n" << std::flush;
            return ApprovalVerdict::kCancelled;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            out_ << "\n" << std::flush;
            return ApprovalVerdict::kTimeout;
        }

        pollfd pfd{};
        pfd.fd     = input_fd_;
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, static_cast<int>(std::min(remaining, kPollSlice).count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("approval: poll on fd {} failed (errno={})", input_fd_, errno);
            return ApprovalVerdict::kNo;
        }
        if (rc == 0) {
            continue;
        }

        char ch = 0;
        const ssize_t n = ::read(input_fd_, &ch, 1);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            // EOF 또는 읽기 오류: 줄이 완성되지 않았으므로 거부
            return ApprovalVerdict::kNo;
        }
        if (ch == '\n') {
            return is_yes(line) ? ApprovalVerdict::kYes : ApprovalVerdict::kNo;
        }
        line.push_back(ch);
    }
}
