#pragma once

// ---------------------------------------------------------------------------
// approval_broker.hpp
//
// 외부 결정자(ApprovalServer 소켓 클라이언트 등)를 위한 Approver 구현.
//
// request_approval() 은 요청을 pending 맵에 올린 뒤 decide() 나 timeout,
// stop 요청 중 먼저 오는 것을 condition_variable_any 로 기다린다.
// 반환 시 pending 항목은 항상 제거된다.
// ---------------------------------------------------------------------------

#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "approval/approver.hpp"

class ApprovalBroker final : public Approver {
public:
    ApprovalBroker() = default;

    ApprovalBroker(const ApprovalBroker&)            = delete;
    ApprovalBroker& operator=(const ApprovalBroker&) = delete;

    [[nodiscard]] ApprovalVerdict request_approval(const ApprovalRequest&    request,
                                                   std::chrono::milliseconds timeout,
                                                   std::stop_token           stop) override;

    // decide
    //   대기 중인 run_id 에 결정을 전달한다. 대기 중이 아니면 false.
    bool decide(const std::string& run_id, bool approve);

    // 현재 대기 중인 요청 (run_id 순).
    [[nodiscard]] std::vector<ApprovalRequest> pending() const;

private:
    struct Slot {
        ApprovalRequest     request;
        std::optional<bool> decision;
    };

    mutable std::mutex           mutex_;
    std::condition_variable_any  cv_;
    std::map<std::string, Slot>  slots_;
};
