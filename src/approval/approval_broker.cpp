#include "approval/approval_broker.hpp"

#include <spdlog/spdlog.h>

ApprovalVerdict ApprovalBroker::request_approval(const ApprovalRequest&    request,
                                                 std::chrono::milliseconds timeout,
                                                 std::stop_token           stop) {
    std::unique_lock lock(mutex_);
    slots_.insert_or_assign(request.run_id, Slot{request, std::nullopt});
    spdlog::info("approval: {} waiting for decision (risk={}, timeout={}ms)",
                 request.run_id, risk_level_to_string(request.risk.level), timeout.count());

    const bool decided = cv_.wait_for(lock, stop, timeout, [&] {
        const auto it = slots_.find(request.run_id);
        return it != slots_.end() && it->second.decision.has_value();
    });

    std::optional<bool> decision;
    if (const auto it = slots_.find(request.run_id); it != slots_.end()) {
        decision = it->second.decision;
        slots_.erase(it);
    }

    if (decided && decision) {
        return *decision ? ApprovalVerdict::kYes : ApprovalVerdict::kNo;
    }
    if (stop.stop_requested()) {
        return ApprovalVerdict::kCancelled;
    }
    return ApprovalVerdict::kTimeout;
}

bool ApprovalBroker::decide(const std::string& run_id, bool approve) {
    {
        std::lock_guard lock(mutex_);
        const auto it = slots_.find(run_id);
        if (it == slots_.end() || it->second.decision.has_value()) {
            return false;
        }
        it->second.decision = approve;
    }
    spdlog::info("approval: {} {}", run_id, approve ? "approved" : "denied");
    cv_.notify_all();
    return true;
}

std::vector<ApprovalRequest> ApprovalBroker::pending() const {
    std::lock_guard lock(mutex_);
    std::vector<ApprovalRequest> out;
    for (const auto& [run_id, slot] : slots_) {
        if (!slot.decision) {
            out.push_back(slot.request);
        }
    }
    return out;
}
