#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 게이트 실행 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_* 갱신 메서드: 여러 실행 단위에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 조회 경로. 갱신 경로와 mutex 없이 분리된다.
//
// [격리 원칙]
// - 통계 갱신 실패가 게이트 실행으로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
//
// 카운터는 프로세스 수명 동안 누적되며 재시작 시 0 으로 초기화된다.
// 영속적인 이력은 감사 로그가 담당한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// GateStatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   block_rate: blocked / total_runs (total_runs == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct GateStatsSnapshot {
    std::uint64_t                         total_runs{0};
    std::uint64_t                         executed{0};
    std::uint64_t                         blocked{0};
    std::uint64_t                         aborted{0};
    std::uint64_t                         execution_failed{0};
    std::uint64_t                         snapshots{0};
    std::uint64_t                         rollbacks{0};
    std::uint64_t                         pending_approvals{0};
    double                                block_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class GateStatsCollector {
public:
    GateStatsCollector() noexcept = default;
    ~GateStatsCollector() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    GateStatsCollector(const GateStatsCollector&)            = delete;
    GateStatsCollector& operator=(const GateStatsCollector&) = delete;
    GateStatsCollector(GateStatsCollector&&)                 = delete;
    GateStatsCollector& operator=(GateStatsCollector&&)      = delete;

    void on_run_started() noexcept { total_runs_.fetch_add(1, std::memory_order_relaxed); }

    // on_executed
    //   실행을 시도한 실행 단위. failed 면 execution_failed 도 증가한다.
    void on_executed(bool failed) noexcept {
        executed_.fetch_add(1, std::memory_order_relaxed);
        if (failed) {
            execution_failed_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void on_blocked() noexcept { blocked_.fetch_add(1, std::memory_order_relaxed); }
    void on_aborted() noexcept { aborted_.fetch_add(1, std::memory_order_relaxed); }
    void on_snapshot() noexcept { snapshots_.fetch_add(1, std::memory_order_relaxed); }
    void on_rollback() noexcept { rollbacks_.fetch_add(1, std::memory_order_relaxed); }

    // 승인 대기 진입/이탈. 대기 중인 실행 수 게이지.
    void on_approval_wait_begin() noexcept {
        pending_approvals_.fetch_add(1, std::memory_order_relaxed);
    }
    void on_approval_wait_end() noexcept {
        const std::uint64_t current = pending_approvals_.load(std::memory_order_relaxed);
        if (current > 0) {
            pending_approvals_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] GateStatsSnapshot snapshot() const noexcept {
        const auto total   = total_runs_.load(std::memory_order_relaxed);
        const auto blocked = blocked_.load(std::memory_order_relaxed);

        double block_rate = 0.0;
        if (total > 0) {
            block_rate = static_cast<double>(blocked) / static_cast<double>(total);
        }

        return GateStatsSnapshot{
            .total_runs        = total,
            .executed          = executed_.load(std::memory_order_relaxed),
            .blocked           = blocked,
            .aborted           = aborted_.load(std::memory_order_relaxed),
            .execution_failed  = execution_failed_.load(std::memory_order_relaxed),
            .snapshots         = snapshots_.load(std::memory_order_relaxed),
            .rollbacks         = rollbacks_.load(std::memory_order_relaxed),
            .pending_approvals = pending_approvals_.load(std::memory_order_relaxed),
            .block_rate        = block_rate,
            .captured_at       = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_runs_{0};
    std::atomic<std::uint64_t> executed_{0};
    std::atomic<std::uint64_t> blocked_{0};
    std::atomic<std::uint64_t> aborted_{0};
    std::atomic<std::uint64_t> execution_failed_{0};
    std::atomic<std::uint64_t> snapshots_{0};
    std::atomic<std::uint64_t> rollbacks_{0};
    std::atomic<std::uint64_t> pending_approvals_{0};
};
