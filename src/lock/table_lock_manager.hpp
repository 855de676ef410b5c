#pragma once

// ---------------------------------------------------------------------------
// table_lock_manager.hpp
//
// 테이블 단위 상호 배제.
//
// [획득 규칙]
// - 요청한 테이블 집합 전체를 한 번에 획득한다 (all-or-nothing).
//   일부만 잡은 채 대기하지 않으므로 교착이 생기지 않는다.
// - 테이블 이름은 스키마 한정자를 떼고 소문자로 비교한다 (lock_key).
// - 빈 집합은 즉시 성공한다.
//
// [사용 구간]
// 게이트는 스냅샷 + 실행 구간에서만, 롤백은 복원 구간에서만 가드를 보유한다.
// 분류/드라이런은 락 없이 진행된다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

class TableLockManager;

// ---------------------------------------------------------------------------
// TableLockGuard
//   소멸 시 보유한 테이블을 모두 해제하고 대기자를 깨운다. 이동 가능.
// ---------------------------------------------------------------------------
class TableLockGuard {
public:
    TableLockGuard(TableLockManager& mgr, std::set<std::string> tables) noexcept;
    ~TableLockGuard();

    TableLockGuard(const TableLockGuard&)            = delete;
    TableLockGuard& operator=(const TableLockGuard&) = delete;
    TableLockGuard(TableLockGuard&& other) noexcept;
    TableLockGuard& operator=(TableLockGuard&&) = delete;

    [[nodiscard]] const std::set<std::string>& tables() const noexcept { return tables_; }

private:
    TableLockManager*     mgr_;
    std::set<std::string> tables_;
};

class TableLockManager {
public:
    TableLockManager() = default;

    TableLockManager(const TableLockManager&)            = delete;
    TableLockManager& operator=(const TableLockManager&) = delete;

    // acquire
    //   집합 전체가 비어 있을 때까지 대기한다.
    [[nodiscard]] TableLockGuard acquire(const std::vector<std::string>& tables);

    // try_acquire_for
    //   timeout 안에 획득하지 못하면 std::nullopt.
    [[nodiscard]] std::optional<TableLockGuard>
    try_acquire_for(const std::vector<std::string>& tables, std::chrono::milliseconds timeout);

    // 현재 보유 중인 테이블 수 (테스트/진단용).
    [[nodiscard]] std::size_t held_count() const;

    [[nodiscard]] static std::string lock_key(std::string_view table);

private:
    friend class TableLockGuard;

    [[nodiscard]] static std::set<std::string> normalize(const std::vector<std::string>& tables);
    [[nodiscard]] bool is_free(const std::set<std::string>& wanted) const;
    void release(const std::set<std::string>& tables) noexcept;

    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::set<std::string>   held_;
};
