#include "lock/table_lock_manager.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

TableLockGuard::TableLockGuard(TableLockManager& mgr, std::set<std::string> tables) noexcept
    : mgr_(&mgr)
    , tables_(std::move(tables))
{}

TableLockGuard::TableLockGuard(TableLockGuard&& other) noexcept
    : mgr_(other.mgr_)
    , tables_(std::move(other.tables_))
{
    other.mgr_ = nullptr;
    other.tables_.clear();
}

TableLockGuard::~TableLockGuard() {
    if (mgr_ != nullptr) {
        mgr_->release(tables_);
    }
}

// 락 키는 스키마를 뗀 소문자 테이블명이다. visits 와 main.visits 는 같은 키가 되고,
// 서로 다른 스키마의 같은 이름은 함께 잠긴다 (과잉 잠금은 허용).
std::string TableLockManager::lock_key(std::string_view table) {
    if (const auto dot = table.rfind('.'); dot != std::string_view::npos) {
        table.remove_prefix(dot + 1);
    }
    std::string key(table);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

std::set<std::string> TableLockManager::normalize(const std::vector<std::string>& tables) {
    std::set<std::string> out;
    for (const auto& name : tables) {
        out.insert(lock_key(name));
    }
    return out;
}

bool TableLockManager::is_free(const std::set<std::string>& wanted) const {
    return std::none_of(wanted.begin(), wanted.end(),
                        [this](const std::string& t) { return held_.contains(t); });
}

TableLockGuard TableLockManager::acquire(const std::vector<std::string>& tables) {
    auto wanted = normalize(tables);

    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return is_free(wanted); });
    held_.insert(wanted.begin(), wanted.end());
    spdlog::debug("lock: acquired {} table(s)", wanted.size());
    return TableLockGuard{*this, std::move(wanted)};
}

std::optional<TableLockGuard>
TableLockManager::try_acquire_for(const std::vector<std::string>& tables,
                                  std::chrono::milliseconds       timeout) {
    auto wanted = normalize(tables);

    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [&] { return is_free(wanted); })) {
        spdlog::warn("lock: timed out after {}ms waiting for {} table(s)",
                     timeout.count(), wanted.size());
        return std::nullopt;
    }
    held_.insert(wanted.begin(), wanted.end());
    return std::optional<TableLockGuard>{std::in_place, *this, std::move(wanted)};
}

std::size_t TableLockManager::held_count() const {
    std::lock_guard lock(mutex_);
    return held_.size();
}

void TableLockManager::release(const std::set<std::string>& tables) noexcept {
    {
        std::lock_guard lock(mutex_);
        for (const auto& t : tables) {
            held_.erase(t);
        }
    }
    cv_.notify_all();
}
