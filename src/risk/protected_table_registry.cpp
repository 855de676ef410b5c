#include "risk/protected_table_registry.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

const char* elevation_policy_to_string(ElevationPolicy policy) noexcept {
    switch (policy) {
        case ElevationPolicy::kEscalateOne:        return "escalate_one";
        case ElevationPolicy::kEscalateToCritical: return "escalate_to_critical";
    }
    return "escalate_one";
}

std::optional<ElevationPolicy> elevation_policy_from_string(std::string_view text) {
    const std::string lower = to_lower(text);
    if (lower == "escalate_one")         { return ElevationPolicy::kEscalateOne; }
    if (lower == "escalate_to_critical") { return ElevationPolicy::kEscalateToCritical; }
    return std::nullopt;
}

void ProtectedTableRegistry::add(std::string_view table, ElevationPolicy policy) {
    auto key = to_lower(table);
    auto it  = entries_.find(key);
    if (it == entries_.end()) {
        entries_.emplace(std::move(key), policy);
        return;
    }
    if (policy == ElevationPolicy::kEscalateToCritical) {
        it->second = policy;
    }
}

std::optional<ElevationPolicy> ProtectedTableRegistry::lookup(std::string_view table) const {
    const std::string key = to_lower(table);
    if (const auto it = entries_.find(key); it != entries_.end()) {
        return it->second;
    }
    // schema.table → table 로 재시도 (스키마 없는 항목 매칭)
    const auto dot = key.rfind('.');
    if (dot != std::string::npos) {
        if (const auto it = entries_.find(key.substr(dot + 1)); it != entries_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, ElevationPolicy>> ProtectedTableRegistry::entries() const {
    return {entries_.begin(), entries_.end()};
}
