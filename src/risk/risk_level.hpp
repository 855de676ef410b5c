#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// RiskLevel
//   LOW < MEDIUM < HIGH < CRITICAL (전순서). 기저값 비교로 대소를 판정한다.
// ---------------------------------------------------------------------------
enum class RiskLevel : std::uint8_t {
    kLow      = 0,
    kMedium   = 1,
    kHigh     = 2,
    kCritical = 3,
};

[[nodiscard]] constexpr const char* risk_level_to_string(RiskLevel level) noexcept {
    switch (level) {
        case RiskLevel::kLow:      return "LOW";
        case RiskLevel::kMedium:   return "MEDIUM";
        case RiskLevel::kHigh:     return "HIGH";
        case RiskLevel::kCritical: return "CRITICAL";
    }
    return "CRITICAL";
}

// 대소문자 무관. 인식하지 못하면 std::nullopt.
[[nodiscard]] std::optional<RiskLevel> risk_level_from_string(std::string_view text);

// 한 단계 상향 (CRITICAL 에서 포화).
[[nodiscard]] constexpr RiskLevel escalate(RiskLevel level) noexcept {
    return level == RiskLevel::kCritical
        ? RiskLevel::kCritical
        : static_cast<RiskLevel>(static_cast<std::uint8_t>(level) + 1);
}

[[nodiscard]] constexpr RiskLevel max_level(RiskLevel a, RiskLevel b) noexcept {
    return static_cast<std::uint8_t>(a) >= static_cast<std::uint8_t>(b) ? a : b;
}

[[nodiscard]] constexpr bool at_least(RiskLevel level, RiskLevel floor) noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(floor);
}
