#include "risk/risk_level.hpp"

#include <algorithm>
#include <cctype>
#include <string>

std::optional<RiskLevel> risk_level_from_string(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "LOW")      { return RiskLevel::kLow; }
    if (upper == "MEDIUM")   { return RiskLevel::kMedium; }
    if (upper == "HIGH")     { return RiskLevel::kHigh; }
    if (upper == "CRITICAL") { return RiskLevel::kCritical; }
    return std::nullopt;
}
