#pragma once

// ---------------------------------------------------------------------------
// protected_table_registry.hpp
//
// 보호 테이블 목록과 테이블별 상향 정책.
// 프로세스 시작 시 설정에서 한 번 구성되며 실행 중에는 읽기 전용이다.
// RiskClassifier 생성자에 값으로 주입되어 분류를 순수 함수로 유지한다.
//
// [매칭 규칙]
// - 대소문자 무관.
// - 스키마 없는 항목("users")은 "public.users", "main.users" 에도 매칭된다.
// - 스키마가 있는 항목("billing.invoices")은 정확히 같은 한정 이름에만 매칭된다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// ElevationPolicy
//   보호 테이블을 대상으로 한 쓰기 구문의 위험도 상향 방식.
// ---------------------------------------------------------------------------
enum class ElevationPolicy : std::uint8_t {
    kEscalateOne        = 0,  // 한 단계 상향 (LOW→MEDIUM→HIGH→CRITICAL)
    kEscalateToCritical = 1,  // 즉시 CRITICAL
};

[[nodiscard]] const char* elevation_policy_to_string(ElevationPolicy policy) noexcept;
[[nodiscard]] std::optional<ElevationPolicy> elevation_policy_from_string(std::string_view text);

class ProtectedTableRegistry {
public:
    ProtectedTableRegistry() = default;

    // add
    //   같은 이름이 이미 있으면 더 강한 정책으로 덮어쓴다.
    void add(std::string_view table, ElevationPolicy policy = ElevationPolicy::kEscalateOne);

    // lookup
    //   table 이 보호 대상이면 정책을 반환한다.
    [[nodiscard]] std::optional<ElevationPolicy> lookup(std::string_view table) const;

    [[nodiscard]] bool contains(std::string_view table) const { return lookup(table).has_value(); }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    // 정렬된 (이름, 정책) 목록. 로그/진단용.
    [[nodiscard]] std::vector<std::pair<std::string, ElevationPolicy>> entries() const;

private:
    std::map<std::string, ElevationPolicy> entries_;  // key: 소문자 이름
};
