#pragma once

// ---------------------------------------------------------------------------
// snapshot_ref.hpp
//
// 스냅샷 식별 정보. 감사 레코드와 스냅샷 카탈로그에 같은 형태로 기록된다.
//
// [location 의미]
//   file_copy  : 백업 파일 경로 (<snapshot.dir>/<id>.sqlite3)
//   table_copy : 사본 테이블 이름 목록 (콤마 구분, tables 와 같은 순서)
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "db/database.hpp"

namespace YAML {
class Node;
}  // namespace YAML

enum class SnapshotStrategyKind : std::uint8_t {
    kTableCopy = 0,
    kFileCopy  = 1,
};

[[nodiscard]] const char* snapshot_strategy_to_string(SnapshotStrategyKind kind) noexcept;
[[nodiscard]] std::optional<SnapshotStrategyKind> snapshot_strategy_from_string(std::string_view text);

struct SnapshotRef {
    std::string                           id{};
    std::chrono::system_clock::time_point created_at{};
    Backend                               backend{Backend::kSqlite};
    SnapshotStrategyKind                  strategy{SnapshotStrategyKind::kTableCopy};
    std::vector<std::string>              tables{};    // 소문자, 정렬, 중복 없음
    std::string                           location{};

    bool operator==(const SnapshotRef&) const = default;
};

// {"id": ..., "created_at": ..., "backend": ..., "strategy": ..., "tables": [...], "location": ...}
[[nodiscard]] std::string snapshot_ref_to_json(const SnapshotRef& ref);

// snapshot_ref_to_json 출력(또는 감사 레코드의 snapshot_ref 노드)을 읽는다.
[[nodiscard]] std::expected<SnapshotRef, std::string> snapshot_ref_from_node(const YAML::Node& node);
