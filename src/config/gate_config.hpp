#pragma once

// ---------------------------------------------------------------------------
// gate_config.hpp
//
// dbsafe.yaml 의 C++ 표현. 모든 필드는 기본값을 가지므로 빈 설정 파일도 유효하다.
//
// [YAML 구조]
//   global:           { log_level, log_path }
//   database:         { backend, path, url }
//   gate:             { approval_timeout, row_count_threshold_low_medium,
//                       row_count_threshold_medium_high }
//   protected_tables: [ name | { name, policy } ]
//   snapshot:         { dir, strategy }
//   audit:            { path }
//   approval:         { socket_path }
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "db/database.hpp"
#include "risk/protected_table_registry.hpp"
#include "risk/risk_classifier.hpp"
#include "snapshot/snapshot_ref.hpp"

struct GlobalConfig {
    std::string           log_level{"info"};
    std::filesystem::path log_path{"logs/dbsafe.log"};
};

struct DatabaseConfig {
    Backend               backend{Backend::kSqlite};
    std::filesystem::path path{"data/app.db"};  // sqlite
    std::string           url{};                // postgres (libpq conninfo/URI)
};

struct GateSettings {
    std::chrono::seconds approval_timeout{300};
    RiskThresholds       thresholds{};
};

struct ProtectedTableEntry {
    std::string     name{};
    ElevationPolicy policy{ElevationPolicy::kEscalateOne};
};

struct SnapshotConfig {
    std::filesystem::path               dir{"snapshots"};
    std::optional<SnapshotStrategyKind> strategy{};  // nullopt = auto
};

struct AuditConfig {
    std::filesystem::path path{"audit/audit.ndjson"};
};

struct ApprovalConfig {
    std::filesystem::path socket_path{"/tmp/dbsafe.sock"};
};

struct GateConfig {
    GlobalConfig                     global{};
    DatabaseConfig                   database{};
    GateSettings                     gate{};
    std::vector<ProtectedTableEntry> protected_tables{};
    SnapshotConfig                   snapshot{};
    AuditConfig                      audit{};
    ApprovalConfig                   approval{};

    // protected_tables 로 레지스트리를 구성한다.
    [[nodiscard]] ProtectedTableRegistry make_registry() const {
        ProtectedTableRegistry registry;
        for (const auto& entry : protected_tables) {
            registry.add(entry.name, entry.policy);
        }
        return registry;
    }
};
