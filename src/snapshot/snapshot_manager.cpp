// ---------------------------------------------------------------------------
// snapshot_manager.cpp
// ---------------------------------------------------------------------------

#include "snapshot/snapshot_manager.hpp"

#include "common/fingerprint.hpp"
#include "db/database.hpp"
#include "db/sqlite_database.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// SQLite 는 이름을 대소문자 무관하게 비교하므로 소문자로 접는다.
// PostgreSQL 이름은 파서가 이미 접어 두었고 인용된 대소문자는 의미가 있으므로 그대로 둔다.
std::vector<std::string> normalize_tables(const std::vector<std::string>& tables, Backend backend) {
    std::vector<std::string> out;
    out.reserve(tables.size());
    for (auto name : tables) {
        if (backend == Backend::kSqlite) {
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        }
        out.push_back(std::move(name));
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

bool is_file_backed(const SqliteDatabase& db) {
    const auto& p = db.path();
    return !p.empty() && p != ":memory:";
}

}  // namespace

std::expected<std::unique_ptr<SnapshotManager>, GateError>
SnapshotManager::create(Database& db, std::filesystem::path dir,
                        std::optional<SnapshotStrategyKind> preferred) {
    std::unique_ptr<SnapshotManager> mgr(new SnapshotManager(db, std::move(dir)));

    mgr->strategies_.emplace(SnapshotStrategyKind::kTableCopy, std::make_unique<TableCopyStrategy>(db));

    auto* sqlite = dynamic_cast<SqliteDatabase*>(&db);
    const bool file_copy_ok = sqlite != nullptr && is_file_backed(*sqlite);
    if (sqlite != nullptr) {
        mgr->strategies_.emplace(SnapshotStrategyKind::kFileCopy,
                                 std::make_unique<SqliteFileStrategy>(*sqlite, mgr->dir_));
    }

    if (!preferred) {
        mgr->active_ = file_copy_ok ? SnapshotStrategyKind::kFileCopy : SnapshotStrategyKind::kTableCopy;
    } else if (*preferred == SnapshotStrategyKind::kFileCopy && !file_copy_ok) {
        return std::unexpected(GateError{
            GateErrorCode::kInvalidConfig,
            fmt::format("snapshot strategy 'file_copy' requires a file-backed sqlite database (backend: {})",
                        backend_to_string(db.backend()))
        });
    } else {
        mgr->active_ = *preferred;
    }

    spdlog::info("snapshot: manager ready (strategy={}, dir={})",
                 snapshot_strategy_to_string(mgr->active_), mgr->dir_.string());
    return mgr;
}

std::filesystem::path SnapshotManager::catalog_path(const std::string& snapshot_id) const {
    return dir_ / (snapshot_id + ".json");
}

std::expected<void, GateError> SnapshotManager::write_catalog(const SnapshotRef& ref) const {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        return std::unexpected(GateError{
            GateErrorCode::kBackendError,
            fmt::format("cannot create snapshot dir '{}': {}", dir_.string(), ec.message())
        });
    }

    const auto final_path = catalog_path(ref.id);
    auto       tmp_path   = final_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            return std::unexpected(GateError{
                GateErrorCode::kBackendError,
                fmt::format("cannot write snapshot catalog '{}'", tmp_path.string())
            });
        }
        out << snapshot_ref_to_json(ref) << '\n';
        out.flush();
        if (!out) {
            return std::unexpected(GateError{
                GateErrorCode::kBackendError,
                fmt::format("short write to snapshot catalog '{}'", tmp_path.string())
            });
        }
    }

    std::filesystem::rename(tmp_path, final_path, ec);
    if (ec) {
        return std::unexpected(GateError{
            GateErrorCode::kBackendError,
            fmt::format("cannot publish snapshot catalog '{}': {}", final_path.string(), ec.message())
        });
    }
    return {};
}

std::expected<SnapshotRef, GateError> SnapshotManager::snapshot(const std::vector<std::string>& tables,
                                                                const std::vector<std::string>& may_be_missing) {
    SnapshotRef ref;
    ref.id         = make_snapshot_id();
    // 카탈로그 직렬화 정밀도(밀리초)에 맞춘다.
    ref.created_at = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    ref.backend    = db_.backend();
    ref.strategy   = active_;

    // may_be_missing(CREATE 대상)만 없을 때 건너뛴다. 그 외 테이블이 없으면
    // 스냅샷이 실행 대상을 덮지 못하므로 실패다.
    const auto creatable = normalize_tables(may_be_missing, ref.backend);
    for (auto& table : normalize_tables(tables, ref.backend)) {
        auto exists = db_.table_exists(table);
        if (!exists) {
            spdlog::error("snapshot: cannot inspect table '{}': {}", table, exists.error().message);
            return std::unexpected(GateError{GateErrorCode::kSnapshotFailed, exists.error().message});
        }
        if (*exists) {
            ref.tables.push_back(std::move(table));
            continue;
        }
        if (!std::binary_search(creatable.begin(), creatable.end(), table)) {
            spdlog::error("snapshot: table '{}' not found", table);
            return std::unexpected(GateError{
                GateErrorCode::kSnapshotFailed,
                fmt::format("table '{}' not found; snapshot would not cover it", table)
            });
        }
    }

    auto& strategy = *strategies_.at(active_);
    auto  location = strategy.capture(ref.id, ref.tables);
    if (!location) {
        spdlog::error("snapshot: capture failed for {}: {}", ref.id, location.error().message);
        return std::unexpected(GateError{GateErrorCode::kSnapshotFailed, location.error().message});
    }
    ref.location = std::move(*location);

    if (auto written = write_catalog(ref); !written) {
        spdlog::error("snapshot: catalog write failed for {}: {}", ref.id, written.error().message);
        return std::unexpected(GateError{GateErrorCode::kSnapshotFailed, written.error().message});
    }

    spdlog::info("snapshot: created {} strategy={} tables={}",
                 ref.id, snapshot_strategy_to_string(ref.strategy), ref.tables.size());
    return ref;
}

std::expected<SnapshotRef, GateError> SnapshotManager::find(const std::string& snapshot_id) const {
    const auto path = catalog_path(snapshot_id);
    std::error_code ec;
    if (snapshot_id.empty() || snapshot_id.find('/') != std::string::npos ||
        !std::filesystem::exists(path, ec)) {
        return std::unexpected(GateError{
            GateErrorCode::kNotFound, fmt::format("snapshot '{}' not found", snapshot_id)
        });
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return std::unexpected(GateError{
            GateErrorCode::kBackendError,
            fmt::format("snapshot catalog '{}' unreadable: {}", path.string(), e.what())
        });
    }

    auto ref = snapshot_ref_from_node(node);
    if (!ref) {
        return std::unexpected(GateError{GateErrorCode::kBackendError, ref.error()});
    }
    return *ref;
}

std::vector<SnapshotRef> SnapshotManager::list() const {
    std::vector<SnapshotRef> refs;

    std::error_code ec;
    if (!std::filesystem::is_directory(dir_, ec)) {
        return refs;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        auto ref = find(entry.path().stem().string());
        if (!ref) {
            spdlog::warn("snapshot: skipping catalog entry '{}': {}",
                         entry.path().string(), ref.error().message);
            continue;
        }
        refs.push_back(std::move(*ref));
    }

    std::sort(refs.begin(), refs.end(), [](const SnapshotRef& a, const SnapshotRef& b) {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        return a.id > b.id;
    });
    return refs;
}

std::expected<void, GateError> SnapshotManager::restore(const std::string& snapshot_id) {
    auto ref = find(snapshot_id);
    if (!ref) {
        return std::unexpected(ref.error());
    }
    return restore(*ref);
}

std::expected<void, GateError> SnapshotManager::restore(const SnapshotRef& ref) {
    // 카탈로그에 없는 참조는 이 관리자가 만든 스냅샷이 아니다.
    auto known = find(ref.id);
    if (!known) {
        return std::unexpected(known.error());
    }

    const auto it = strategies_.find(known->strategy);
    if (it == strategies_.end()) {
        return std::unexpected(GateError{
            GateErrorCode::kBackendError,
            fmt::format("snapshot '{}' uses strategy '{}' which backend '{}' cannot restore",
                        known->id, snapshot_strategy_to_string(known->strategy),
                        backend_to_string(db_.backend()))
        });
    }

    auto restored = it->second->restore(*known);
    if (!restored) {
        spdlog::error("snapshot: restore of {} failed: {}", known->id, restored.error().message);
        return std::unexpected(GateError{GateErrorCode::kBackendError, restored.error().message});
    }

    spdlog::info("snapshot: restored {} tables={}", known->id, known->tables.size());
    return {};
}
