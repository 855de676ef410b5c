// ---------------------------------------------------------------------------
// snapshot_strategy.cpp
// ---------------------------------------------------------------------------

#include "snapshot/snapshot_strategy.hpp"

#include "db/database.hpp"
#include "db/sqlite_database.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kAttachAlias = "dbsafe_snap";

std::vector<std::string> split_location(const std::string& location) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= location.size()) {
        const auto comma = location.find(',', start);
        const auto end   = comma == std::string::npos ? location.size() : comma;
        if (end > start) {
            parts.push_back(location.substr(start, end - start));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return parts;
}

std::string unqualified(const std::string& table) {
    const auto dot = table.rfind('.');
    return dot == std::string::npos ? table : table.substr(dot + 1);
}

GateError restore_error(const SnapshotRef& ref, std::string_view detail) {
    return GateError{GateErrorCode::kBackendError,
                     fmt::format("snapshot '{}': {}", ref.id, detail)};
}

// 현재 테이블을 source 의 행으로 되돌린다. 테이블이 사라졌으면 create_sql 로 다시 만든다.
// create_fills_rows: create_sql 이 CREATE TABLE AS 처럼 행까지 채우는 경우 true.
std::expected<void, GateError> refill_table(Database&          db,
                                            const std::string& table,
                                            const std::string& source,
                                            const std::string& create_sql,
                                            bool               create_fills_rows) {
    auto exists = db.table_exists(table);
    if (!exists) {
        return std::unexpected(exists.error());
    }

    const std::string target = Database::quote_identifier(table);
    if (*exists) {
        if (auto res = db.run(fmt::format("DELETE FROM {}", target)); !res) {
            return std::unexpected(res.error());
        }
    } else {
        if (auto res = db.run(create_sql); !res) {
            return std::unexpected(res.error());
        }
        if (create_fills_rows) {
            return {};
        }
    }

    if (auto res = db.run(fmt::format("INSERT INTO {} SELECT * FROM {}", target, source)); !res) {
        return std::unexpected(res.error());
    }
    return {};
}

}  // namespace

// ---------------------------------------------------------------------------
// TableCopyStrategy
// ---------------------------------------------------------------------------
std::string TableCopyStrategy::copy_table_name(const std::string& snapshot_id, std::size_t index) {
    std::string name = "dbsafe_" + snapshot_id;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return fmt::format("{}_{}", name, index);
}

std::expected<std::string, GateError>
TableCopyStrategy::capture(const std::string& snapshot_id, const std::vector<std::string>& tables) {
    std::vector<std::string> copies;
    copies.reserve(tables.size());
    for (std::size_t i = 0; i < tables.size(); ++i) {
        copies.push_back(copy_table_name(snapshot_id, i));
    }

    auto txn = db_.transaction([&]() -> std::expected<void, GateError> {
        for (std::size_t i = 0; i < tables.size(); ++i) {
            auto res = db_.run(fmt::format("CREATE TABLE {} AS SELECT * FROM {}",
                                           Database::quote_identifier(copies[i]),
                                           Database::quote_identifier(tables[i])));
            if (!res) {
                return std::unexpected(res.error());
            }
        }
        return {};
    });
    if (!txn) {
        return std::unexpected(txn.error());
    }

    std::string location;
    for (std::size_t i = 0; i < copies.size(); ++i) {
        if (i > 0) {
            location += ',';
        }
        location += copies[i];
    }
    return location;
}

std::expected<void, GateError> TableCopyStrategy::restore(const SnapshotRef& ref) {
    const auto copies = split_location(ref.location);
    if (copies.size() != ref.tables.size()) {
        return std::unexpected(restore_error(
            ref, fmt::format("location lists {} copies for {} tables", copies.size(), ref.tables.size())));
    }

    for (const auto& copy : copies) {
        auto exists = db_.table_exists(copy);
        if (!exists) {
            return std::unexpected(exists.error());
        }
        if (!*exists) {
            return std::unexpected(restore_error(ref, fmt::format("copy table '{}' is missing", copy)));
        }
    }

    return db_.transaction([&]() -> std::expected<void, GateError> {
        for (std::size_t i = 0; i < ref.tables.size(); ++i) {
            const std::string source = Database::quote_identifier(copies[i]);
            const std::string create = fmt::format("CREATE TABLE {} AS SELECT * FROM {}",
                                                   Database::quote_identifier(ref.tables[i]), source);
            if (auto refilled = refill_table(db_, ref.tables[i], source, create, true); !refilled) {
                return std::unexpected(refilled.error());
            }
        }
        return {};
    });
}

// ---------------------------------------------------------------------------
// SqliteFileStrategy
// ---------------------------------------------------------------------------
std::expected<std::string, GateError>
SqliteFileStrategy::capture(const std::string& snapshot_id, const std::vector<std::string>& /*tables*/) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        return std::unexpected(GateError{
            GateErrorCode::kBackendError,
            fmt::format("cannot create snapshot dir '{}': {}", dir_.string(), ec.message())
        });
    }

    const auto dest = dir_ / (snapshot_id + ".sqlite3");
    if (auto backed = db_.backup_to(dest); !backed) {
        return std::unexpected(backed.error());
    }
    return dest.string();
}

std::expected<void, GateError> SqliteFileStrategy::restore(const SnapshotRef& ref) {
    std::error_code ec;
    if (!std::filesystem::exists(ref.location, ec)) {
        return std::unexpected(restore_error(ref, fmt::format("backup file '{}' is missing", ref.location)));
    }

    // ATTACH 는 트랜잭션 안에서 실행할 수 없으므로 연결을 잡은 채 ATTACH → 트랜잭션 → DETACH.
    auto guard = db_.hold();

    if (auto attached = db_.attach(ref.location, kAttachAlias); !attached) {
        return std::unexpected(attached.error());
    }

    auto restored = restore_attached(ref);

    if (auto detached = db_.detach(kAttachAlias); !detached) {
        spdlog::error("snapshot: detach after restore of '{}' failed: {}",
                      ref.id, detached.error().message);
        if (restored) {
            return std::unexpected(detached.error());
        }
    }
    return restored;
}

std::expected<void, GateError> SqliteFileStrategy::restore_attached(const SnapshotRef& ref) {
    return db_.transaction([&]() -> std::expected<void, GateError> {
        for (const auto& table : ref.tables) {
            const std::string name = unqualified(table);
            auto ddl = db_.run(fmt::format(
                "SELECT sql FROM {}.sqlite_master WHERE type = 'table' AND name = {} COLLATE NOCASE",
                Database::quote_identifier(kAttachAlias), Database::quote_literal(name)));
            if (!ddl) {
                return std::unexpected(ddl.error());
            }
            if (ddl->rows.empty() || ddl->rows.front().empty() || !ddl->rows.front().front()) {
                return std::unexpected(restore_error(
                    ref, fmt::format("table '{}' is not present in backup file", table)));
            }

            const std::string source = fmt::format("{}.{}", Database::quote_identifier(kAttachAlias),
                                                   Database::quote_identifier(name));
            if (auto refilled = refill_table(db_, table, source, *ddl->rows.front().front(), false);
                !refilled) {
                return std::unexpected(refilled.error());
            }
        }
        return {};
    });
}
