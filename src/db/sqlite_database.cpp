#include "db/sqlite_database.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <fmt/format.h>

namespace {

GateError backend_error(sqlite3* db, std::string_view what) {
    return GateError{
        GateErrorCode::kBackendError,
        fmt::format("sqlite: {}: {}", what, db != nullptr ? sqlite3_errmsg(db) : "no connection")
    };
}

struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

}  // namespace

SqliteDatabase::SqliteDatabase(sqlite3* db, std::filesystem::path path) noexcept
    : db_(db)
    , path_(std::move(path))
{}

SqliteDatabase::~SqliteDatabase() {
    if (db_ != nullptr) {
        sqlite3_close_v2(db_);
    }
}

std::expected<std::unique_ptr<SqliteDatabase>, GateError>
SqliteDatabase::open(const std::filesystem::path& path) {
    if (path != ":memory:" && path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(GateError{
                GateErrorCode::kBackendError,
                fmt::format("sqlite: cannot create directory '{}': {}",
                            path.parent_path().string(), ec.message())
            });
        }
    }

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        auto err = backend_error(raw, fmt::format("open '{}'", path.string()));
        if (raw != nullptr) {
            sqlite3_close_v2(raw);
        }
        return std::unexpected(std::move(err));
    }

    sqlite3_busy_timeout(raw, 5000);
    spdlog::debug("sqlite: opened '{}'", path.string());
    return std::unique_ptr<SqliteDatabase>(new SqliteDatabase(raw, path));
}

// 구문 하나만 실행한다. 준비한 구문 뒤에 공백/주석 외의 구문이 남아 있으면
// 아무것도 실행하지 않고 실패한다.
std::expected<QueryResult, GateError> SqliteDatabase::run_locked(std::string_view sql) {
    QueryResult result;

    const char* cursor = sql.data();
    const char* end    = sql.data() + sql.size();

    StmtPtr stmt;
    while (cursor < end) {
        sqlite3_stmt* raw  = nullptr;
        const char*   tail = nullptr;
        const int rc = sqlite3_prepare_v2(db_, cursor, static_cast<int>(end - cursor), &raw, &tail);
        if (rc != SQLITE_OK) {
            return std::unexpected(backend_error(db_, "prepare"));
        }
        cursor = tail;
        if (raw == nullptr) {
            continue;  // 공백/주석만 남음
        }
        if (stmt) {
            sqlite3_finalize(raw);
            return std::unexpected(GateError{
                GateErrorCode::kBackendError,
                "sqlite: more than one statement in input; nothing was executed"
            });
        }
        stmt.reset(raw);
    }

    if (stmt) {
        const int ncols = sqlite3_column_count(stmt.get());
        result.columns.clear();
        result.rows.clear();
        for (int c = 0; c < ncols; ++c) {
            result.columns.emplace_back(sqlite3_column_name(stmt.get(), c));
        }

        for (;;) {
            const int step = sqlite3_step(stmt.get());
            if (step == SQLITE_DONE) {
                break;
            }
            if (step != SQLITE_ROW) {
                return std::unexpected(backend_error(db_, "step"));
            }
            std::vector<std::optional<std::string>> row;
            row.reserve(static_cast<std::size_t>(ncols));
            for (int c = 0; c < ncols; ++c) {
                if (sqlite3_column_type(stmt.get(), c) == SQLITE_NULL) {
                    row.emplace_back(std::nullopt);
                } else {
                    const auto* text = sqlite3_column_text(stmt.get(), c);
                    const int   len  = sqlite3_column_bytes(stmt.get(), c);
                    row.emplace_back(std::string(reinterpret_cast<const char*>(text),
                                                 static_cast<std::size_t>(len)));
                }
            }
            result.rows.push_back(std::move(row));
        }

        if (ncols > 0) {
            result.affected_rows = result.rows.size();
        } else if (sqlite3_stmt_readonly(stmt.get()) != 0) {
            result.affected_rows = 0;
        } else {
            result.affected_rows = static_cast<std::uint64_t>(sqlite3_changes64(db_));
        }
    }

    return result;
}

std::expected<void, GateError> SqliteDatabase::open_read_only_locked() {
    if (auto begun = run_locked("BEGIN"); !begun) {
        return std::unexpected(begun.error());
    }
    if (auto pragma = run_locked("PRAGMA query_only = ON"); !pragma) {
        if (auto rb = run_locked("ROLLBACK"); !rb) {
            spdlog::error("sqlite: rollback after failed read-only setup failed: {}", rb.error().message);
        }
        return std::unexpected(pragma.error());
    }
    return {};
}

void SqliteDatabase::close_read_only_locked() noexcept {
    if (sqlite3_exec(db_, "PRAGMA query_only = OFF", nullptr, nullptr, nullptr) != SQLITE_OK) {
        spdlog::error("sqlite: failed to reset query_only: {}", sqlite3_errmsg(db_));
    }
    if (sqlite3_get_autocommit(db_) == 0 &&
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
        spdlog::error("sqlite: read-only scope rollback failed: {}", sqlite3_errmsg(db_));
    }
}

std::expected<bool, GateError> SqliteDatabase::table_exists(std::string_view table) {
    std::string schema = "main";
    std::string name(table);
    if (const auto dot = name.find('.'); dot != std::string::npos) {
        schema = name.substr(0, dot);
        name   = name.substr(dot + 1);
    }
    auto res = run(fmt::format(
        "SELECT 1 FROM {}.sqlite_master WHERE type IN ('table', 'view') AND name = {} COLLATE NOCASE",
        quote_identifier(schema), quote_literal(name)));
    if (!res) {
        return std::unexpected(res.error());
    }
    return !res->rows.empty();
}

std::expected<void, GateError> SqliteDatabase::backup_to(const std::filesystem::path& dest) {
    auto guard = hold();

    std::error_code ec;
    std::filesystem::remove(dest, ec);

    sqlite3* dest_db = nullptr;
    if (sqlite3_open(dest.c_str(), &dest_db) != SQLITE_OK) {
        auto err = backend_error(dest_db, fmt::format("open backup target '{}'", dest.string()));
        sqlite3_close(dest_db);
        return std::unexpected(std::move(err));
    }

    sqlite3_backup* backup = sqlite3_backup_init(dest_db, "main", db_, "main");
    if (backup == nullptr) {
        auto err = backend_error(dest_db, "backup_init");
        sqlite3_close(dest_db);
        return std::unexpected(std::move(err));
    }

    const int step_rc = sqlite3_backup_step(backup, -1);
    sqlite3_backup_finish(backup);
    const int final_rc = sqlite3_errcode(dest_db);
    sqlite3_close(dest_db);

    if (step_rc != SQLITE_DONE || final_rc != SQLITE_OK) {
        return std::unexpected(GateError{
            GateErrorCode::kBackendError,
            fmt::format("sqlite: backup to '{}' failed: {}", dest.string(), sqlite3_errstr(step_rc))
        });
    }
    return {};
}

std::expected<void, GateError> SqliteDatabase::attach(const std::filesystem::path& file,
                                                      std::string_view alias) {
    auto res = run(fmt::format("ATTACH DATABASE {} AS {}",
                               quote_literal(file.string()), quote_identifier(alias)));
    if (!res) {
        return std::unexpected(res.error());
    }
    return {};
}

std::expected<void, GateError> SqliteDatabase::detach(std::string_view alias) {
    auto res = run(fmt::format("DETACH DATABASE {}", quote_identifier(alias)));
    if (!res) {
        return std::unexpected(res.error());
    }
    return {};
}
