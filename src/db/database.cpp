#include "db/database.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

#include <spdlog/spdlog.h>

const char* backend_to_string(Backend backend) noexcept {
    switch (backend) {
        case Backend::kSqlite:   return "sqlite";
        case Backend::kPostgres: return "postgres";
    }
    return "sqlite";
}

std::optional<Backend> backend_from_string(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "sqlite" || lower == "sqlite3") {
        return Backend::kSqlite;
    }
    if (lower == "postgres" || lower == "postgresql") {
        return Backend::kPostgres;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ReadOnlyScope
// ---------------------------------------------------------------------------
ReadOnlyScope::ReadOnlyScope(Database& db, std::unique_lock<std::recursive_mutex> lock) noexcept
    : db_(&db)
    , lock_(std::move(lock))
{}

ReadOnlyScope::ReadOnlyScope(ReadOnlyScope&& other) noexcept
    : db_(other.db_)
    , lock_(std::move(other.lock_))
{
    other.db_ = nullptr;
}

ReadOnlyScope::~ReadOnlyScope() {
    if (db_ != nullptr) {
        db_->close_read_only_locked();
    }
}

// ---------------------------------------------------------------------------
// Database
// ---------------------------------------------------------------------------
std::expected<QueryResult, GateError> Database::run(std::string_view sql) {
    auto guard = hold();
    return run_locked(sql);
}

std::expected<ReadOnlyScope, GateError> Database::begin_read_only() {
    auto guard = hold();
    if (auto opened = open_read_only_locked(); !opened) {
        return std::unexpected(opened.error());
    }
    return ReadOnlyScope{*this, std::move(guard)};
}

std::expected<void, GateError> Database::transaction(const TxnBody& body) {
    auto guard = hold();

    if (auto begun = run_locked("BEGIN"); !begun) {
        return std::unexpected(begun.error());
    }

    std::expected<void, GateError> outcome;
    try {
        outcome = body();
    } catch (const std::exception& e) {
        outcome = std::unexpected(GateError{GateErrorCode::kInternal,
                                            std::string("transaction body threw: ") + e.what()});
    }

    if (!outcome) {
        if (auto rb = run_locked("ROLLBACK"); !rb) {
            spdlog::error("database: rollback after failed transaction failed: {}", rb.error().message);
        }
        return outcome;
    }

    if (auto committed = run_locked("COMMIT"); !committed) {
        if (auto rb = run_locked("ROLLBACK"); !rb) {
            spdlog::debug("database: rollback after failed commit: {}", rb.error().message);
        }
        return std::unexpected(committed.error());
    }
    return {};
}

std::string Database::quote_identifier(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 4);
    out += '"';
    for (const char c : name) {
        if (c == '.') {
            out += "\".\"";
        } else if (c == '"') {
            out += "\"\"";
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

std::string Database::quote_literal(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        if (c == '\'') {
            out += '\'';
        }
        out += c;
    }
    out += '\'';
    return out;
}
