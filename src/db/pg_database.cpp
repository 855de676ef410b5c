#include "db/pg_database.hpp"

#include <charconv>
#include <cstring>

#include <libpq-fe.h>
#include <spdlog/spdlog.h>

#include <fmt/format.h>

namespace {

struct ResultDeleter {
    void operator()(PGresult* res) const noexcept { PQclear(res); }
};
using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

std::string trim_message(const char* msg) {
    std::string out = (msg != nullptr) ? msg : "";
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) {
        out.pop_back();
    }
    return out;
}

}  // namespace

PgDatabase::PgDatabase(PGconn* conn) noexcept
    : conn_(conn)
{}

PgDatabase::~PgDatabase() {
    if (conn_ != nullptr) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

std::expected<std::unique_ptr<PgDatabase>, GateError>
PgDatabase::connect(const std::string& conninfo) {
    PGconn* conn = PQconnectdb(conninfo.c_str());
    if (conn == nullptr) {
        return std::unexpected(GateError{GateErrorCode::kBackendError,
                                         "postgres: PQconnectdb returned null"});
    }
    if (PQstatus(conn) != CONNECTION_OK) {
        GateError err{GateErrorCode::kBackendError,
                      fmt::format("postgres: connection failed: {}", trim_message(PQerrorMessage(conn)))};
        PQfinish(conn);
        return std::unexpected(std::move(err));
    }
    spdlog::debug("postgres: connected (server_version={})", PQserverVersion(conn));
    return std::unique_ptr<PgDatabase>(new PgDatabase(conn));
}

std::expected<QueryResult, GateError> PgDatabase::run_locked(std::string_view sql) {
    if (conn_ == nullptr) {
        return std::unexpected(GateError{GateErrorCode::kBackendError, "postgres: connection is null"});
    }

    // PQexecParams 는 확장 쿼리 프로토콜을 사용하므로 구문 하나만 받는다.
    // 세미콜론으로 이어진 두 번째 구문은 서버가 거부하고 아무것도 실행되지 않는다.
    const std::string text(sql);
    ResultPtr res{PQexecParams(conn_, text.c_str(), 0, nullptr, nullptr, nullptr, nullptr, 0)};
    if (!res) {
        return std::unexpected(GateError{
            GateErrorCode::kBackendError,
            fmt::format("postgres: {}", trim_message(PQerrorMessage(conn_)))
        });
    }

    const ExecStatusType status = PQresultStatus(res.get());
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        return std::unexpected(GateError{
            GateErrorCode::kBackendError,
            fmt::format("postgres: {}", trim_message(PQresultErrorMessage(res.get())))
        });
    }

    QueryResult result;
    if (status == PGRES_TUPLES_OK) {
        const int ncols = PQnfields(res.get());
        const int nrows = PQntuples(res.get());
        for (int c = 0; c < ncols; ++c) {
            result.columns.emplace_back(PQfname(res.get(), c));
        }
        result.rows.reserve(static_cast<std::size_t>(nrows));
        for (int r = 0; r < nrows; ++r) {
            std::vector<std::optional<std::string>> row;
            row.reserve(static_cast<std::size_t>(ncols));
            for (int c = 0; c < ncols; ++c) {
                if (PQgetisnull(res.get(), r, c) != 0) {
                    row.emplace_back(std::nullopt);
                } else {
                    row.emplace_back(std::string(PQgetvalue(res.get(), r, c),
                                                 static_cast<std::size_t>(PQgetlength(res.get(), r, c))));
                }
            }
            result.rows.push_back(std::move(row));
        }
    }

    // PQcmdTuples: INSERT/UPDATE/DELETE/SELECT/MOVE/FETCH/COPY 의 행 수, 그 외 빈 문자열
    const char* tuples = PQcmdTuples(res.get());
    if (tuples != nullptr && tuples[0] != '\0') {
        std::uint64_t n = 0;
        const char* end = tuples + std::strlen(tuples);
        if (std::from_chars(tuples, end, n).ec == std::errc{}) {
            result.affected_rows = n;
        }
    } else if (status == PGRES_TUPLES_OK) {
        result.affected_rows = result.rows.size();
    }
    return result;
}

std::expected<void, GateError> PgDatabase::open_read_only_locked() {
    if (auto begun = run_locked("BEGIN TRANSACTION READ ONLY"); !begun) {
        return std::unexpected(begun.error());
    }
    return {};
}

void PgDatabase::close_read_only_locked() noexcept {
    if (conn_ == nullptr) {
        return;
    }
    ResultPtr res{PQexec(conn_, "ROLLBACK")};
    if (!res || PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        spdlog::error("postgres: read-only scope rollback failed: {}", trim_message(PQerrorMessage(conn_)));
    }
}

std::expected<bool, GateError> PgDatabase::table_exists(std::string_view table) {
    auto res = run(fmt::format("SELECT to_regclass({}) IS NOT NULL",
                               quote_literal(quote_identifier(table))));
    if (!res) {
        return std::unexpected(res.error());
    }
    return !res->rows.empty() && !res->rows.front().empty() &&
           res->rows.front().front().value_or("f") == "t";
}
