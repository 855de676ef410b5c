#include "db/statement_executor.hpp"

#include "db/database.hpp"

std::expected<std::uint64_t, GateError> DatabaseExecutor::execute(std::string_view sql) {
    auto res = db_.run(sql);
    if (!res) {
        return std::unexpected(GateError{GateErrorCode::kExecutionFailed, res.error().message});
    }
    return res->affected_rows;
}
