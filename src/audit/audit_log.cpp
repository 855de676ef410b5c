// ---------------------------------------------------------------------------
// audit_log.cpp
// ---------------------------------------------------------------------------

#include "audit/audit_log.hpp"

#include "audit/audit_codec.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

GateError write_error(const std::filesystem::path& path, std::string_view what) {
    return GateError{GateErrorCode::kAuditWriteFailed,
                     fmt::format("audit: {} '{}': {}", what, path.string(), std::strerror(errno))};
}

// 열린 fd 를 닫는 RAII.
struct FdCloser {
    int fd;
    ~FdCloser() {
        if (fd >= 0) {
            ::close(fd);
        }
    }
};

}  // namespace

std::expected<std::unique_ptr<FileAuditLog>, GateError>
FileAuditLog::open(const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(GateError{
                GateErrorCode::kAuditWriteFailed,
                fmt::format("audit: cannot create directory '{}': {}",
                            path.parent_path().string(), ec.message())
            });
        }
    }

    std::unique_ptr<FileAuditLog> log(new FileAuditLog(path));

    auto existing = log->read_all();
    if (!existing) {
        return std::unexpected(existing.error());
    }
    for (const auto& record : *existing) {
        log->run_ids_.insert(record.run_id);
    }

    spdlog::info("audit: opened '{}' ({} existing records)", path.string(), existing->size());
    return log;
}

std::expected<void, GateError> FileAuditLog::append(const AuditRecord& record) {
    std::lock_guard lock(mutex_);

    if (run_ids_.contains(record.run_id)) {
        return std::unexpected(GateError{
            GateErrorCode::kAuditWriteFailed,
            fmt::format("audit: duplicate run_id '{}'", record.run_id)
        });
    }

    std::string line = audit_record_to_json(record);
    line += '\n';

    const int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0640);
    if (fd < 0) {
        return std::unexpected(write_error(path_, "open"));
    }
    FdCloser closer{fd};

    std::size_t written = 0;
    while (written < line.size()) {
        const ssize_t n = ::write(fd, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(write_error(path_, "write"));
        }
        written += static_cast<std::size_t>(n);
    }

    if (::fsync(fd) != 0) {
        return std::unexpected(write_error(path_, "fsync"));
    }

    run_ids_.insert(record.run_id);
    return {};
}

std::expected<std::vector<AuditRecord>, GateError> FileAuditLog::read_all() const {
    std::vector<AuditRecord> records;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return records;
    }

    std::ifstream in(path_);
    if (!in) {
        return std::unexpected(GateError{
            GateErrorCode::kBackendError, fmt::format("audit: cannot read '{}'", path_.string())
        });
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) {
            continue;
        }
        auto record = audit_record_from_json(line);
        if (!record) {
            spdlog::warn("audit: skipping line {} of '{}': {}", line_no, path_.string(), record.error());
            continue;
        }
        records.push_back(std::move(*record));
    }
    return records;
}

std::expected<AuditRecord, GateError> FileAuditLog::get(const std::string& run_id) const {
    std::lock_guard lock(mutex_);

    auto records = read_all();
    if (!records) {
        return std::unexpected(records.error());
    }
    for (auto& record : *records) {
        if (record.run_id == run_id) {
            return std::move(record);
        }
    }
    return std::unexpected(GateError{
        GateErrorCode::kNotFound, fmt::format("audit: run '{}' not found", run_id)
    });
}

std::expected<std::vector<AuditRecord>, GateError>
FileAuditLog::query(const AuditQuery& filter) const {
    std::lock_guard lock(mutex_);

    auto records = read_all();
    if (!records) {
        return std::unexpected(records.error());
    }

    std::vector<AuditRecord> out;
    for (auto& record : *records) {
        if (filter.from && record.timestamp < *filter.from) {
            continue;
        }
        if (filter.to && record.timestamp > *filter.to) {
            continue;
        }
        if (filter.min_level && !at_least(record.risk.level, *filter.min_level)) {
            continue;
        }
        out.push_back(std::move(record));
    }
    return out;
}
