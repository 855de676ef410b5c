// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include "common/json_util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

// 파일 10MB, 3개 유지
constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
constexpr std::size_t kMaxFiles    = 3;

}  // namespace

std::optional<LogLevel> log_level_from_string(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") { return LogLevel::kDebug; }
    if (lower == "info")  { return LogLevel::kInfo; }
    if (lower == "warn" || lower == "warning") { return LogLevel::kWarn; }
    if (lower == "error") { return LogLevel::kError; }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   bool                         to_stdout)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (to_stdout) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles));

        logger_ = std::make_shared<spdlog::logger>("dbsafe", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 구조화 로그는 각 메서드에서 JSON 으로 만들므로 패턴은 메시지만.
        logger_->set_pattern("%v");

        // 감사 보조 스트림이므로 매 레코드 플러시
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(min_level_) <= static_cast<int>(level);
}

// ---------------------------------------------------------------------------
// log_run: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_run(const RunLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }

    logger_->info(fmt::format(
        R"({{"event": "run_finished", "run_id": {}, "risk_level": {}, "approval_decision": {}, )"
        R"("final_status": {}, "abort_reason": {}, "affected_rows": {}, "timestamp": {}, "duration_us": {}}})",
        json_quote(entry.run_id),
        json_quote(entry.risk_level),
        json_quote(entry.approval_decision),
        json_quote(entry.final_status),
        json_quote(entry.abort_reason),
        entry.affected_rows,
        json_quote(format_iso8601(entry.timestamp)),
        entry.duration.count()));
}

// ---------------------------------------------------------------------------
// log_block: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_block(const BlockLog& entry) {
    if (!enabled(LogLevel::kWarn)) {
        return;
    }

    logger_->warn(fmt::format(
        R"({{"event": "run_blocked", "run_id": {}, "sql": {}, "matched_rule": {}, "reason": {}, "timestamp": {}}})",
        json_quote(entry.run_id),
        json_quote(entry.sql),
        json_quote(entry.matched_rule),
        json_quote(entry.reason),
        json_quote(format_iso8601(entry.timestamp))));
}

// ---------------------------------------------------------------------------
// log_snapshot: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_snapshot(const SnapshotLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }

    logger_->info(fmt::format(
        R"({{"event": {}, "snapshot_id": {}, "run_id": {}, "strategy": {}, "tables": {}, "timestamp": {}}})",
        json_quote(entry.event),
        json_quote(entry.snapshot_id),
        json_quote(entry.run_id),
        json_quote(entry.strategy),
        json_string_array(entry.tables),
        json_quote(format_iso8601(entry.timestamp))));
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
