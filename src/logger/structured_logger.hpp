#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 이벤트 로그(RunLog/BlockLog/SnapshotLog)는 한 줄짜리 JSON 으로 기록한다.
// - 게이트 내부 진단은 spdlog 기본 로거(spdlog::info 등)를 사용하고,
//   이 로거는 운영자가 수집하는 이벤트 스트림만 담당한다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   to_stdout : 파일과 함께 stdout 에도 기록할지 여부
    // 초기화 실패 시 std::runtime_error.
    StructuredLogger(LogLevel                     min_level,
                     const std::filesystem::path& log_path,
                     bool                         to_stdout = true);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // log_run
    //   실행 종료 요약 (event: run_finished).
    void log_run(const RunLog& entry);

    // log_block
    //   차단 이벤트 (event: run_blocked). warn 레벨.
    void log_block(const BlockLog& entry);

    // log_snapshot
    //   스냅샷 생성/복원 이벤트.
    void log_snapshot(const SnapshotLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // 강제 플러시 (테스트/종료 시).
    void flush();

private:
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
