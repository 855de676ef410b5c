// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
//
// 로그 라인은 JSON 이므로 yaml-cpp 로 다시 읽어 필드를 확인한다
// (감사 로그 코덱과 같은 방식).
// ---------------------------------------------------------------------------

#include "common/json_util.hpp"
#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Fixture: Temporary log file
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "dbsafe_test_logs" / unique_name;
        log_file_ = log_dir_ / "test.log";
        fs::remove_all(log_dir_);
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        fs::remove_all(log_dir_);
    }

    // JSON 으로 시작하는 라인만 반환
    std::vector<std::string> read_json_lines() const {
        std::vector<std::string> lines;
        std::ifstream            file(log_file_);
        std::string              line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.front() == '{') {
                lines.push_back(line);
            }
        }
        return lines;
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// Test: RunLog JSON 직렬화
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, RunLogJsonFormat) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    const auto ts = std::chrono::sys_days{std::chrono::year{2024} / 1 / 2} + std::chrono::hours{3};
    logger.log_run(RunLog{
        .run_id            = "RUN_20240102T030000_0000beef",
        .risk_level        = "HIGH",
        .approval_decision = "APPROVED",
        .final_status      = "EXECUTED",
        .abort_reason      = "NONE",
        .affected_rows     = 3214,
        .timestamp         = ts,
        .duration          = std::chrono::microseconds(1500),
    });
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1u);

    const YAML::Node node = YAML::Load(lines[0]);
    EXPECT_EQ(node["event"].as<std::string>(), "run_finished");
    EXPECT_EQ(node["run_id"].as<std::string>(), "RUN_20240102T030000_0000beef");
    EXPECT_EQ(node["risk_level"].as<std::string>(), "HIGH");
    EXPECT_EQ(node["final_status"].as<std::string>(), "EXECUTED");
    EXPECT_EQ(node["affected_rows"].as<std::uint64_t>(), 3214u);
    EXPECT_EQ(node["duration_us"].as<std::int64_t>(), 1500);
    EXPECT_EQ(node["timestamp"].as<std::string>(), "2024-01-02T03:00:00.000Z");
}

// ---------------------------------------------------------------------------
// Test: BlockLog matched_rule 과 reason
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, BlockLogMatchedRuleAndReason) {
    StructuredLogger logger(LogLevel::kWarn, log_file_, false);

    BlockLog entry;
    entry.run_id       = "RUN_1";
    entry.sql          = "DELETE FROM users;";
    entry.matched_rule = "unfiltered-write,protected-table";
    entry.reason       = "users is a protected table";
    entry.timestamp    = std::chrono::system_clock::now();
    logger.log_block(entry);
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1u);

    const YAML::Node node = YAML::Load(lines[0]);
    EXPECT_EQ(node["event"].as<std::string>(), "run_blocked");
    EXPECT_EQ(node["matched_rule"].as<std::string>(), "unfiltered-write,protected-table");
    EXPECT_EQ(node["reason"].as<std::string>(), "users is a protected table");
    EXPECT_EQ(node["sql"].as<std::string>(), "DELETE FROM users;");
}

// ---------------------------------------------------------------------------
// Test: SnapshotLog 테이블 목록
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, SnapshotLogTables) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    SnapshotLog entry;
    entry.event       = "snapshot_created";
    entry.snapshot_id = "SNAPSHOT_20240102T030000_00000001";
    entry.run_id      = "RUN_2";
    entry.strategy    = "file_copy";
    entry.tables      = {"users", "visits"};
    entry.timestamp   = std::chrono::system_clock::now();
    logger.log_snapshot(entry);
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1u);

    const YAML::Node node = YAML::Load(lines[0]);
    EXPECT_EQ(node["event"].as<std::string>(), "snapshot_created");
    EXPECT_EQ(node["strategy"].as<std::string>(), "file_copy");
    ASSERT_TRUE(node["tables"].IsSequence());
    EXPECT_EQ(node["tables"].as<std::vector<std::string>>(), (std::vector<std::string>{"users", "visits"}));
}

// ---------------------------------------------------------------------------
// Test: 로그 레벨 필터링
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogLevelFiltering) {
    StructuredLogger logger(LogLevel::kWarn, log_file_, false);

    // info 레벨 (필터되어야 함)
    RunLog run;
    run.run_id    = "RUN_3";
    run.timestamp = std::chrono::system_clock::now();
    logger.log_run(run);

    // warn 레벨 (기록되어야 함)
    BlockLog block;
    block.run_id    = "RUN_4";
    block.timestamp = run.timestamp;
    logger.log_block(block);
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("run_blocked"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 멀티스레드 동시 로깅 (라인이 섞이지 않음)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, MultithreadedLoggingKeepsLinesIntact) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    const int                num_threads     = 4;
    const int                logs_per_thread = 25;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < logs_per_thread; ++i) {
                RunLog entry;
                entry.run_id    = "RUN_" + std::to_string(t) + "_" + std::to_string(i);
                entry.timestamp = std::chrono::system_clock::now();
                logger.log_run(entry);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), static_cast<std::size_t>(num_threads * logs_per_thread));
    for (const auto& line : lines) {
        EXPECT_NO_THROW((void)YAML::Load(line)) << line;
    }
}

// ---------------------------------------------------------------------------
// Test: JSON 이스케이프 처리
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, JsonEscaping) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    BlockLog entry;
    entry.run_id    = "RUN_5";
    entry.sql       = "UPDATE t SET note = 'say \"hi\"\\'\nWHERE id=1";
    entry.timestamp = std::chrono::system_clock::now();
    logger.log_block(entry);
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1u) << "newline inside SQL must be escaped";
    const YAML::Node node = YAML::Load(lines[0]);
    EXPECT_EQ(node["sql"].as<std::string>(), entry.sql);
}

// ---------------------------------------------------------------------------
// Test: 디버그/정보/경고/에러 로깅
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DiagnosticLogging) {
    StructuredLogger logger(LogLevel::kDebug, log_file_, false);

    logger.debug("Debug message");
    logger.info("Info message");
    logger.warn("Warning message");
    logger.error("Error message");
    logger.flush();

    // 진단 로그는 일반 텍스트이므로, 파일이 생성되고 크기가 0이 아닌지 확인
    std::ifstream file(log_file_);
    EXPECT_TRUE(file.is_open()) << "Log file was not created";

    file.seekg(0, std::ios::end);
    std::streamsize file_size = file.tellg();
    EXPECT_GT(file_size, 0) << "Log file is empty";
}

// ---------------------------------------------------------------------------
// Test: 레벨 문자열
// ---------------------------------------------------------------------------
TEST(LogLevelTest, FromString) {
    EXPECT_EQ(log_level_from_string("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(log_level_from_string("warning"), LogLevel::kWarn);
    EXPECT_FALSE(log_level_from_string("verbose").has_value());
}

TEST(JsonUtilTest, QuoteEscapesControlCharacters) {
    EXPECT_EQ(json_quote("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
}
