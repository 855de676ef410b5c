// ---------------------------------------------------------------------------
// test_dry_run_estimator.cpp
//
// DryRunEstimator 단위 테스트.
//
// [테스트 범위]
// - rewrite(): 구문 종류별 카운트 쿼리 / exact 플래그 (I/O 없음)
// - estimate(): 임시 SQLite DB 에서 실제 영향 행 수 추정
// - 재작성 불가 구문 → kDryRunFailed
// - 추정은 부작용이 없고 반복해도 같은 결과
// ---------------------------------------------------------------------------

#include "db/sqlite_database.hpp"
#include "dryrun/dry_run_estimator.hpp"
#include "parser/sql_parser.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

namespace {

ParsedQuery parse_ok(const std::string& sql) {
    SqlParser parser;
    auto result = parser.parse(sql);
    EXPECT_TRUE(result.has_value()) << "parse failed: " << sql;
    return result.value_or(ParsedQuery{});
}

// visits 50 행 중 20 행이 2020-01-01 이전, person 5 행
class DryRunEstimatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("dbsafe_dryrun_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".db");
        std::filesystem::remove(path_);

        auto db = SqliteDatabase::open(path_);
        ASSERT_TRUE(db.has_value()) << db.error().message;
        db_ = std::move(*db);

        exec("CREATE TABLE person (id INTEGER PRIMARY KEY, name TEXT)");
        exec("CREATE TABLE visits (id INTEGER PRIMARY KEY, person_id INTEGER, visited_at TEXT)");
        exec("INSERT INTO person (name) VALUES ('a'), ('b'), ('c'), ('d'), ('e')");
        exec("INSERT INTO visits (person_id, visited_at) "
             "WITH RECURSIVE n(i) AS (SELECT 1 UNION ALL SELECT i + 1 FROM n WHERE i < 50) "
             "SELECT (i % 5) + 1, CASE WHEN i <= 20 THEN '2019-06-01' ELSE '2021-06-01' END FROM n");
    }

    void TearDown() override {
        db_.reset();
        std::filesystem::remove(path_);
    }

    void exec(const std::string& sql) {
        auto res = db_->run(sql);
        ASSERT_TRUE(res.has_value()) << sql << ": " << res.error().message;
    }

    std::uint64_t count(const std::string& table) {
        auto res = db_->run("SELECT COUNT(*) FROM " + table);
        EXPECT_TRUE(res.has_value());
        if (!res || res->rows.empty() || !res->rows.front().front()) {
            return 0;
        }
        return std::stoull(*res->rows.front().front());
    }

    std::filesystem::path           path_;
    std::unique_ptr<SqliteDatabase> db_;
};

}  // namespace

// ---------------------------------------------------------------------------
// rewrite (순수)
// ---------------------------------------------------------------------------

TEST(DryRunRewrite, SelectIsWrappedInCount) {
    const auto plan = DryRunEstimator::rewrite(parse_ok("SELECT * FROM person;"));
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->count_query,
              "SELECT COUNT(*) AS estimated_rows FROM (SELECT * FROM person) AS dbsafe_t");
    EXPECT_TRUE(plan->exact);
}

TEST(DryRunRewrite, DeleteKeepsPredicate) {
    const auto plan = DryRunEstimator::rewrite(
        parse_ok("DELETE FROM visits WHERE visited_at < '2020-01-01'"));
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->count_query,
              "SELECT COUNT(*) AS estimated_rows FROM visits WHERE visited_at < '2020-01-01'");
    EXPECT_TRUE(plan->exact);
}

TEST(DryRunRewrite, UnfilteredDeleteCountsWholeTable) {
    const auto plan = DryRunEstimator::rewrite(parse_ok("DELETE FROM users"));
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->count_query, "SELECT COUNT(*) AS estimated_rows FROM users");
}

TEST(DryRunRewrite, LimitedUpdateIsApproximate) {
    const auto plan = DryRunEstimator::rewrite(
        parse_ok("UPDATE person SET name = 'x' WHERE id > 10 ORDER BY id LIMIT 5"));
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->count_query, "SELECT COUNT(*) AS estimated_rows FROM person WHERE id > 10");
    EXPECT_FALSE(plan->exact);
}

TEST(DryRunRewrite, InsertValuesNeedsNoQuery) {
    const auto plan = DryRunEstimator::rewrite(parse_ok("INSERT INTO person (name) VALUES ('x'), ('y')"));
    ASSERT_TRUE(plan.has_value());
    EXPECT_TRUE(plan->count_query.empty());
    EXPECT_EQ(plan->literal_rows, 2u);
    EXPECT_TRUE(plan->exact);
}

TEST(DryRunRewrite, InsertSelectIsApproximate) {
    const auto plan = DryRunEstimator::rewrite(
        parse_ok("INSERT INTO archive SELECT * FROM visits WHERE id < 10"));
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->count_query,
              "SELECT COUNT(*) AS estimated_rows FROM (SELECT * FROM visits WHERE id < 10) AS dbsafe_t");
    EXPECT_FALSE(plan->exact);
}

TEST(DryRunRewrite, TruncateSumsTableCounts) {
    const auto plan = DryRunEstimator::rewrite(parse_ok("TRUNCATE TABLE visits"));
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->count_query, "SELECT (SELECT COUNT(*) FROM \"visits\") AS estimated_rows");
    EXPECT_TRUE(plan->exact);
}

TEST(DryRunRewrite, DropIsApproximate) {
    const auto plan = DryRunEstimator::rewrite(parse_ok("DROP TABLE visits"));
    ASSERT_TRUE(plan.has_value());
    EXPECT_FALSE(plan->exact);
}

TEST(DryRunRewrite, AlterReportsZeroRows) {
    const auto plan = DryRunEstimator::rewrite(parse_ok("ALTER TABLE person ADD note TEXT"));
    ASSERT_TRUE(plan.has_value());
    EXPECT_TRUE(plan->count_query.empty());
    EXPECT_EQ(plan->literal_rows, 0u);
    EXPECT_FALSE(plan->exact);
}

TEST(DryRunRewrite, OpaqueStatementsCannotBeRewritten) {
    for (const char* sql : {"CALL purge()", "EXECUTE stmt", "VACUUM"}) {
        const auto plan = DryRunEstimator::rewrite(parse_ok(sql));
        ASSERT_FALSE(plan.has_value()) << sql;
        EXPECT_EQ(plan.error().code, GateErrorCode::kDryRunFailed) << sql;
        EXPECT_NE(plan.error().message.find("no non-mutating equivalent"), std::string::npos) << sql;
    }
}

// ---------------------------------------------------------------------------
// estimate (SQLite)
// ---------------------------------------------------------------------------

TEST_F(DryRunEstimatorTest, SelectCountsReturnedRows) {
    DryRunEstimator estimator{*db_};
    const auto result = estimator.estimate(parse_ok("SELECT * FROM person"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->estimated_rows, 5u);
    EXPECT_TRUE(result->exact);
    EXPECT_FALSE(result->rewritten_query.empty());
}

TEST_F(DryRunEstimatorTest, FilteredDeleteCountsMatchingRows) {
    DryRunEstimator estimator{*db_};
    const auto result = estimator.estimate(parse_ok("DELETE FROM visits WHERE visited_at < '2020-01-01'"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->estimated_rows, 20u);
    EXPECT_TRUE(result->exact);
}

TEST_F(DryRunEstimatorTest, UpdateCountsMatchingRows) {
    DryRunEstimator estimator{*db_};
    const auto result = estimator.estimate(parse_ok("UPDATE visits SET person_id = 1 WHERE person_id = 2"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->estimated_rows, 10u);
}

TEST_F(DryRunEstimatorTest, InsertValuesDoesNotTouchDatabase) {
    DryRunEstimator estimator{*db_};
    const auto result = estimator.estimate(parse_ok("INSERT INTO missing_table (a) VALUES (1), (2), (3)"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->estimated_rows, 3u);
    EXPECT_TRUE(result->exact);
    EXPECT_TRUE(result->rewritten_query.empty());
}

TEST_F(DryRunEstimatorTest, TruncateCountsWholeTable) {
    DryRunEstimator estimator{*db_};
    const auto result = estimator.estimate(parse_ok("TRUNCATE TABLE visits"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->estimated_rows, 50u);
    EXPECT_TRUE(result->exact);
}

TEST_F(DryRunEstimatorTest, DropOfMissingTableIsZeroRows) {
    DryRunEstimator estimator{*db_};
    const auto result = estimator.estimate(parse_ok("DROP TABLE IF EXISTS nothing_here"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->estimated_rows, 0u);
    EXPECT_FALSE(result->exact);
}

TEST_F(DryRunEstimatorTest, UnknownColumnFailsEstimation) {
    DryRunEstimator estimator{*db_};
    const auto result = estimator.estimate(parse_ok("DELETE FROM visits WHERE no_such_column = 1"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GateErrorCode::kDryRunFailed);
}

TEST_F(DryRunEstimatorTest, EstimationLeavesNoSideEffects) {
    DryRunEstimator estimator{*db_};
    ASSERT_TRUE(estimator.estimate(parse_ok("DELETE FROM visits")).has_value());
    ASSERT_TRUE(estimator.estimate(parse_ok("TRUNCATE TABLE person")).has_value());
    EXPECT_EQ(count("visits"), 50u);
    EXPECT_EQ(count("person"), 5u);

    // 스코프가 닫힌 뒤에는 쓰기가 다시 가능해야 한다 (query_only 해제).
    auto res = db_->run("INSERT INTO person (name) VALUES ('f')");
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(count("person"), 6u);
}

TEST_F(DryRunEstimatorTest, RepeatedEstimatesAreIdentical) {
    DryRunEstimator estimator{*db_};
    const auto query = parse_ok("DELETE FROM visits WHERE person_id IN (1, 2)");
    const auto first  = estimator.estimate(query);
    const auto second = estimator.estimate(query);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}
