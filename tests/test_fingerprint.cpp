// ---------------------------------------------------------------------------
// test_fingerprint.cpp
//
// 구문 지문 / 식별자 / ISO8601 헬퍼 단위 테스트.
//
// [테스트 범위]
// - normalize_sql: 주석 제거, 리터럴 밖 소문자화, 공백 축약, 끝 세미콜론 제거
// - fingerprint: 대소문자/공백만 다른 구문은 같은 지문, 리터럴이 다르면 다른 지문
// - make_run_id / make_snapshot_id 형식
// - format_iso8601 / parse_iso8601 (밀리초 정밀도)
// ---------------------------------------------------------------------------

#include "common/fingerprint.hpp"
#include "common/json_util.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <regex>
#include <set>
#include <string>

TEST(Fingerprint, NormalizeLowercasesOutsideLiterals) {
    EXPECT_EQ(normalize_sql("SELECT Name FROM Person WHERE Name = 'Alice'"),
              "select name from person where name = 'Alice'");
}

TEST(Fingerprint, NormalizeStripsCommentsAndWhitespace) {
    EXPECT_EQ(normalize_sql("  DELETE /* why */ FROM\n\tvisits   -- old rows\n WHERE id = 1 ;; "),
              "delete from visits where id = 1");
}

TEST(Fingerprint, CaseAndWhitespaceInsensitive) {
    EXPECT_EQ(fingerprint("select * from person"),
              fingerprint("SELECT   *\nFROM Person;"));
}

TEST(Fingerprint, LiteralValuesMatter) {
    EXPECT_NE(fingerprint("DELETE FROM t WHERE name = 'a'"),
              fingerprint("DELETE FROM t WHERE name = 'A'"));
}

TEST(Fingerprint, QuotingFollowsParserRules) {
    // 백슬래시는 이스케이프가 아니다: 'a\' 에서 리터럴이 끝나고 뒤의 -- 는 주석이다.
    EXPECT_EQ(normalize_sql("SELECT 'a\\' -- x' FROM t\n"), "select 'a\\'");
    // 중복 따옴표만 이스케이프
    EXPECT_EQ(normalize_sql("SELECT 'it''s' FROM T"), "select 'it''s' from t");
}

TEST(Fingerprint, HashIsNotAComment) {
    EXPECT_EQ(normalize_sql("SELECT a #> b FROM T"), "select a #> b from t");
}

TEST(Fingerprint, IsLowercaseSha256Hex) {
    const auto fp = fingerprint("SELECT 1");
    ASSERT_EQ(fp.size(), 64u);
    EXPECT_TRUE(std::regex_match(fp, std::regex("^[0-9a-f]{64}$")));
}

TEST(Fingerprint, EmptyNormalizedTextHashesEmptyString) {
    // SHA-256("")
    EXPECT_EQ(fingerprint(" ; "),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

// ---------------------------------------------------------------------------
// 식별자
// ---------------------------------------------------------------------------

TEST(Identifiers, RunIdFormat) {
    const auto id = make_run_id();
    EXPECT_TRUE(std::regex_match(id, std::regex("^RUN_[0-9]{8}T[0-9]{6}_[0-9a-f]{8}$"))) << id;
}

TEST(Identifiers, SnapshotIdFormat) {
    const auto id = make_snapshot_id();
    EXPECT_TRUE(std::regex_match(id, std::regex("^SNAPSHOT_[0-9]{8}T[0-9]{6}_[0-9a-f]{8}$"))) << id;
}

TEST(Identifiers, RunIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        ids.insert(make_run_id());
    }
    EXPECT_EQ(ids.size(), 200u);
}

// ---------------------------------------------------------------------------
// ISO8601
// ---------------------------------------------------------------------------

TEST(Iso8601, FormatIsUtcWithMillis) {
    const auto tp = std::chrono::sys_days{std::chrono::year{2024} / 1 / 2}
                  + std::chrono::hours{3} + std::chrono::minutes{4}
                  + std::chrono::seconds{5} + std::chrono::milliseconds{678};
    EXPECT_EQ(format_iso8601(tp), "2024-01-02T03:04:05.678Z");
    EXPECT_EQ(format_compact_utc(tp), "20240102T030405");
}

TEST(Iso8601, ParseRoundTripsMillisecondPrecision) {
    const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto parsed = parse_iso8601(format_iso8601(now));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, now);
}

TEST(Iso8601, ParseAcceptsDateOnly) {
    const auto parsed = parse_iso8601("2024-03-01");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, std::chrono::sys_days{std::chrono::year{2024} / 3 / 1});
}

TEST(Iso8601, ParseRejectsGarbage) {
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601("2024-13-01").has_value());
}
