// fixture_normalizer_test.cpp — tests for outcome / date / numeric normalization
//
// Covers normalize_outcome, date_utils::parse_match_date, parse_stat and
// normalize_fixture(s).

#include <gtest/gtest.h>

#include "fixtures/date_utils.hpp"
#include "fixtures/fixture_normalizer.hpp"
#include "pipeline/pipeline_errors.hpp"
#include "test_fixture_helpers.hpp"

#include <cmath>
#include <string>
#include <vector>

using fixture_helpers::make_raw;

// ===========================================================================
// Outcome labels
// ===========================================================================

TEST(NormalizeOutcomeTest, ShortLabelsMapToSignedValues) {
    EXPECT_EQ(normalize_outcome("W"), 1);
    EXPECT_EQ(normalize_outcome("D"), 0);
    EXPECT_EQ(normalize_outcome("L"), -1);
}

TEST(NormalizeOutcomeTest, LongLabelsAreCaseInsensitive) {
    EXPECT_EQ(normalize_outcome("win"), 1);
    EXPECT_EQ(normalize_outcome("Draw"), 0);
    EXPECT_EQ(normalize_outcome("LOSS"), -1);
    EXPECT_EQ(normalize_outcome(" w "), 1) << "surrounding whitespace is ignored";
}

TEST(NormalizeOutcomeTest, UnknownLabelThrows) {
    EXPECT_THROW(normalize_outcome("X"), UnrecognizedOutcome);
    EXPECT_THROW(normalize_outcome(""), UnrecognizedOutcome);
    EXPECT_THROW(normalize_outcome("won"), UnrecognizedOutcome);
}

TEST(NormalizeOutcomeTest, ErrorCarriesLabel) {
    try {
        normalize_outcome("abandoned");
        FAIL() << "expected UnrecognizedOutcome";
    } catch (const UnrecognizedOutcome& e) {
        EXPECT_EQ(e.label(), "abandoned");
        EXPECT_NE(std::string(e.what()).find("abandoned"), std::string::npos);
    }
}

TEST(NormalizeOutcomeTest, IsAFeaturePipelineError) {
    EXPECT_THROW(normalize_outcome("?"), FeaturePipelineError);
}

// ===========================================================================
// Dates
// ===========================================================================

TEST(ParseMatchDateTest, IsoDate) {
    EXPECT_EQ(date_utils::parse_match_date("2021-08-14"), 20210814);
}

TEST(ParseMatchDateTest, SlashSeparatedDate) {
    EXPECT_EQ(date_utils::parse_match_date("2021/08/14"), 20210814);
}

TEST(ParseMatchDateTest, TimePartIsDiscarded) {
    EXPECT_EQ(date_utils::parse_match_date("2021-08-14 15:30"), 20210814);
    EXPECT_EQ(date_utils::parse_match_date("2021-08-14T15:30:00"), 20210814);
}

TEST(ParseMatchDateTest, LeapDay) {
    EXPECT_EQ(date_utils::parse_match_date("2024-02-29"), 20240229);
    EXPECT_THROW(date_utils::parse_match_date("2023-02-29"), MalformedDate);
    EXPECT_THROW(date_utils::parse_match_date("1900-02-29"), MalformedDate);
    EXPECT_EQ(date_utils::parse_match_date("2000-02-29"), 20000229);
}

TEST(ParseMatchDateTest, MalformedInputsThrow) {
    const std::vector<std::string> bad = {
        "", "2021-8-14", "14/08/2021", "2021-13-01", "2021-04-31",
        "2021-08-14x", "2021-08/14", "yesterday", "2021-08-14 25:00"};
    for (const auto& text : bad) {
        EXPECT_THROW(date_utils::parse_match_date(text), MalformedDate) << "input: '" << text << "'";
    }
}

TEST(ParseMatchDateTest, OrderingIsChronological) {
    EXPECT_LT(date_utils::parse_match_date("2021-12-31"), date_utils::parse_match_date("2022-01-01"));
    EXPECT_LT(date_utils::parse_match_date("2022-01-09"), date_utils::parse_match_date("2022-01-10"));
}

TEST(FormatDateTest, RoundTripsIsoText) {
    EXPECT_EQ(date_utils::format_date(20220103), "2022-01-03");
}

// ===========================================================================
// Numeric fields
// ===========================================================================

TEST(ParseStatTest, ParsesNumbers) {
    EXPECT_DOUBLE_EQ(parse_stat("home_xg", "1.7"), 1.7);
    EXPECT_DOUBLE_EQ(parse_stat("home_goals", "3"), 3.0);
}

TEST(ParseStatTest, EmptyIsMissing) {
    EXPECT_TRUE(std::isnan(parse_stat("home_xg", "")));
    EXPECT_TRUE(std::isnan(parse_stat("home_xg", "  ")));
}

TEST(ParseStatTest, GarbageThrowsWithColumn) {
    try {
        parse_stat("away_sh", "12abc");
        FAIL() << "expected MalformedField";
    } catch (const MalformedField& e) {
        EXPECT_EQ(e.column(), "away_sh");
    }
}

// ===========================================================================
// Whole rows
// ===========================================================================

TEST(NormalizeFixtureTest, ConvertsTypedFieldsOnly) {
    auto raw = make_raw("2022-08-05", "Arsenal", "Crystal Palace", "W");
    Fixture f = normalize_fixture(raw);

    EXPECT_EQ(f.date, 20220805);
    EXPECT_EQ(f.result, 1);
    EXPECT_EQ(f.home_team, "Arsenal");
    EXPECT_EQ(f.away_team, "Crystal Palace");
    EXPECT_EQ(f.time, "20:00");
    EXPECT_EQ(f.round, "Matchweek 1");
    EXPECT_EQ(f.venue, "Home");
    EXPECT_DOUBLE_EQ(f.home_goals, 2.0);
    EXPECT_DOUBLE_EQ(f.away_goals, 1.0);
    EXPECT_DOUBLE_EQ(f.home_poss, 55.0);
    EXPECT_DOUBLE_EQ(f.away_poss, 45.0);
    EXPECT_DOUBLE_EQ(f.home_xg, 1.7);
    EXPECT_DOUBLE_EQ(f.away_xg, 0.9);
    EXPECT_DOUBLE_EQ(f.home_sh, 14.0);
    EXPECT_DOUBLE_EQ(f.away_sh, 9.0);
    EXPECT_DOUBLE_EQ(f.home_shot_on_target, 6.0);
    EXPECT_DOUBLE_EQ(f.away_shot_on_target, 3.0);
    EXPECT_EQ(f.season, 2022);
}

TEST(NormalizeFixtureTest, BadRowAbortsBatch) {
    std::vector<RawFixtureRow> rows = {
        make_raw("2022-08-05", "A", "B", "W"),
        make_raw("2022-08-06", "C", "D", "?"),
    };
    EXPECT_THROW(normalize_fixtures(rows), UnrecognizedOutcome);

    rows[1] = make_raw("2022-08-32", "C", "D", "L");
    EXPECT_THROW(normalize_fixtures(rows), MalformedDate);
}

TEST(NormalizeFixtureTest, PreservesRowOrder) {
    std::vector<RawFixtureRow> rows = {
        make_raw("2022-08-07", "A", "B", "W"),
        make_raw("2022-08-05", "C", "D", "D"),
        make_raw("2022-08-06", "E", "F", "L"),
    };
    auto out = normalize_fixtures(rows);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].date, 20220807);
    EXPECT_EQ(out[1].date, 20220805);
    EXPECT_EQ(out[2].date, 20220806);
    EXPECT_EQ(out[2].result, -1);
}
