// rolling_form_test.cpp — tests for compute_rolling_stats / compute_all_rolling_stats
//
// Trailing window of prior matches only (no leakage), first match missing,
// min_periods, NaN samples, and serial vs parallel equivalence.

#include <gtest/gtest.h>

#include "features/rolling_form.hpp"
#include "features/team_history.hpp"
#include "test_fixture_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

using fixture_helpers::both_nan_or_equal;
using fixture_helpers::make_fixture;
using fixture_helpers::make_team_sequence;

namespace {

std::vector<TeamMatchRecord> records_with_goals(const std::vector<double>& goals) {
    std::vector<TeamMatchRecord> out;
    for (size_t i = 0; i < goals.size(); ++i) {
        TeamMatchRecord r;
        r.team = "A";
        r.date = 20220801 + static_cast<int>(i);
        r.result = 0;
        r.goals = goals[i];
        r.goals_conceded = 0.0;
        r.xg = 0.0;
        r.xg_conceded = 0.0;
        r.poss = 50.0;
        r.shots = 10.0;
        r.shots_on_target = 5.0;
        out.push_back(r);
    }
    return out;
}

}  // anonymous namespace

// ===========================================================================
// Window semantics
// ===========================================================================

TEST(RollingFormTest, FirstRecordIsMissing) {
    auto stats = compute_rolling_stats(records_with_goals({3.0, 1.0}));
    ASSERT_EQ(stats.size(), 2u);
    for (double v : stats[0].values()) {
        EXPECT_TRUE(std::isnan(v));
    }
}

TEST(RollingFormTest, SecondRecordUsesOnlyFirst) {
    auto stats = compute_rolling_stats(records_with_goals({3.0, 100.0}));
    EXPECT_DOUBLE_EQ(stats[1].avg_goals, 3.0);
}

TEST(RollingFormTest, WindowNeverIncludesCurrentMatch) {
    std::vector<double> goals = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
    auto stats = compute_rolling_stats(records_with_goals(goals));

    for (size_t i = 1; i < goals.size(); ++i) {
        size_t begin = i > 5 ? i - 5 : 0;
        double sum = 0.0;
        for (size_t j = begin; j < i; ++j) sum += goals[j];
        double expected = sum / static_cast<double>(i - begin);
        EXPECT_DOUBLE_EQ(stats[i].avg_goals, expected) << "index " << i;
    }
}

TEST(RollingFormTest, WindowCapsAtFivePriorMatches) {
    auto stats = compute_rolling_stats(records_with_goals({100, 1, 1, 1, 1, 1, 0}));
    // index 6 -> records 1..5, the 100 has left the window
    EXPECT_DOUBLE_EQ(stats[6].avg_goals, 1.0);
    // index 5 -> records 0..4
    EXPECT_DOUBLE_EQ(stats[5].avg_goals, (100.0 + 4.0) / 5.0);
}

TEST(RollingFormTest, FormScenarioWinWinLossDrawWinLoss) {
    auto fixtures = make_team_sequence("A", {1, 1, -1, 0, 1, -1});
    auto histories = build_team_histories(fixtures);
    auto stats = compute_rolling_stats(histories.at("A"));

    ASSERT_EQ(stats.size(), 6u);
    EXPECT_TRUE(std::isnan(stats[0].form));
    EXPECT_DOUBLE_EQ(stats[1].form, 1.0);
    EXPECT_DOUBLE_EQ(stats[2].form, 1.0);
    EXPECT_DOUBLE_EQ(stats[3].form, 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(stats[4].form, 0.25);
    EXPECT_DOUBLE_EQ(stats[5].form, 0.4) << "mean(+1, +1, -1, 0, +1)";
}

TEST(RollingFormTest, ConcededUsesOpponentSideRegardlessOfVenue) {
    auto fixtures = make_team_sequence("A", {1, -1, 0});
    auto histories = build_team_histories(fixtures);
    auto stats = compute_rolling_stats(histories.at("A"));
    // conceded: win -> 0, loss -> 2
    EXPECT_DOUBLE_EQ(stats[1].avg_goals_conceded, 0.0);
    EXPECT_DOUBLE_EQ(stats[2].avg_goals_conceded, 1.0);
    EXPECT_DOUBLE_EQ(stats[2].avg_goals, 1.0);
}

TEST(RollingFormTest, AllEightStatisticsAreAveraged) {
    std::vector<TeamMatchRecord> recs(3);
    for (size_t i = 0; i < recs.size(); ++i) {
        double k = static_cast<double>(i + 1);
        recs[i].date = 20220801 + static_cast<int>(i);
        recs[i].result = (i == 0) ? 1 : -1;
        recs[i].goals = k;
        recs[i].goals_conceded = 2 * k;
        recs[i].xg = 3 * k;
        recs[i].xg_conceded = 4 * k;
        recs[i].poss = 5 * k;
        recs[i].shots = 6 * k;
        recs[i].shots_on_target = 7 * k;
    }
    auto s = compute_rolling_stats(recs)[2];  // mean of k = 1, 2 -> 1.5
    EXPECT_DOUBLE_EQ(s.form, 0.0);
    EXPECT_DOUBLE_EQ(s.avg_goals, 1.5);
    EXPECT_DOUBLE_EQ(s.avg_goals_conceded, 3.0);
    EXPECT_DOUBLE_EQ(s.avg_xg, 4.5);
    EXPECT_DOUBLE_EQ(s.avg_xg_conceded, 6.0);
    EXPECT_DOUBLE_EQ(s.avg_poss, 7.5);
    EXPECT_DOUBLE_EQ(s.avg_shots, 9.0);
    EXPECT_DOUBLE_EQ(s.avg_shots_on_target, 10.5);
}

// ===========================================================================
// Missing samples and configuration
// ===========================================================================

TEST(RollingFormTest, NaNSamplesAreSkipped) {
    auto stats = compute_rolling_stats(records_with_goals({MISSING, 4.0, MISSING, 0.0}));
    EXPECT_TRUE(std::isnan(stats[1].avg_goals)) << "only prior sample is NaN";
    EXPECT_DOUBLE_EQ(stats[2].avg_goals, 4.0);
    EXPECT_DOUBLE_EQ(stats[3].avg_goals, 4.0);
}

TEST(RollingFormTest, MinPeriodsDelaysFirstValue) {
    FeatureConfig cfg;
    cfg.min_periods = 3;
    auto stats = compute_rolling_stats(records_with_goals({1, 2, 3, 4}), cfg);
    EXPECT_TRUE(std::isnan(stats[1].avg_goals));
    EXPECT_TRUE(std::isnan(stats[2].avg_goals));
    EXPECT_DOUBLE_EQ(stats[3].avg_goals, 2.0);
}

TEST(RollingFormTest, CustomWindow) {
    FeatureConfig cfg;
    cfg.window = 2;
    auto stats = compute_rolling_stats(records_with_goals({10, 20, 30, 40}), cfg);
    EXPECT_DOUBLE_EQ(stats[3].avg_goals, 25.0);
}

TEST(RollingFormTest, InvalidConfigThrows) {
    FeatureConfig cfg;
    cfg.window = 0;
    EXPECT_THROW(compute_rolling_stats(records_with_goals({1}), cfg), std::invalid_argument);
    cfg.window = 3;
    cfg.min_periods = 4;
    EXPECT_THROW(compute_rolling_stats(records_with_goals({1}), cfg), std::invalid_argument);
}

TEST(RollingFormTest, EmptySequence) {
    EXPECT_TRUE(compute_rolling_stats({}).empty());
}

// ===========================================================================
// All teams, serial and parallel
// ===========================================================================

TEST(AllRollingStatsTest, OneEntryPerTeamMatchingHistoryLength) {
    auto fixtures = make_team_sequence("A", {1, 0, -1, 1, 1, 0, -1});
    auto histories = build_team_histories(fixtures);
    auto all = compute_all_rolling_stats(histories);
    ASSERT_EQ(all.size(), histories.size());
    for (const auto& [team, records] : histories) {
        EXPECT_EQ(all.at(team).size(), records.size()) << team;
    }
}

TEST(AllRollingStatsTest, ParallelMatchesSerial) {
    std::vector<Fixture> fixtures;
    const char* teams[] = {"A", "B", "C", "D", "E", "F"};
    int date = 20220801;
    for (int round = 0; round < 6; ++round) {
        for (int i = 0; i < 6; i += 2) {
            int h = (i + round) % 6, a = (i + 1 + round * 2) % 6;
            if (h == a) a = (a + 1) % 6;
            fixtures.push_back(make_fixture(date, teams[h], teams[a], (round + i) % 3 - 1,
                                            round % 3, i % 2));
        }
        date += 7;
    }
    auto histories = build_team_histories(fixtures);

    FeatureConfig serial;
    FeatureConfig parallel;
    parallel.num_threads = 4;
    auto s = compute_all_rolling_stats(histories, serial);
    auto p = compute_all_rolling_stats(histories, parallel);

    ASSERT_EQ(s.size(), p.size());
    for (const auto& [team, stats] : s) {
        const auto& other = p.at(team);
        ASSERT_EQ(stats.size(), other.size());
        for (size_t i = 0; i < stats.size(); ++i) {
            EXPECT_TRUE(stats[i].same_values(other[i])) << team << " index " << i;
        }
    }
}

TEST(RollingStatsTest, SameValuesTreatsNaNAsEqual) {
    RollingStats a, b;
    EXPECT_TRUE(a.same_values(b));
    a.form = 0.5;
    EXPECT_FALSE(a.same_values(b));
    b.form = 0.5;
    EXPECT_TRUE(a.same_values(b));
    EXPECT_TRUE(both_nan_or_equal(a.avg_goals, b.avg_goals));
}
