// comparison_features_test.cpp — tests for home vs away difference features

#include <gtest/gtest.h>

#include "features/comparison_features.hpp"
#include "features/feature_table.hpp"

#include <cmath>
#include <vector>

namespace {

RollingStats make_stats(double form, double goals, double conceded, double xg, double poss) {
    RollingStats s;
    s.form = form;
    s.avg_goals = goals;
    s.avg_goals_conceded = conceded;
    s.avg_xg = xg;
    s.avg_xg_conceded = 1.0;
    s.avg_poss = poss;
    s.avg_shots = 10.0;
    s.avg_shots_on_target = 4.0;
    return s;
}

}  // anonymous namespace

TEST(ComparisonFeaturesTest, HomeMinusAway) {
    auto c = compute_comparison_features(make_stats(0.6, 2.0, 0.8, 1.9, 58.0),
                                         make_stats(-0.2, 1.2, 1.6, 1.1, 44.0));
    EXPECT_DOUBLE_EQ(c.form_difference, 0.6 - (-0.2));
    EXPECT_DOUBLE_EQ(c.goals_difference, 2.0 - 1.2);
    EXPECT_DOUBLE_EQ(c.xg_difference, 1.9 - 1.1);
    EXPECT_DOUBLE_EQ(c.poss_difference, 58.0 - 44.0);
}

TEST(ComparisonFeaturesTest, DefensiveDifferenceIsAwayMinusHome) {
    auto c = compute_comparison_features(make_stats(0, 0, 0.8, 0, 50),
                                         make_stats(0, 0, 1.6, 0, 50));
    EXPECT_DOUBLE_EQ(c.defensive_difference, 1.6 - 0.8);
}

TEST(ComparisonFeaturesTest, FormDifferenceIsExact) {
    RollingStats home, away;
    home.form = 0.4;
    away.form = 1.0 / 3.0;
    EXPECT_EQ(compute_comparison_features(home, away).form_difference, 0.4 - 1.0 / 3.0);
}

TEST(ComparisonFeaturesTest, MissingOperandGivesMissingResult) {
    RollingStats missing;
    auto present = make_stats(0.2, 1.0, 1.0, 1.0, 50.0);

    for (const auto& c : {compute_comparison_features(missing, present),
                          compute_comparison_features(present, missing),
                          compute_comparison_features(missing, missing)}) {
        EXPECT_TRUE(std::isnan(c.form_difference));
        EXPECT_TRUE(std::isnan(c.goals_difference));
        EXPECT_TRUE(std::isnan(c.xg_difference));
        EXPECT_TRUE(std::isnan(c.poss_difference));
        EXPECT_TRUE(std::isnan(c.defensive_difference));
    }
}

TEST(ComparisonFeaturesTest, AppliedToEveryRow) {
    std::vector<FixtureFeatureRow> rows(3);
    rows[1].home = make_stats(1.0, 2.0, 0.0, 2.0, 60.0);
    rows[1].away = make_stats(0.0, 1.0, 1.0, 1.0, 40.0);
    add_comparison_features(rows);

    EXPECT_TRUE(std::isnan(rows[0].comparison.form_difference));
    EXPECT_DOUBLE_EQ(rows[1].comparison.form_difference, 1.0);
    EXPECT_DOUBLE_EQ(rows[1].comparison.defensive_difference, 1.0);
    EXPECT_TRUE(std::isnan(rows[2].comparison.goals_difference));
}
