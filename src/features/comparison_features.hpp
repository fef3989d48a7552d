#pragma once

#include "features/feature_table.hpp"

#include <vector>

// Plain subtraction, so a NaN operand gives a NaN difference.
inline ComparisonFeatures compute_comparison_features(const RollingStats& home,
                                                      const RollingStats& away) {
    ComparisonFeatures c;
    c.form_difference      = home.form - away.form;
    c.goals_difference     = home.avg_goals - away.avg_goals;
    c.xg_difference        = home.avg_xg - away.avg_xg;
    c.poss_difference      = home.avg_poss - away.avg_poss;
    c.defensive_difference = away.avg_goals_conceded - home.avg_goals_conceded;
    return c;
}

inline void add_comparison_features(std::vector<FixtureFeatureRow>& rows) {
    for (auto& row : rows) {
        row.comparison = compute_comparison_features(row.home, row.away);
    }
}
