#pragma once

#include "features/feature_table.hpp"
#include "features/rolling_form.hpp"
#include "features/team_history.hpp"
#include "fixtures/fixture.hpp"
#include "pipeline/pipeline_errors.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// (team, date) -> rolling stats for that team's match on that date.
using RollingIndex = std::map<std::pair<std::string, int>, RollingStats>;

// Built once from the per-team sequences. A repeated key is tolerated only
// when both records carry identical statistics.
inline RollingIndex build_rolling_index(const TeamHistories& histories,
                                        const TeamRollingStats& stats) {
    RollingIndex index;
    for (const auto& [team, records] : histories) {
        auto it = stats.find(team);
        if (it == stats.end()) continue;
        const auto& team_stats = it->second;
        if (team_stats.size() != records.size()) {
            throw std::logic_error("rolling stats for team '" + team +
                                   "' do not match its history length");
        }

        for (size_t i = 0; i < records.size(); ++i) {
            auto [slot, inserted] = index.emplace(std::make_pair(team, records[i].date),
                                                  team_stats[i]);
            if (!inserted && !slot->second.same_values(team_stats[i])) {
                throw AmbiguousMatch(team, records[i].date);
            }
        }
    }
    return index;
}

// One pass over the fixtures, two lookups per row. A key with no entry
// leaves that side's statistics missing.
inline std::vector<FixtureFeatureRow> join_rolling_features(const std::vector<Fixture>& fixtures,
                                                            const RollingIndex& index) {
    std::vector<FixtureFeatureRow> rows;
    rows.reserve(fixtures.size());
    for (const auto& f : fixtures) {
        FixtureFeatureRow row;
        row.fixture = f;

        auto home_it = index.find({f.home_team, f.date});
        if (home_it != index.end()) row.home = home_it->second;

        auto away_it = index.find({f.away_team, f.date});
        if (away_it != index.end()) row.away = away_it->second;

        rows.push_back(std::move(row));
    }
    return rows;
}
