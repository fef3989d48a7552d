#pragma once

#include "features/feature_table.hpp"
#include "pipeline/pipeline_errors.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// TeamEncoder — one indicator column per known team, per role (home / away).
//
// The vocabulary is fixed by fit() before encoding. A team outside the
// vocabulary encodes as an all-zero indicator row; no error is raised.
// ---------------------------------------------------------------------------
class TeamEncoder {
public:
    TeamEncoder() = default;
    explicit TeamEncoder(std::vector<std::string> vocabulary)
        : vocabulary_(std::move(vocabulary)) {
        std::sort(vocabulary_.begin(), vocabulary_.end());
        vocabulary_.erase(std::unique(vocabulary_.begin(), vocabulary_.end()), vocabulary_.end());
    }

    // Sorted union of home and away teams seen in rows.
    void fit(const std::vector<FixtureFeatureRow>& rows) {
        std::set<std::string> teams;
        for (const auto& row : rows) {
            teams.insert(row.fixture.home_team);
            teams.insert(row.fixture.away_team);
        }
        vocabulary_.assign(teams.begin(), teams.end());
    }

    const std::vector<std::string>& vocabulary() const { return vocabulary_; }

    std::vector<uint8_t> encode(const std::string& team) const {
        std::vector<uint8_t> indicators(vocabulary_.size(), 0);
        auto it = std::lower_bound(vocabulary_.begin(), vocabulary_.end(), team);
        if (it != vocabulary_.end() && *it == team) {
            indicators[static_cast<size_t>(it - vocabulary_.begin())] = 1;
        }
        return indicators;
    }

    // Rewrites every row's indicators from scratch, so repeated application
    // gives the same columns. A team whose indicator name would duplicate
    // another column (a club called "goals" gives "home_goals") throws
    // SchemaError and leaves the table untouched.
    void encode(FeatureTable& table) const {
        auto existing = table.non_indicator_column_names();
        std::set<std::string> taken(existing.begin(), existing.end());
        for (const auto& team : vocabulary_) {
            for (const char* role : {"home_", "away_"}) {
                std::string column = role + team;
                if (taken.count(column)) {
                    throw SchemaError("Team '" + team + "' produces indicator column '" +
                                      column + "', which duplicates an existing column");
                }
            }
        }

        table.team_vocabulary = vocabulary_;
        for (auto& row : table.rows) {
            row.home_indicators = encode(row.fixture.home_team);
            row.away_indicators = encode(row.fixture.away_team);
        }
    }

private:
    std::vector<std::string> vocabulary_;
};

// Fit on the table's own teams, then encode.
inline void encode_teams(FeatureTable& table) {
    TeamEncoder encoder;
    encoder.fit(table.rows);
    encoder.encode(table);
}
