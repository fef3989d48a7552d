#pragma once

#include "features/rolling_form.hpp"
#include "fixtures/date_utils.hpp"
#include "fixtures/fixture.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ComparisonFeatures — home vs away differences (NaN if either side is NaN)
// ---------------------------------------------------------------------------
struct ComparisonFeatures {
    double form_difference = MISSING;
    double goals_difference = MISSING;
    double xg_difference = MISSING;
    double poss_difference = MISSING;
    double defensive_difference = MISSING;

    static std::vector<std::string> feature_names() {
        return {"form_difference", "goals_difference", "xg_difference",
                "poss_difference", "defensive_difference"};
    }
};

// ---------------------------------------------------------------------------
// FixtureFeatureRow — a fixture plus everything the pipeline attaches to it
// ---------------------------------------------------------------------------
struct FixtureFeatureRow {
    Fixture fixture;
    RollingStats home;
    RollingStats away;
    ComparisonFeatures comparison;

    // One entry per FeatureTable::team_vocabulary slot.
    std::vector<uint8_t> home_indicators;
    std::vector<uint8_t> away_indicators;
};

// ---------------------------------------------------------------------------
// FeatureTable — enriched fixture rows plus the column schema they share
// ---------------------------------------------------------------------------
struct FeatureTable {
    std::vector<FixtureFeatureRow> rows;
    std::vector<std::string> team_vocabulary;  // sorted; empty until encoded
    int window = 5;
    std::set<std::string> dropped_columns;

    // Base fixture columns, in output order.
    static std::vector<std::string> fixture_column_names() {
        return {"date", "time", "round", "home_team", "away_team", "venue", "result",
                "home_goals", "away_goals", "home_poss", "away_poss",
                "home_xg", "away_xg", "home_sh", "away_sh",
                "home_shot_on_target", "away_shot_on_target", "season"};
    }

    // e.g. rolling_column_name("home", "avg_xg") -> "home_avg_xg_last_5"
    std::string rolling_column_name(const std::string& role, const std::string& stat) const {
        return role + "_" + stat + "_last_" + std::to_string(window);
    }

    std::vector<std::string> rolling_column_names(const std::string& role) const {
        std::vector<std::string> names;
        for (const char* stat : RollingStats::stat_names()) {
            names.push_back(rolling_column_name(role, stat));
        }
        return names;
    }

    std::vector<std::string> indicator_column_names(const std::string& role) const {
        std::vector<std::string> names;
        names.reserve(team_vocabulary.size());
        for (const auto& team : team_vocabulary) names.push_back(role + "_" + team);
        return names;
    }

    // Every column that does not come from the team vocabulary.
    std::vector<std::string> non_indicator_column_names() const {
        std::vector<std::string> cols = fixture_column_names();
        for (const char* role : {"home", "away"}) {
            auto rolling = rolling_column_names(role);
            cols.insert(cols.end(), rolling.begin(), rolling.end());
        }
        auto comparison = ComparisonFeatures::feature_names();
        cols.insert(cols.end(), comparison.begin(), comparison.end());
        return cols;
    }

    // All columns before dropping.
    std::vector<std::string> full_column_names() const {
        std::vector<std::string> cols = fixture_column_names();
        auto append = [&cols](const std::vector<std::string>& v) {
            cols.insert(cols.end(), v.begin(), v.end());
        };
        append(rolling_column_names("home"));
        append(rolling_column_names("away"));
        append(indicator_column_names("home"));
        append(indicator_column_names("away"));
        append(ComparisonFeatures::feature_names());
        return cols;
    }

    std::vector<std::string> column_names() const {
        std::vector<std::string> cols;
        for (auto& name : full_column_names()) {
            if (!dropped_columns.count(name)) cols.push_back(std::move(name));
        }
        return cols;
    }

    // Columns whose cells are text rather than numbers.
    static bool is_text_column(const std::string& name) {
        return name == "date" || name == "time" || name == "round" || name == "home_team" ||
               name == "away_team" || name == "venue";
    }

    // Numeric value of a column for one row. Text columns and unknown names throw.
    double get_value(const FixtureFeatureRow& row, const std::string& name) const {
        const Fixture& f = row.fixture;
        if (name == "result") return static_cast<double>(f.result);
        if (name == "home_goals") return f.home_goals;
        if (name == "away_goals") return f.away_goals;
        if (name == "home_poss") return f.home_poss;
        if (name == "away_poss") return f.away_poss;
        if (name == "home_xg") return f.home_xg;
        if (name == "away_xg") return f.away_xg;
        if (name == "home_sh") return f.home_sh;
        if (name == "away_sh") return f.away_sh;
        if (name == "home_shot_on_target") return f.home_shot_on_target;
        if (name == "away_shot_on_target") return f.away_shot_on_target;
        if (name == "season") return static_cast<double>(f.season);

        if (name == "form_difference") return row.comparison.form_difference;
        if (name == "goals_difference") return row.comparison.goals_difference;
        if (name == "xg_difference") return row.comparison.xg_difference;
        if (name == "poss_difference") return row.comparison.poss_difference;
        if (name == "defensive_difference") return row.comparison.defensive_difference;

        for (const char* role : {"home", "away"}) {
            const RollingStats& rs = (role[0] == 'h') ? row.home : row.away;
            auto stats = RollingStats::stat_names();
            auto values = rs.values();
            for (size_t i = 0; i < RollingStats::STAT_COUNT; ++i) {
                if (name == rolling_column_name(role, stats[i])) return values[i];
            }

            const auto& indicators = (role[0] == 'h') ? row.home_indicators : row.away_indicators;
            std::string prefix = std::string(role) + "_";
            if (name.compare(0, prefix.size(), prefix) == 0) {
                auto it = std::lower_bound(team_vocabulary.begin(), team_vocabulary.end(),
                                           name.substr(prefix.size()));
                if (it != team_vocabulary.end() && *it == name.substr(prefix.size())) {
                    size_t slot = static_cast<size_t>(it - team_vocabulary.begin());
                    return slot < indicators.size() ? static_cast<double>(indicators[slot]) : 0.0;
                }
            }
        }

        throw std::invalid_argument("Unknown numeric column: " + name);
    }

    std::string get_text(const FixtureFeatureRow& row, const std::string& name) const {
        const Fixture& f = row.fixture;
        if (name == "date") return date_utils::format_date(f.date);
        if (name == "time") return f.time;
        if (name == "round") return f.round;
        if (name == "home_team") return f.home_team;
        if (name == "away_team") return f.away_team;
        if (name == "venue") return f.venue;
        throw std::invalid_argument("Unknown text column: " + name);
    }
};

// ---------------------------------------------------------------------------
// TableSummary
// ---------------------------------------------------------------------------
struct TableSummary {
    size_t rows = 0;
    size_t columns = 0;
    size_t missing_values = 0;
};

inline TableSummary summarize(const FeatureTable& table) {
    TableSummary s;
    auto cols = table.column_names();
    s.rows = table.rows.size();
    s.columns = cols.size();
    for (const auto& row : table.rows) {
        for (const auto& name : cols) {
            if (FeatureTable::is_text_column(name)) continue;
            if (std::isnan(table.get_value(row, name))) ++s.missing_values;
        }
    }
    return s;
}
