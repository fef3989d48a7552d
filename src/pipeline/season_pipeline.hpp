#pragma once

#include "features/comparison_features.hpp"
#include "features/feature_table.hpp"
#include "features/fixture_joiner.hpp"
#include "features/rolling_form.hpp"
#include "features/team_encoder.hpp"
#include "features/team_history.hpp"
#include "fixtures/fixture.hpp"
#include "fixtures/fixture_normalizer.hpp"

#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PipelineConfig
// ---------------------------------------------------------------------------
struct PipelineConfig {
    FeatureConfig features;
    bool encode_teams = true;
    // Removed from the output schema if present.
    std::vector<std::string> drop_columns = {"season", "home_formation", "away_formation"};
};

// Names that are not columns of the table are ignored.
inline void clean_feature_table(FeatureTable& table, const std::vector<std::string>& drop_columns) {
    auto cols = table.full_column_names();
    for (const auto& name : drop_columns) {
        if (std::find(cols.begin(), cols.end(), name) != cols.end()) {
            table.dropped_columns.insert(name);
        }
    }
}

// ---------------------------------------------------------------------------
// SeasonPipeline — normalized fixtures -> model-ready feature table.
//
//   build_team_histories -> compute_all_rolling_stats -> build_rolling_index
//   -> join_rolling_features -> encode_teams -> add_comparison_features
//   -> clean_feature_table
//
// Progress lines go to `log` when one is given.
// ---------------------------------------------------------------------------
class SeasonPipeline {
public:
    SeasonPipeline() = default;
    explicit SeasonPipeline(const PipelineConfig& config, std::ostream* log = nullptr)
        : config_(config), log_(log) {}

    const PipelineConfig& config() const { return config_; }

    FeatureTable run(const std::vector<Fixture>& fixtures) const {
        progress("Creating rolling features...");
        auto histories = build_team_histories(fixtures);
        auto stats = compute_all_rolling_stats(histories, config_.features);
        auto index = build_rolling_index(histories, stats);

        FeatureTable table;
        table.window = config_.features.window;
        table.rows = join_rolling_features(fixtures, index);

        if (config_.encode_teams) {
            progress("Encoding teams...");
            encode_teams(table);
        }

        progress("Creating comparison features...");
        add_comparison_features(table.rows);

        progress("Cleaning data...");
        clean_feature_table(table, config_.drop_columns);
        return table;
    }

    FeatureTable run(const std::vector<RawFixtureRow>& raw) const {
        progress("Loading and preparing data...");
        return run(normalize_fixtures(raw));
    }

private:
    PipelineConfig config_;
    std::ostream* log_ = nullptr;

    void progress(const char* msg) const {
        if (log_) *log_ << msg << "\n";
    }
};
