#pragma once

#include "features/team_history.hpp"
#include "fixtures/fixture.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <future>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// FeatureConfig
// ---------------------------------------------------------------------------
struct FeatureConfig {
    int window = 5;
    int min_periods = 1;
    int num_threads = 1;
};

// ---------------------------------------------------------------------------
// RollingStats — trailing means over a team's prior matches (NaN = missing)
// ---------------------------------------------------------------------------
struct RollingStats {
    double form = MISSING;
    double avg_goals = MISSING;
    double avg_goals_conceded = MISSING;
    double avg_xg = MISSING;
    double avg_xg_conceded = MISSING;
    double avg_poss = MISSING;
    double avg_shots = MISSING;
    double avg_shots_on_target = MISSING;

    static constexpr size_t STAT_COUNT = 8;

    // Stat names without role prefix or window suffix, in column order.
    static std::array<const char*, STAT_COUNT> stat_names() {
        return {"form", "avg_goals", "avg_goals_conceded", "avg_xg",
                "avg_xg_conceded", "avg_poss", "avg_shots", "avg_shots_on_target"};
    }

    std::array<double, STAT_COUNT> values() const {
        return {form, avg_goals, avg_goals_conceded, avg_xg,
                avg_xg_conceded, avg_poss, avg_shots, avg_shots_on_target};
    }

    // NaN compares equal to NaN here.
    bool same_values(const RollingStats& other) const {
        auto a = values();
        auto b = other.values();
        for (size_t i = 0; i < STAT_COUNT; ++i) {
            bool a_nan = std::isnan(a[i]);
            bool b_nan = std::isnan(b[i]);
            if (a_nan != b_nan) return false;
            if (!a_nan && a[i] != b[i]) return false;
        }
        return true;
    }
};

using TeamRollingStats = std::map<std::string, std::vector<RollingStats>>;

namespace rolling_detail {

inline std::array<double, RollingStats::STAT_COUNT> record_values(const TeamMatchRecord& r) {
    return {static_cast<double>(r.result), r.goals, r.goals_conceded, r.xg,
            r.xg_conceded, r.poss, r.shots, r.shots_on_target};
}

}  // namespace rolling_detail

// Value at i is the mean over records [max(0, i - window), i - 1]. Record i
// itself never contributes. NaN samples are skipped; fewer than min_periods
// valid samples yields NaN.
inline std::vector<RollingStats> compute_rolling_stats(const std::vector<TeamMatchRecord>& records,
                                                       const FeatureConfig& config = {}) {
    if (config.window < 1) {
        throw std::invalid_argument("rolling window must be >= 1, got " +
                                    std::to_string(config.window));
    }
    if (config.min_periods < 1 || config.min_periods > config.window) {
        throw std::invalid_argument("min_periods must be in [1, window], got " +
                                    std::to_string(config.min_periods));
    }

    const size_t n = records.size();
    const size_t window = static_cast<size_t>(config.window);
    const size_t min_periods = static_cast<size_t>(config.min_periods);

    std::vector<std::array<double, RollingStats::STAT_COUNT>> samples;
    samples.reserve(n);
    for (const auto& r : records) samples.push_back(rolling_detail::record_values(r));

    std::vector<RollingStats> out(n);
    for (size_t i = 0; i < n; ++i) {
        size_t begin = (i > window) ? i - window : 0;
        std::array<double, RollingStats::STAT_COUNT> mean{};
        for (size_t s = 0; s < RollingStats::STAT_COUNT; ++s) {
            double sum = 0.0;
            size_t count = 0;
            for (size_t j = begin; j < i; ++j) {
                double v = samples[j][s];
                if (std::isnan(v)) continue;
                sum += v;
                ++count;
            }
            mean[s] = (count >= min_periods) ? sum / static_cast<double>(count) : MISSING;
        }

        auto& rs = out[i];
        rs.form                = mean[0];
        rs.avg_goals           = mean[1];
        rs.avg_goals_conceded  = mean[2];
        rs.avg_xg              = mean[3];
        rs.avg_xg_conceded     = mean[4];
        rs.avg_poss            = mean[5];
        rs.avg_shots           = mean[6];
        rs.avg_shots_on_target = mean[7];
    }
    return out;
}

// Rolling stats for every team. Teams are independent, so with
// num_threads > 1 they are split into contiguous chunks, one task per chunk,
// each producing its own map that is merged afterwards.
inline TeamRollingStats compute_all_rolling_stats(const TeamHistories& histories,
                                                  const FeatureConfig& config = {}) {
    TeamRollingStats result;
    if (config.num_threads <= 1 || histories.size() < 2) {
        for (const auto& [team, records] : histories) {
            result.emplace(team, compute_rolling_stats(records, config));
        }
        return result;
    }

    std::vector<const TeamHistories::value_type*> entries;
    entries.reserve(histories.size());
    for (const auto& entry : histories) entries.push_back(&entry);

    size_t n_tasks = std::min(static_cast<size_t>(config.num_threads), entries.size());
    size_t chunk = (entries.size() + n_tasks - 1) / n_tasks;

    std::vector<std::future<TeamRollingStats>> futures;
    for (size_t begin = 0; begin < entries.size(); begin += chunk) {
        size_t end = std::min(begin + chunk, entries.size());
        futures.push_back(std::async(std::launch::async, [&entries, &config, begin, end]() {
            TeamRollingStats partial;
            for (size_t k = begin; k < end; ++k) {
                partial.emplace(entries[k]->first,
                                compute_rolling_stats(entries[k]->second, config));
            }
            return partial;
        }));
    }

    for (auto& fut : futures) {
        result.merge(fut.get());
    }
    return result;
}
