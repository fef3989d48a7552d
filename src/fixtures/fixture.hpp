#pragma once

#include <cstddef>
#include <limits>
#include <string>

namespace outcome {
    constexpr int WIN  = 1;
    constexpr int DRAW = 0;
    constexpr int LOSS = -1;
}  // namespace outcome

inline constexpr double MISSING = std::numeric_limits<double>::quiet_NaN();

// ---------------------------------------------------------------------------
// RawFixtureRow — one fixture as read from a season file, before typing
// ---------------------------------------------------------------------------
struct RawFixtureRow {
    std::string date;
    std::string time;
    std::string round;
    std::string home_team;
    std::string away_team;
    std::string venue;
    std::string result;
    std::string home_goals;
    std::string away_goals;
    std::string home_poss;
    std::string away_poss;
    std::string home_xg;
    std::string away_xg;
    std::string home_sh;
    std::string away_sh;
    std::string home_shot_on_target;
    std::string away_shot_on_target;
    std::string season;
};

// ---------------------------------------------------------------------------
// Fixture — one match, typed. Outcome is from the home team's perspective.
// ---------------------------------------------------------------------------
struct Fixture {
    int date = 0;              // YYYYMMDD
    std::string time;          // kickoff, HH:MM
    std::string round;
    std::string home_team;
    std::string away_team;
    std::string venue;
    int result = outcome::DRAW;

    double home_goals = MISSING;
    double away_goals = MISSING;
    double home_poss = MISSING;
    double away_poss = MISSING;
    double home_xg = MISSING;
    double away_xg = MISSING;
    double home_sh = MISSING;
    double away_sh = MISSING;
    double home_shot_on_target = MISSING;
    double away_shot_on_target = MISSING;

    int season = 0;
};
