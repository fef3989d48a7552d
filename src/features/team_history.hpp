#pragma once

#include "fixtures/fixture.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TeamMatchRecord — one fixture seen from one participating team
// ---------------------------------------------------------------------------
struct TeamMatchRecord {
    std::string team;
    std::string opponent;
    int date = 0;
    size_t fixture_index = 0;
    bool is_home = false;

    int result = 0;  // +1 win, 0 draw, -1 loss for `team`
    double goals = MISSING;
    double goals_conceded = MISSING;
    double xg = MISSING;
    double xg_conceded = MISSING;
    double poss = MISSING;
    double shots = MISSING;
    double shots_on_target = MISSING;
};

using TeamHistories = std::map<std::string, std::vector<TeamMatchRecord>>;

inline TeamMatchRecord home_perspective(const Fixture& f, size_t idx) {
    TeamMatchRecord r;
    r.team = f.home_team;
    r.opponent = f.away_team;
    r.date = f.date;
    r.fixture_index = idx;
    r.is_home = true;
    r.result = f.result;
    r.goals = f.home_goals;
    r.goals_conceded = f.away_goals;
    r.xg = f.home_xg;
    r.xg_conceded = f.away_xg;
    r.poss = f.home_poss;
    r.shots = f.home_sh;
    r.shots_on_target = f.home_shot_on_target;
    return r;
}

inline TeamMatchRecord away_perspective(const Fixture& f, size_t idx) {
    TeamMatchRecord r;
    r.team = f.away_team;
    r.opponent = f.home_team;
    r.date = f.date;
    r.fixture_index = idx;
    r.is_home = false;
    r.result = -f.result;
    r.goals = f.away_goals;
    r.goals_conceded = f.home_goals;
    r.xg = f.away_xg;
    r.xg_conceded = f.home_xg;
    r.poss = f.away_poss;
    r.shots = f.away_sh;
    r.shots_on_target = f.away_shot_on_target;
    return r;
}

// Group every fixture by both of its teams in one pass, then order each
// team's sequence by date. stable_sort keeps input order for same-date records.
inline TeamHistories build_team_histories(const std::vector<Fixture>& fixtures) {
    TeamHistories histories;
    for (size_t i = 0; i < fixtures.size(); ++i) {
        const auto& f = fixtures[i];
        histories[f.home_team].push_back(home_perspective(f, i));
        histories[f.away_team].push_back(away_perspective(f, i));
    }

    for (auto& [team, records] : histories) {
        std::stable_sort(records.begin(), records.end(),
                         [](const TeamMatchRecord& a, const TeamMatchRecord& b) {
                             return a.date < b.date;
                         });
    }
    return histories;
}
