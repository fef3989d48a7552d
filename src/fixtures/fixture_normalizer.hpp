#pragma once

#include "fixtures/date_utils.hpp"
#include "fixtures/fixture.hpp"
#include "pipeline/pipeline_errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Fixture normalization: outcome labels -> signed int, date strings ->
// YYYYMMDD, numeric text -> double. Nothing else about the row changes.
// ---------------------------------------------------------------------------

// W/D/L or win/draw/loss, case-insensitive. Home-team perspective.
inline int normalize_outcome(const std::string& label) {
    std::string key = date_utils::detail::trim(label);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "w" || key == "win")  return outcome::WIN;
    if (key == "d" || key == "draw") return outcome::DRAW;
    if (key == "l" || key == "loss") return outcome::LOSS;
    throw UnrecognizedOutcome(label);
}

// Empty field -> MISSING. Anything not fully consumed by strtod is an error.
inline double parse_stat(const std::string& column, const std::string& text) {
    std::string s = date_utils::detail::trim(text);
    if (s.empty() || s == "NaN" || s == "nan") return MISSING;

    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) {
        throw MalformedField(column, text);
    }
    return v;
}

// Empty field -> 0 (no season id).
inline int parse_season(const std::string& text) {
    std::string s = date_utils::detail::trim(text);
    if (s.empty()) return 0;

    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size() || errno == ERANGE ||
        v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw MalformedField("season", text);
    }
    return static_cast<int>(v);
}

inline Fixture normalize_fixture(const RawFixtureRow& raw) {
    Fixture f;
    f.date = date_utils::parse_match_date(raw.date);
    f.time = raw.time;
    f.round = raw.round;
    f.home_team = raw.home_team;
    f.away_team = raw.away_team;
    f.venue = raw.venue;
    f.result = normalize_outcome(raw.result);

    f.home_goals          = parse_stat("home_goals", raw.home_goals);
    f.away_goals          = parse_stat("away_goals", raw.away_goals);
    f.home_poss           = parse_stat("home_poss", raw.home_poss);
    f.away_poss           = parse_stat("away_poss", raw.away_poss);
    f.home_xg             = parse_stat("home_xg", raw.home_xg);
    f.away_xg             = parse_stat("away_xg", raw.away_xg);
    f.home_sh             = parse_stat("home_sh", raw.home_sh);
    f.away_sh             = parse_stat("away_sh", raw.away_sh);
    f.home_shot_on_target = parse_stat("home_shot_on_target", raw.home_shot_on_target);
    f.away_shot_on_target = parse_stat("away_shot_on_target", raw.away_shot_on_target);

    f.season = parse_season(raw.season);
    return f;
}

inline std::vector<Fixture> normalize_fixtures(const std::vector<RawFixtureRow>& rows) {
    std::vector<Fixture> out;
    out.reserve(rows.size());
    for (const auto& raw : rows) {
        out.push_back(normalize_fixture(raw));
    }
    return out;
}
