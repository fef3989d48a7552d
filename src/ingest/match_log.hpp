#pragma once

#include "fixtures/date_utils.hpp"
#include "fixtures/fixture.hpp"
#include "fixtures/fixture_normalizer.hpp"
#include "io/fixture_csv.hpp"
#include "pipeline/pipeline_errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

// ---------------------------------------------------------------------------
// MatchLogRow — one team's line for one match in the raw match log. Every
// match appears twice, once with venue "Home" and once with venue "Away".
// ---------------------------------------------------------------------------
struct MatchLogRow {
    std::string date;
    std::string time;
    std::string round;
    std::string team;
    std::string opponent;
    std::string venue;
    std::string gf;
    std::string ga;
    std::string result;
    std::string formation;
    std::string opp_formation;
    std::string poss;
    std::string xg;
    std::string xga;
    std::string sh;
    std::string sot;
    std::string dist;
    std::string season;
};

inline const std::vector<std::string>& required_match_log_columns() {
    static const std::vector<std::string> cols = {
        "date", "time", "round", "team", "opponent", "venue", "gf", "ga", "result",
        "poss", "xg", "xga", "sh", "sot", "season"};
    return cols;
}

inline std::vector<MatchLogRow> read_match_log(std::istream& in, const std::string& source) {
    std::string line;
    if (!std::getline(in, line)) {
        throw SchemaError("Empty match log: " + source);
    }
    fixture_io::CsvHeader header(fixture_io::split_csv_line(line));
    header.require(required_match_log_columns(), source);

    std::vector<MatchLogRow> rows;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;
        auto f = fixture_io::split_csv_line(line);
        MatchLogRow r;
        r.date          = header.get(f, "date");
        r.time          = header.get(f, "time");
        r.round         = header.get(f, "round");
        r.team          = header.get(f, "team");
        r.opponent      = header.get(f, "opponent");
        r.venue         = header.get(f, "venue");
        r.gf            = header.get(f, "gf");
        r.ga            = header.get(f, "ga");
        r.result        = header.get(f, "result");
        r.formation     = header.get(f, "formation");
        r.opp_formation = header.get(f, "opp formation");
        r.poss          = header.get(f, "poss");
        r.xg            = header.get(f, "xg");
        r.xga           = header.get(f, "xga");
        r.sh            = header.get(f, "sh");
        r.sot           = header.get(f, "sot");
        r.dist          = header.get(f, "dist");
        r.season        = header.get(f, "season");
        rows.push_back(std::move(r));
    }
    return rows;
}

inline std::vector<MatchLogRow> read_match_log(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    return read_match_log(file, path);
}

// ---------------------------------------------------------------------------
// TeamNameMap — the `team` column and the `opponent` column of a match log
// can spell the same club differently. Sorting the unique names of each
// column and pairing them position by position maps `team` spellings onto
// `opponent` spellings.
// ---------------------------------------------------------------------------
class TeamNameMap {
public:
    TeamNameMap() = default;

    static TeamNameMap from_rows(const std::vector<MatchLogRow>& rows) {
        std::set<std::string> teams, opponents;
        for (const auto& r : rows) {
            teams.insert(r.team);
            opponents.insert(r.opponent);
        }
        if (teams.size() != opponents.size()) {
            throw SchemaError("Cannot align team names: " + std::to_string(teams.size()) +
                              " distinct teams vs " + std::to_string(opponents.size()) +
                              " distinct opponents");
        }

        TeamNameMap m;
        auto t = teams.begin();
        auto o = opponents.begin();
        for (; t != teams.end(); ++t, ++o) m.mapping_.emplace(*t, *o);
        return m;
    }

    // Unmapped names pass through unchanged.
    std::string canonical(const std::string& name) const {
        auto it = mapping_.find(name);
        return it == mapping_.end() ? name : it->second;
    }

    void apply(std::vector<MatchLogRow>& rows) const {
        for (auto& r : rows) r.team = canonical(r.team);
    }

    size_t size() const { return mapping_.size(); }

private:
    std::map<std::string, std::string> mapping_;
};

namespace match_log_detail {

inline bool venue_is(const std::string& venue, const char* expected) {
    std::string v = date_utils::detail::trim(venue);
    std::string e = expected;
    return v.size() == e.size() &&
           std::equal(v.begin(), v.end(), e.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

}  // namespace match_log_detail

// Pair each Home line with the Away line of the same (date, home, away)
// match. The home line supplies everything except the away side's shots,
// shots on target and possession, which come from the away line. Home lines
// with no partner are dropped and counted in `unpaired_home` when given.
// Output is ordered by (date, time), stable.
inline std::vector<RawFixtureRow> merge_match_log(const std::vector<MatchLogRow>& rows,
                                                  size_t* unpaired_home = nullptr) {
    using Key = std::tuple<int, std::string, std::string>;

    std::map<Key, const MatchLogRow*> away_lines;
    for (const auto& r : rows) {
        if (!match_log_detail::venue_is(r.venue, "Away")) continue;
        Key key{date_utils::parse_match_date(r.date), r.opponent, r.team};
        if (!away_lines.emplace(key, &r).second) {
            throw SchemaError("Duplicate away record for " + r.opponent + " vs " + r.team +
                              " on " + r.date);
        }
    }

    struct Keyed {
        int date;
        std::string time;
        RawFixtureRow row;
    };
    std::vector<Keyed> merged;
    std::set<Key> seen;
    size_t dropped = 0;

    for (const auto& r : rows) {
        if (!match_log_detail::venue_is(r.venue, "Home")) continue;
        Key key{date_utils::parse_match_date(r.date), r.team, r.opponent};
        auto it = away_lines.find(key);
        if (it == away_lines.end()) {
            ++dropped;
            continue;
        }
        if (!seen.insert(key).second) {
            throw SchemaError("Duplicate home record for " + r.team + " vs " + r.opponent +
                              " on " + r.date);
        }
        const MatchLogRow& away = *it->second;

        RawFixtureRow f;
        f.date = r.date;
        f.time = r.time;
        f.round = r.round;
        f.home_team = r.team;
        f.away_team = r.opponent;
        f.venue = r.venue;
        f.result = r.result;
        f.home_goals = r.gf;
        f.away_goals = r.ga;
        f.home_poss = r.poss;
        f.away_poss = away.poss;
        f.home_xg = r.xg;
        f.away_xg = r.xga;
        f.home_sh = r.sh;
        f.away_sh = away.sh;
        f.home_shot_on_target = r.sot;
        f.away_shot_on_target = away.sot;
        f.season = r.season;
        merged.push_back({std::get<0>(key), r.time, std::move(f)});
    }

    std::stable_sort(merged.begin(), merged.end(), [](const Keyed& a, const Keyed& b) {
        if (a.date != b.date) return a.date < b.date;
        return a.time < b.time;
    });

    if (unpaired_home) *unpaired_home = dropped;

    std::vector<RawFixtureRow> out;
    out.reserve(merged.size());
    for (auto& m : merged) out.push_back(std::move(m.row));
    return out;
}

// ---------------------------------------------------------------------------
// MatchLogConfig / prepare_fixtures — raw match log -> merged fixtures.
// Team spellings are aligned onto opponent spellings unless
// canonicalize_names is off.
// ---------------------------------------------------------------------------
struct MatchLogConfig {
    bool canonicalize_names = true;
};

struct PreparedFixtures {
    std::vector<RawFixtureRow> fixtures;
    size_t canonicalized_names = 0;
    size_t unpaired_home_lines = 0;
};

inline PreparedFixtures prepare_fixtures(std::vector<MatchLogRow> rows,
                                         const MatchLogConfig& config = {}) {
    PreparedFixtures out;
    if (config.canonicalize_names) {
        auto names = TeamNameMap::from_rows(rows);
        names.apply(rows);
        out.canonicalized_names = names.size();
    }
    out.fixtures = merge_match_log(rows, &out.unpaired_home_lines);
    return out;
}

// ---------------------------------------------------------------------------
// Season splitting. Season id N is labelled "<N-1>-<N>".
// ---------------------------------------------------------------------------
inline std::string season_label(int season) {
    return std::to_string(season - 1) + "-" + std::to_string(season);
}

// Every fixture must carry a season id.
inline std::map<std::string, std::vector<RawFixtureRow>> split_by_season(
    const std::vector<RawFixtureRow>& fixtures) {
    std::map<std::string, std::vector<RawFixtureRow>> seasons;
    for (const auto& f : fixtures) {
        if (date_utils::detail::trim(f.season).empty()) {
            throw MalformedField("season", f.season);
        }
        seasons[season_label(parse_season(f.season))].push_back(f);
    }
    return seasons;
}
