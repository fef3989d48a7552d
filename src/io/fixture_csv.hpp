#pragma once

#include "fixtures/fixture.hpp"
#include "pipeline/pipeline_errors.hpp"

#include <cstddef>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fixture_io {

// Split one CSV line. Double-quoted fields may contain commas and "" escapes.
inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else if (c != '\r' && c != '\n') {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

inline std::string quote_csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// ---------------------------------------------------------------------------
// CsvHeader — column name -> position, with required-column checking
// ---------------------------------------------------------------------------
class CsvHeader {
public:
    CsvHeader() = default;
    explicit CsvHeader(const std::vector<std::string>& names) {
        for (size_t i = 0; i < names.size(); ++i) positions_.emplace(names[i], i);
    }

    bool has(const std::string& name) const { return positions_.count(name) > 0; }

    void require(const std::vector<std::string>& names, const std::string& source) const {
        for (const auto& name : names) {
            if (!has(name)) {
                throw SchemaError("Missing required column '" + name + "' in " + source);
            }
        }
    }

    // Missing column or short row -> empty string.
    std::string get(const std::vector<std::string>& fields, const std::string& name) const {
        auto it = positions_.find(name);
        if (it == positions_.end() || it->second >= fields.size()) return "";
        return fields[it->second];
    }

private:
    std::map<std::string, size_t> positions_;
};

inline const std::vector<std::string>& fixture_csv_columns() {
    static const std::vector<std::string> cols = {
        "date", "time", "round", "home_team", "away_team", "venue", "result",
        "home_goals", "away_goals", "home_poss", "away_poss", "home_xg", "away_xg",
        "home_sh", "away_sh", "home_shot_on_target", "away_shot_on_target", "season"};
    return cols;
}

// Columns a season file cannot do without.
inline const std::vector<std::string>& required_fixture_columns() {
    static const std::vector<std::string> cols = {"date", "home_team", "away_team", "result"};
    return cols;
}

inline std::vector<RawFixtureRow> read_fixture_csv(std::istream& in, const std::string& source) {
    std::string line;
    if (!std::getline(in, line)) {
        throw SchemaError("Empty fixture file: " + source);
    }
    CsvHeader header(split_csv_line(line));
    header.require(required_fixture_columns(), source);

    std::vector<RawFixtureRow> rows;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;
        auto f = split_csv_line(line);
        RawFixtureRow r;
        r.date                = header.get(f, "date");
        r.time                = header.get(f, "time");
        r.round               = header.get(f, "round");
        r.home_team           = header.get(f, "home_team");
        r.away_team           = header.get(f, "away_team");
        r.venue               = header.get(f, "venue");
        r.result              = header.get(f, "result");
        r.home_goals          = header.get(f, "home_goals");
        r.away_goals          = header.get(f, "away_goals");
        r.home_poss           = header.get(f, "home_poss");
        r.away_poss           = header.get(f, "away_poss");
        r.home_xg             = header.get(f, "home_xg");
        r.away_xg             = header.get(f, "away_xg");
        r.home_sh             = header.get(f, "home_sh");
        r.away_sh             = header.get(f, "away_sh");
        r.home_shot_on_target = header.get(f, "home_shot_on_target");
        r.away_shot_on_target = header.get(f, "away_shot_on_target");
        r.season              = header.get(f, "season");
        rows.push_back(std::move(r));
    }
    return rows;
}

inline std::vector<RawFixtureRow> read_fixture_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    return read_fixture_csv(file, path);
}

inline void write_fixture_csv(std::ostream& out, const std::vector<RawFixtureRow>& rows) {
    const auto& cols = fixture_csv_columns();
    for (size_t i = 0; i < cols.size(); ++i) out << (i ? "," : "") << cols[i];
    out << "\n";

    for (const auto& r : rows) {
        const std::string* values[] = {
            &r.date, &r.time, &r.round, &r.home_team, &r.away_team, &r.venue, &r.result,
            &r.home_goals, &r.away_goals, &r.home_poss, &r.away_poss, &r.home_xg, &r.away_xg,
            &r.home_sh, &r.away_sh, &r.home_shot_on_target, &r.away_shot_on_target, &r.season};
        bool first = true;
        for (const std::string* v : values) {
            out << (first ? "" : ",") << quote_csv_field(*v);
            first = false;
        }
        out << "\n";
    }
}

inline void write_fixture_csv(const std::string& path, const std::vector<RawFixtureRow>& rows) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    write_fixture_csv(file, rows);
}

}  // namespace fixture_io
