// match_log_split.cpp — CLI tool for turning a raw match log into season files
//
// Pipeline: read_match_log -> prepare_fixtures (TeamNameMap + merge_match_log)
// -> split_by_season -> write_fixture_csv.
//
// Usage: ./match_log_split --input <raw.csv> --output-dir <dir> [--keep-raw-names]

#include "ingest/match_log.hpp"
#include "io/fixture_csv.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

namespace fs = std::filesystem;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input <raw.csv> --output-dir <dir> [--keep-raw-names]\n"
              << "\n"
              << "  --input           Raw match log, one line per team per match\n"
              << "  --output-dir      Directory for <season>.csv files\n"
              << "  --keep-raw-names  Do not map 'team' spellings onto 'opponent' spellings\n";
}

int main(int argc, char* argv[]) {
    std::string input_path;
    std::string output_dir;
    MatchLogConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            input_path = argv[++i];
        } else if (arg == "--output-dir" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--keep-raw-names") {
            config.canonicalize_names = false;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (input_path.empty() || output_dir.empty()) {
        std::cerr << "Missing required argument: "
                  << (input_path.empty() ? "--input" : "--output-dir") << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto rows = read_match_log(input_path);
        std::cout << "Read " << rows.size() << " match log lines from " << input_path << "\n";

        auto prepared = prepare_fixtures(std::move(rows), config);
        if (config.canonicalize_names) {
            std::cout << "Canonicalized " << prepared.canonicalized_names << " team names\n";
        }
        const auto& fixtures = prepared.fixtures;
        std::cout << "Merged " << fixtures.size() << " fixtures\n";
        if (prepared.unpaired_home_lines > 0) {
            std::cerr << "Warning: dropped " << prepared.unpaired_home_lines
                      << " home lines with no matching away line\n";
        }
        if (fixtures.empty()) {
            std::cerr << "Error: no fixtures could be merged from " << input_path << "\n";
            return 1;
        }

        fs::create_directories(output_dir);
        for (const auto& [label, season_rows] : split_by_season(fixtures)) {
            fs::path out = fs::path(output_dir) / (label + ".csv");
            fixture_io::write_fixture_csv(out.string(), season_rows);
            std::cout << "  " << label << ": " << season_rows.size() << " fixtures -> "
                      << out.string() << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Data preprocessing completed!\n";
    return 0;
}
