// season_feature_export.cpp — CLI tool for building per-season feature tables
//
// Pipeline: read_fixture_csv -> SeasonPipeline -> FeatureTableWriter.
// Every .csv file in --input-dir is processed into
// <output-dir>/<name>_engineered.<csv|parquet>.
//
// Usage: ./season_feature_export --input-dir <dir> --output-dir <dir> [options]

#include "features/feature_table.hpp"
#include "io/feature_table_writer.hpp"
#include "io/fixture_csv.hpp"
#include "pipeline/season_pipeline.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input-dir <dir> --output-dir <dir> [options]\n"
              << "\n"
              << "  --input-dir    Directory of per-season fixture CSV files\n"
              << "  --output-dir   Directory for engineered tables (created if missing)\n"
              << "  --format       csv (default) or parquet\n"
              << "  --window       Rolling window length (default 5)\n"
              << "  --min-periods  Minimum prior matches for a rolling value (default 1)\n"
              << "  --threads      Worker tasks for per-team rolling stats (default 1)\n"
              << "  --no-encode    Skip team indicator columns\n"
              << "  --keep-season  Keep the season column in the output\n";
}

int parse_int_arg(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    long v = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || end != value.c_str() + value.size()) {
        throw std::invalid_argument("Invalid integer for " + flag + ": '" + value + "'");
    }
    return static_cast<int>(v);
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string input_dir;
    std::string output_dir;
    std::string format = "csv";
    PipelineConfig config;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input-dir" && i + 1 < argc) {
                input_dir = argv[++i];
            } else if (arg == "--output-dir" && i + 1 < argc) {
                output_dir = argv[++i];
            } else if (arg == "--format" && i + 1 < argc) {
                format = argv[++i];
            } else if (arg == "--window" && i + 1 < argc) {
                config.features.window = parse_int_arg(arg, argv[++i]);
            } else if (arg == "--min-periods" && i + 1 < argc) {
                config.features.min_periods = parse_int_arg(arg, argv[++i]);
            } else if (arg == "--threads" && i + 1 < argc) {
                config.features.num_threads = parse_int_arg(arg, argv[++i]);
            } else if (arg == "--no-encode") {
                config.encode_teams = false;
            } else if (arg == "--keep-season") {
                config.drop_columns.erase(
                    std::remove(config.drop_columns.begin(), config.drop_columns.end(), "season"),
                    config.drop_columns.end());
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (input_dir.empty()) {
        std::cerr << "Missing required argument: --input-dir\n";
        print_usage(argv[0]);
        return 1;
    }
    if (output_dir.empty()) {
        std::cerr << "Missing required argument: --output-dir\n";
        print_usage(argv[0]);
        return 1;
    }

    TableFormat table_format;
    try {
        table_format = parse_table_format(format);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    if (!fs::is_directory(input_dir)) {
        std::cerr << "Error: Input directory not found at '" << input_dir << "'\n";
        return 1;
    }
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "Cannot create output directory '" << output_dir << "': "
                  << ec.message() << "\n";
        return 1;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(input_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".csv") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    if (files.empty()) {
        std::cout << "No CSV files found in '" << input_dir << "'.\n";
        return 0;
    }

    SeasonPipeline pipeline(config, &std::cout);
    int failures = 0;

    for (const auto& input : files) {
        fs::path output = fs::path(output_dir) /
                          (input.stem().string() + "_engineered" + format_extension(table_format));

        std::cout << "\n==================== PROCESSING: " << input.filename().string()
                  << " ====================\n";
        try {
            auto raw = fixture_io::read_fixture_csv(input.string());
            FeatureTable table = pipeline.run(raw);

            std::cout << "Saving processed data to " << output.string() << "\n";
            FeatureTableWriter writer(ExportConfig{output.string(), table_format});
            writer.write(table);

            auto summary = summarize(table);
            std::cout << "Feature engineering complete! Dataset shape: (" << summary.rows
                      << ", " << summary.columns << ")\n";
            std::cout << "\n--- DATA SUMMARY ---\n";
            std::cout << "Shape: (" << summary.rows << ", " << summary.columns << ")\n";
            std::cout << "Missing values: " << summary.missing_values << "\n";
            std::cout << "Output saved to: " << output.string() << "\n";
        } catch (const std::exception& e) {
            std::cerr << "!!! Error processing " << input.filename().string() << ": "
                      << e.what() << "\n";
            ++failures;
        }
    }

    std::cout << "\nProcessed " << (files.size() - static_cast<size_t>(failures)) << " of "
              << files.size() << " files\n";
    return failures == 0 ? 0 : 1;
}
