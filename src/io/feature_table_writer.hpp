#pragma once

#include "features/feature_table.hpp"
#include "io/fixture_csv.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

// ---------------------------------------------------------------------------
// ExportConfig
// ---------------------------------------------------------------------------
enum class TableFormat { CSV, PARQUET };

struct ExportConfig {
    std::string output_path;
    TableFormat format = TableFormat::CSV;
};

// "csv" / "parquet"; anything else throws.
inline TableFormat parse_table_format(const std::string& name) {
    if (name == "csv") return TableFormat::CSV;
    if (name == "parquet") return TableFormat::PARQUET;
    throw std::invalid_argument("Unsupported format '" + name + "'. Use csv or parquet.");
}

inline const char* format_extension(TableFormat fmt) {
    return fmt == TableFormat::PARQUET ? ".parquet" : ".csv";
}

// Columns stored as integers rather than doubles.
inline bool is_integer_column(const FeatureTable& table, const std::string& name) {
    if (name == "result" || name == "season") return true;
    for (const char* role : {"home_", "away_"}) {
        std::string prefix = role;
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        std::string team = name.substr(prefix.size());
        if (std::binary_search(table.team_vocabulary.begin(), table.team_vocabulary.end(), team))
            return true;
    }
    return false;
}

// Shortest text that reads back to the same double. NaN -> empty cell.
inline std::string format_value(double val) {
    if (std::isnan(val)) return "";
    if (std::isinf(val)) return val > 0 ? "inf" : "-inf";
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), val);
    if (res.ec != std::errc()) {
        throw std::runtime_error("Cannot format value");
    }
    return std::string(buf, res.ptr);
}

// ---------------------------------------------------------------------------
// FeatureTableWriter
// ---------------------------------------------------------------------------
class FeatureTableWriter {
public:
    FeatureTableWriter() = default;
    explicit FeatureTableWriter(const ExportConfig& config) : config_(config) {}

    std::string header_line(const FeatureTable& table) const {
        auto cols = table.column_names();
        std::string line;
        for (size_t i = 0; i < cols.size(); ++i) {
            if (i > 0) line += ",";
            line += fixture_io::quote_csv_field(cols[i]);
        }
        return line;
    }

    std::string format_row(const FeatureTable& table, const FixtureFeatureRow& row) const {
        auto cols = table.column_names();
        std::string line;
        for (size_t i = 0; i < cols.size(); ++i) {
            if (i > 0) line += ",";
            if (FeatureTable::is_text_column(cols[i])) {
                line += fixture_io::quote_csv_field(table.get_text(row, cols[i]));
            } else {
                line += format_value(table.get_value(row, cols[i]));
            }
        }
        return line;
    }

    void write_csv(const FeatureTable& table, std::ostream& out) const {
        out << header_line(table) << "\n";
        for (const auto& row : table.rows) {
            out << format_row(table, row) << "\n";
        }
    }

    void write(const FeatureTable& table) const {
        if (config_.output_path.empty()) {
            throw std::invalid_argument("ExportConfig::output_path is empty");
        }
        auto parent = std::filesystem::path(config_.output_path).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            throw std::runtime_error("Output directory does not exist: " + parent.string());
        }

        if (config_.format == TableFormat::PARQUET) {
            write_parquet(table);
            return;
        }

        std::ofstream file(config_.output_path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open output file: " + config_.output_path);
        }
        write_csv(table, file);
    }

private:
    ExportConfig config_;

    static void check(const arrow::Status& status, const std::string& what) {
        if (!status.ok()) {
            throw std::runtime_error(what + ": " + status.ToString());
        }
    }

    void write_parquet(const FeatureTable& table) const {
        auto cols = table.column_names();

        arrow::FieldVector fields;
        std::vector<std::shared_ptr<arrow::Array>> arrays;

        for (const auto& name : cols) {
            std::shared_ptr<arrow::Array> arr;
            if (FeatureTable::is_text_column(name)) {
                arrow::StringBuilder b;
                for (const auto& row : table.rows)
                    check(b.Append(table.get_text(row, name)), "append " + name);
                check(b.Finish(&arr), "finish " + name);
                fields.push_back(arrow::field(name, arrow::utf8()));
            } else if (is_integer_column(table, name)) {
                arrow::Int64Builder b;
                for (const auto& row : table.rows)
                    check(b.Append(static_cast<int64_t>(table.get_value(row, name))),
                          "append " + name);
                check(b.Finish(&arr), "finish " + name);
                fields.push_back(arrow::field(name, arrow::int64()));
            } else {
                // Missing features become nulls.
                arrow::DoubleBuilder b;
                for (const auto& row : table.rows) {
                    double v = table.get_value(row, name);
                    if (std::isnan(v)) check(b.AppendNull(), "append " + name);
                    else check(b.Append(v), "append " + name);
                }
                check(b.Finish(&arr), "finish " + name);
                fields.push_back(arrow::field(name, arrow::float64()));
            }
            arrays.push_back(arr);
        }

        auto arrow_table = arrow::Table::Make(arrow::schema(fields), arrays);

        auto outfile_result = arrow::io::FileOutputStream::Open(config_.output_path);
        if (!outfile_result.ok()) {
            throw std::runtime_error("Cannot open Parquet output file: " + config_.output_path);
        }
        auto outfile = *outfile_result;

        auto props = parquet::WriterProperties::Builder()
            .compression(parquet::Compression::ZSTD)
            ->build();

        int64_t chunk_size = std::max<int64_t>(1, static_cast<int64_t>(table.rows.size()));
        check(parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), outfile,
                                         chunk_size, props),
              "Failed to write Parquet");
        check(outfile->Close(), "close " + config_.output_path);
    }
};
