#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// FeaturePipelineError — base of all structural input errors. A thrown error
// aborts processing of the affected season file.
// ---------------------------------------------------------------------------
class FeaturePipelineError : public std::runtime_error {
public:
    explicit FeaturePipelineError(const std::string& what) : std::runtime_error(what) {}
};

class UnrecognizedOutcome : public FeaturePipelineError {
public:
    explicit UnrecognizedOutcome(const std::string& label)
        : FeaturePipelineError("Unrecognized outcome label: '" + label + "'"),
          label_(label) {}

    const std::string& label() const { return label_; }

private:
    std::string label_;
};

class MalformedDate : public FeaturePipelineError {
public:
    explicit MalformedDate(const std::string& text)
        : FeaturePipelineError("Malformed date: '" + text + "'"),
          text_(text) {}

    const std::string& text() const { return text_; }

private:
    std::string text_;
};

// Non-empty numeric field that does not parse as a number.
class MalformedField : public FeaturePipelineError {
public:
    MalformedField(const std::string& column, const std::string& text)
        : FeaturePipelineError("Malformed value in column '" + column + "': '" + text + "'"),
          column_(column) {}

    const std::string& column() const { return column_; }

private:
    std::string column_;
};

// Two team-perspective records share a (team, date) key but carry different
// rolling statistics.
class AmbiguousMatch : public FeaturePipelineError {
public:
    AmbiguousMatch(const std::string& team, int date)
        : FeaturePipelineError("Ambiguous match for team '" + team + "' on " +
                               std::to_string(date) +
                               ": multiple records with differing statistics"),
          team_(team), date_(date) {}

    const std::string& team() const { return team_; }
    int date() const { return date_; }

private:
    std::string team_;
    int date_;
};

// Input file is missing a required column or is otherwise shaped wrong.
class SchemaError : public FeaturePipelineError {
public:
    explicit SchemaError(const std::string& what) : FeaturePipelineError(what) {}
};
