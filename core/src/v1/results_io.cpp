#include "stockflow/v1/results_io.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace stockflow::v1 {

void write_csv(const TimeSeries& series, std::ostream& out) {
    const auto& columns = series.columns();
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) out << ",";
        out << columns[c];
    }
    out << "\n";

    out << std::setprecision(12);
    for (std::size_t r = 0; r < series.num_rows(); ++r) {
        const auto row = series.row(r);
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (c > 0) out << ",";
            out << row[c];
        }
        out << "\n";
    }
}

void write_csv(const TimeSeries& series, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }
    write_csv(series, file);
}

nlohmann::json to_json(const TimeSeries& series) {
    nlohmann::json rows = nlohmann::json::array();
    for (std::size_t r = 0; r < series.num_rows(); ++r) {
        const auto row = series.row(r);
        rows.push_back(std::vector<Real>(row.begin(), row.end()));
    }
    return {
        {"columns", series.columns()},
        {"rows", std::move(rows)},
        {"complete", series.complete()},
    };
}

nlohmann::json to_json(const TimeSeries& series, const std::map<std::string, std::string>& units) {
    auto j = to_json(series);
    j["units"] = units;
    return j;
}

nlohmann::json to_json(const ErrorDetail& detail) {
    nlohmann::json j = {
        {"code", std::string(to_string(detail.code))},
        {"entity", detail.entity},
        {"formula", detail.formula},
        {"message", detail.message},
    };
    j["time"] = detail.time ? nlohmann::json(*detail.time) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json to_json(const ScenarioOutcome& outcome) {
    nlohmann::json j = {
        {"scenario_label", outcome.label},
        {"status", std::string(to_string(outcome.status))},
        {"wall_time_seconds", outcome.wall_time_seconds},
    };
    if (outcome.ok() || !outcome.series.empty()) {
        j["time_series"] = to_json(outcome.series, outcome.units);
    }
    if (outcome.error) {
        j["error"] = to_json(*outcome.error);
    }
    return j;
}

nlohmann::json to_json(const std::vector<ScenarioOutcome>& outcomes) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& outcome : outcomes) {
        j.push_back(to_json(outcome));
    }
    return j;
}

std::vector<ColumnSummary> summarize(const TimeSeries& series, const std::vector<std::string>& names) {
    std::vector<std::string> selected = names;
    if (selected.empty()) {
        for (const auto& column : series.columns()) {
            if (column != kTimeName) selected.push_back(column);
        }
    }

    std::vector<ColumnSummary> summary;
    summary.reserve(selected.size());
    for (const auto& name : selected) {
        const auto values = series.column(name);
        ColumnSummary s;
        s.name = name;
        if (!values.empty()) {
            s.initial = values.front();
            s.final = values.back();
            const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
            s.minimum = *lo;
            s.maximum = *hi;
        }
        summary.push_back(std::move(s));
    }
    return summary;
}

nlohmann::json to_json(const std::vector<ColumnSummary>& summary) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& s : summary) {
        j[s.name] = {
            {"initial", s.initial},
            {"final", s.final},
            {"min", s.minimum},
            {"max", s.maximum},
        };
    }
    return j;
}

}  // namespace stockflow::v1
