#pragma once

#include "stockflow/v1/errors.hpp"
#include "stockflow/v1/scenario_runner.hpp"
#include "stockflow/v1/time_series.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace stockflow::v1 {

// =============================================================================
// CSV
// =============================================================================

/// Header row with the column names, then one line per recorded row
void write_csv(const TimeSeries& series, std::ostream& out);
void write_csv(const TimeSeries& series, const std::string& filename);

// =============================================================================
// JSON
// =============================================================================

[[nodiscard]] nlohmann::json to_json(const TimeSeries& series);
[[nodiscard]] nlohmann::json to_json(const TimeSeries& series,
                                     const std::map<std::string, std::string>& units);
[[nodiscard]] nlohmann::json to_json(const ErrorDetail& detail);
[[nodiscard]] nlohmann::json to_json(const ScenarioOutcome& outcome);
[[nodiscard]] nlohmann::json to_json(const std::vector<ScenarioOutcome>& outcomes);

// =============================================================================
// Summaries
// =============================================================================

struct ColumnSummary {
    std::string name;
    Real initial = 0.0;
    Real final = 0.0;
    Real minimum = 0.0;
    Real maximum = 0.0;
};

/// Initial / final / min / max per column. An empty `names` summarizes every
/// column except time. Throws std::out_of_range for unknown names.
[[nodiscard]] std::vector<ColumnSummary> summarize(const TimeSeries& series,
                                                   const std::vector<std::string>& names = {});

[[nodiscard]] nlohmann::json to_json(const std::vector<ColumnSummary>& summary);

}  // namespace stockflow::v1
