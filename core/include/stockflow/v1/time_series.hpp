#pragma once

#include "stockflow/v1/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stockflow::v1 {

// =============================================================================
// Time Series
// =============================================================================
// Ordered per-step records produced by one simulation run. Column 0 is always
// "time"; the remaining columns follow entity declaration order (stocks,
// auxiliaries, flows). Rows are stored row-major in a single buffer.
// =============================================================================

class TimeSeries {
public:
    TimeSeries() = default;
    explicit TimeSeries(std::vector<std::string> columns);

    [[nodiscard]] const std::vector<std::string>& columns() const { return columns_; }
    [[nodiscard]] std::size_t num_columns() const { return columns_.size(); }
    [[nodiscard]] std::size_t num_rows() const {
        return columns_.empty() ? 0 : data_.size() / columns_.size();
    }
    [[nodiscard]] bool empty() const { return data_.empty(); }

    /// Append one record; throws std::invalid_argument on width mismatch
    void append_row(std::span<const Real> values);

    [[nodiscard]] std::span<const Real> row(std::size_t index) const;

    [[nodiscard]] std::optional<std::size_t> column_index(std::string_view name) const;

    /// Copy of one column; throws std::out_of_range for unknown names
    [[nodiscard]] std::vector<Real> column(std::string_view name) const;

    [[nodiscard]] Real value(std::size_t row_index, std::string_view name) const;

    [[nodiscard]] std::vector<Real> times() const { return column("time"); }

    /// False for a partial series captured when a run aborted
    [[nodiscard]] bool complete() const { return complete_; }
    void mark_complete(bool complete = true) { complete_ = complete; }

    void reserve_rows(std::size_t rows) { data_.reserve(rows * columns_.size()); }

private:
    std::vector<std::string> columns_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<Real> data_;
    bool complete_ = false;
};

}  // namespace stockflow::v1
