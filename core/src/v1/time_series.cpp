#include "stockflow/v1/time_series.hpp"

#include <stdexcept>

namespace stockflow::v1 {

TimeSeries::TimeSeries(std::vector<std::string> columns)
    : columns_(std::move(columns)) {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        index_.emplace(columns_[i], i);
    }
}

void TimeSeries::append_row(std::span<const Real> values) {
    if (values.size() != columns_.size()) {
        throw std::invalid_argument("Row width " + std::to_string(values.size()) +
                                    " does not match column count " +
                                    std::to_string(columns_.size()));
    }
    data_.insert(data_.end(), values.begin(), values.end());
}

std::span<const Real> TimeSeries::row(std::size_t index) const {
    if (index >= num_rows()) {
        throw std::out_of_range("Row index out of range: " + std::to_string(index));
    }
    return std::span<const Real>(data_).subspan(index * columns_.size(), columns_.size());
}

std::optional<std::size_t> TimeSeries::column_index(std::string_view name) const {
    const auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Real> TimeSeries::column(std::string_view name) const {
    const auto idx = column_index(name);
    if (!idx) {
        throw std::out_of_range("Column not found: " + std::string(name));
    }
    std::vector<Real> out;
    const std::size_t rows = num_rows();
    out.reserve(rows);
    for (std::size_t r = 0; r < rows; ++r) {
        out.push_back(data_[r * columns_.size() + *idx]);
    }
    return out;
}

Real TimeSeries::value(std::size_t row_index, std::string_view name) const {
    const auto idx = column_index(name);
    if (!idx) {
        throw std::out_of_range("Column not found: " + std::string(name));
    }
    return row(row_index)[*idx];
}

}  // namespace stockflow::v1
