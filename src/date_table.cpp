#include <garch/date_table.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace garch {

DateTable::DateTable(std::vector<Date> index)
    : index_(std::move(index)) {
    if (!std::is_sorted(index_.begin(), index_.end()) ||
        std::adjacent_find(index_.begin(), index_.end()) != index_.end()) {
        throw std::invalid_argument("date index must be strictly increasing");
    }
}

std::optional<std::size_t> DateTable::find(std::string_view name) const {
    const auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(names_.begin(), it));
}

std::optional<std::size_t> DateTable::row_of(Date date) const {
    const auto it = std::lower_bound(index_.begin(), index_.end(), date);
    if (it == index_.end() || *it != date) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(index_.begin(), it));
}

const Cell& DateTable::cell(std::size_t row, std::size_t column) const {
    return columns_.at(column).at(row);
}

void DateTable::add_column(std::string name, std::vector<Cell> cells) {
    if (cells.size() != index_.size()) {
        throw std::invalid_argument(fmt::format("column '{}' does not span the date index", name));
    }
    if (find(name)) {
        throw std::invalid_argument(fmt::format("duplicate column '{}'", name));
    }
    names_.push_back(std::move(name));
    columns_.push_back(std::move(cells));
}

void DateTable::add_column(std::string name,
                           const std::vector<Date>& dates,
                           const std::vector<double>& values,
                           std::size_t first_defined) {
    if (dates.size() != values.size()) {
        throw std::invalid_argument("dates and values length mismatch");
    }

    std::vector<Cell> cells(index_.size());
    for (std::size_t i = first_defined; i < values.size(); ++i) {
        const auto row = row_of(dates[i]);
        if (!row) {
            throw std::out_of_range(fmt::format("column '{}' has a date outside the index", name));
        }
        cells[*row] = values[i];
    }
    add_column(std::move(name), std::move(cells));
}

std::optional<std::size_t> DateTable::first_populated_row() const {
    std::optional<std::size_t> first;
    for (std::size_t col = 0; col < columns_.size(); ++col) {
        const auto row = first_populated_row(col);
        if (row && (!first || *row < *first)) {
            first = row;
        }
    }
    return first;
}

std::optional<std::size_t> DateTable::first_populated_row(std::size_t column) const {
    const auto& cells = columns_.at(column);
    const auto it = std::find_if(cells.begin(), cells.end(), [](const Cell& c) { return c.has_value(); });
    if (it == cells.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(cells.begin(), it));
}

} // namespace garch
