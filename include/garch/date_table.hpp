#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <garch/calendar.hpp>

namespace garch {

using Cell = std::optional<double>;

class DateTable {
public:
    DateTable() = default;
    explicit DateTable(std::vector<Date> index);

    [[nodiscard]] const std::vector<Date>& index() const noexcept { return index_; }
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }
    [[nodiscard]] const std::vector<std::vector<Cell>>& columns() const noexcept { return columns_; }
    [[nodiscard]] std::size_t rows() const noexcept { return index_.size(); }
    [[nodiscard]] std::size_t column_count() const noexcept { return names_.size(); }

    [[nodiscard]] std::optional<std::size_t> find(std::string_view name) const;
    [[nodiscard]] std::optional<std::size_t> row_of(Date date) const;
    [[nodiscard]] const Cell& cell(std::size_t row, std::size_t column) const;

    // Cells must span the whole index.
    void add_column(std::string name, std::vector<Cell> cells);

    // Places values[i] on the row of dates[i]; rows without a value stay
    // empty, as do positions before first_defined.
    void add_column(std::string name,
                    const std::vector<Date>& dates,
                    const std::vector<double>& values,
                    std::size_t first_defined = 0);

    // First row holding any value, if one exists.
    [[nodiscard]] std::optional<std::size_t> first_populated_row() const;
    [[nodiscard]] std::optional<std::size_t> first_populated_row(std::size_t column) const;

private:
    std::vector<Date> index_;
    std::vector<std::string> names_;
    std::vector<std::vector<Cell>> columns_;
};

} // namespace garch
