#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include <garch/calendar.hpp>

namespace garch {

struct PriceTable {
    std::vector<Date> dates;
    std::vector<std::string> assets;
    std::vector<std::vector<double>> columns; // columns[asset][row], NaN = missing

    [[nodiscard]] std::size_t rows() const noexcept;
    [[nodiscard]] std::size_t asset_count() const noexcept;
};

struct LoadOptions {
    std::vector<std::string> missing_tokens{"-", "missing"};
};

bool parse_prices_csv(std::istream& input,
                      const LoadOptions& options,
                      PriceTable& table);

bool load_prices_csv(const std::string& path,
                     const LoadOptions& options,
                     PriceTable& table);

std::size_t drop_empty_columns(PriceTable& table);

} // namespace garch
