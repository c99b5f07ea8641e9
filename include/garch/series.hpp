#pragma once

#include <cstddef>
#include <vector>

#include <garch/calendar.hpp>
#include <garch/stage.hpp>

namespace garch {

// Minimum number of prices and of returns an asset needs to be modelled.
inline constexpr std::size_t kMinObservations = 100;
inline constexpr double kReturnScale = 100.0;

struct Series {
    std::vector<Date> dates;
    std::vector<double> values;

    [[nodiscard]] std::size_t size() const noexcept { return values.size(); }
    [[nodiscard]] bool empty() const noexcept { return values.empty(); }
};

using PriceSeries = Series;
using ReturnSeries = Series;

PriceSeries dense_prices(const std::vector<Date>& dates,
                         const std::vector<double>& column);

ReturnSeries scaled_log_returns(const PriceSeries& prices);

StageResult<ReturnSeries> prepare_returns(const std::vector<Date>& dates,
                                          const std::vector<double>& column);

} // namespace garch
