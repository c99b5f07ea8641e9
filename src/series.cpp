#include <garch/series.hpp>

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <stdexcept>

namespace garch {

PriceSeries dense_prices(const std::vector<Date>& dates,
                         const std::vector<double>& column) {
    if (dates.size() != column.size()) {
        throw std::invalid_argument("price column length must match the date index");
    }

    PriceSeries series;
    for (std::size_t t = 0; t < column.size(); ++t) {
        if (std::isnan(column[t])) {
            continue;
        }
        series.dates.push_back(dates[t]);
        series.values.push_back(column[t]);
    }
    return series;
}

ReturnSeries scaled_log_returns(const PriceSeries& prices) {
    ReturnSeries returns;
    if (prices.size() < 2) {
        return returns;
    }

    returns.dates.reserve(prices.size() - 1);
    returns.values.reserve(prices.size() - 1);
    for (std::size_t t = 1; t < prices.size(); ++t) {
        returns.dates.push_back(prices.dates[t]);
        returns.values.push_back(kReturnScale * std::log(prices.values[t] / prices.values[t - 1]));
    }
    return returns;
}

StageResult<ReturnSeries> prepare_returns(const std::vector<Date>& dates,
                                          const std::vector<double>& column) {
    const PriceSeries prices = dense_prices(dates, column);
    if (prices.size() < kMinObservations) {
        return Skip{SkipReason::InsufficientPrices,
                    fmt::format("{} valid prices, need {}", prices.size(), kMinObservations)};
    }

    ReturnSeries returns = scaled_log_returns(prices);
    if (returns.size() < kMinObservations) {
        return Skip{SkipReason::InsufficientReturns,
                    fmt::format("{} returns, need {}", returns.size(), kMinObservations)};
    }
    return returns;
}

} // namespace garch
