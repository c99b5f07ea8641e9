#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <garch/series.hpp>

#include <chrono>
#include <cmath>
#include <limits>
#include <vector>

using Catch::Approx;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

std::vector<garch::Date> make_dates(std::size_t n) {
    const garch::Date start = std::chrono::sys_days{std::chrono::year{2020} / 1 / 1};
    std::vector<garch::Date> dates;
    for (std::size_t i = 0; i < n; ++i) {
        dates.push_back(start + std::chrono::days{static_cast<int>(i)});
    }
    return dates;
}

std::vector<double> make_prices(std::size_t n) {
    std::vector<double> prices;
    for (std::size_t i = 0; i < n; ++i) {
        prices.push_back(100.0 * std::exp(0.02 * std::sin(0.3 * static_cast<double>(i))));
    }
    return prices;
}

} // namespace

TEST_CASE("scaled_log_returns are one hundred times the log price ratio") {
    garch::PriceSeries prices;
    prices.dates = make_dates(3);
    prices.values = {100.0, 105.0, 102.0};

    const auto returns = garch::scaled_log_returns(prices);
    REQUIRE(returns.size() == 2);
    REQUIRE(returns.dates[0] == prices.dates[1]);
    REQUIRE(returns.values[0] == Approx(100.0 * std::log(105.0 / 100.0)));
    REQUIRE(returns.values[1] == Approx(100.0 * std::log(102.0 / 105.0)));
}

TEST_CASE("dense_prices drops missing observations and bridges gaps") {
    const auto dates = make_dates(5);
    const std::vector<double> column{kNaN, 10.0, kNaN, 11.0, 12.0};

    const auto dense = garch::dense_prices(dates, column);
    REQUIRE(dense.size() == 3);
    REQUIRE(dense.dates[0] == dates[1]);
    REQUIRE(dense.dates[1] == dates[3]);

    const auto returns = garch::scaled_log_returns(dense);
    REQUIRE(returns.size() == 2);
    REQUIRE(returns.dates[0] == dates[3]);
    REQUIRE(returns.values[0] == Approx(100.0 * std::log(11.0 / 10.0)));
}

TEST_CASE("prepare_returns skips assets with fewer than 100 prices") {
    const auto dates = make_dates(150);
    auto column = make_prices(150);
    for (std::size_t i = 99; i < column.size(); ++i) {
        column[i] = kNaN;
    }

    const auto result = garch::prepare_returns(dates, column);
    REQUIRE(garch::is_skip(result));
    REQUIRE(std::get<garch::Skip>(result).reason == garch::SkipReason::InsufficientPrices);
}

TEST_CASE("prepare_returns skips assets whose returns fall below 100") {
    const auto dates = make_dates(100);
    const auto column = make_prices(100);

    const auto result = garch::prepare_returns(dates, column);
    REQUIRE(garch::is_skip(result));
    REQUIRE(std::get<garch::Skip>(result).reason == garch::SkipReason::InsufficientReturns);
}

TEST_CASE("prepare_returns accepts 101 prices") {
    const auto dates = make_dates(101);
    const auto column = make_prices(101);

    const auto result = garch::prepare_returns(dates, column);
    REQUIRE_FALSE(garch::is_skip(result));
    const auto& returns = std::get<garch::ReturnSeries>(result);
    REQUIRE(returns.size() == garch::kMinObservations);
    REQUIRE(returns.dates.front() == dates[1]);
    REQUIRE(returns.dates.back() == dates[100]);
}
