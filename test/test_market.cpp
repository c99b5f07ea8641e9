#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <garch/market.hpp>

#include <cmath>
#include <sstream>
#include <string>

using Catch::Approx;

TEST_CASE("parse_prices_csv coerces placeholders and bad values to missing") {
    std::istringstream input(
        "Date,AAA,BBB,CCC\n"
        "2024-01-02,100.0,-,missing\n"
        "2024-01-03,101.5,abc,\n"
        "2024-01-04,0,-3.0,-\n"
        "\n"
        "2024-01-05,102.0,55.0,-\n");

    garch::PriceTable table;
    REQUIRE(garch::parse_prices_csv(input, garch::LoadOptions{}, table));

    REQUIRE(table.rows() == 4);
    REQUIRE(table.asset_count() == 3);
    REQUIRE(table.assets[0] == "AAA");

    REQUIRE(table.columns[0][0] == Approx(100.0));
    REQUIRE(table.columns[0][1] == Approx(101.5));
    REQUIRE(std::isnan(table.columns[0][2]));
    REQUIRE(table.columns[0][3] == Approx(102.0));

    REQUIRE(std::isnan(table.columns[1][0]));
    REQUIRE(std::isnan(table.columns[1][1]));
    REQUIRE(std::isnan(table.columns[1][2]));
    REQUIRE(table.columns[1][3] == Approx(55.0));

    for (double v : table.columns[2]) {
        REQUIRE(std::isnan(v));
    }
}

TEST_CASE("drop_empty_columns removes assets without any price") {
    std::istringstream input(
        "Date,AAA,EMPTY,BBB\n"
        "2024-01-02,100.0,-,20.0\n"
        "2024-01-03,101.0,-,-\n");

    garch::PriceTable table;
    REQUIRE(garch::parse_prices_csv(input, garch::LoadOptions{}, table));
    REQUIRE(garch::drop_empty_columns(table) == 1);

    REQUIRE(table.asset_count() == 2);
    REQUIRE(table.assets[0] == "AAA");
    REQUIRE(table.assets[1] == "BBB");
    REQUIRE(table.columns.size() == 2);
    REQUIRE(table.columns[1][0] == Approx(20.0));
}

TEST_CASE("parse_prices_csv drops rows whose date cannot be parsed") {
    std::istringstream input(
        "when,AAA\n"
        "2024-01-02,100.0\n"
        "not a date,101.0\n"
        "04/01/2024,102.0\n");

    garch::PriceTable table;
    REQUIRE(garch::parse_prices_csv(input, garch::LoadOptions{}, table));
    REQUIRE(table.rows() == 2);
    REQUIRE(table.columns[0][1] == Approx(102.0));
}

TEST_CASE("parse_prices_csv honours custom missing tokens") {
    std::istringstream input(
        "Date,AAA\n"
        "2024-01-02,N/A\n"
        "2024-01-03,10.0\n");

    garch::LoadOptions options;
    options.missing_tokens = {"N/A"};

    garch::PriceTable table;
    REQUIRE(garch::parse_prices_csv(input, options, table));
    REQUIRE(std::isnan(table.columns[0][0]));
    REQUIRE(table.columns[0][1] == Approx(10.0));
}

TEST_CASE("parse_prices_csv rejects malformed tables") {
    garch::PriceTable table;

    std::istringstream no_assets("Date\n2024-01-02\n");
    REQUIRE_FALSE(garch::parse_prices_csv(no_assets, garch::LoadOptions{}, table));

    std::istringstream duplicate("Date,AAA,AAA\n2024-01-02,1,2\n");
    REQUIRE_FALSE(garch::parse_prices_csv(duplicate, garch::LoadOptions{}, table));

    std::istringstream ragged("Date,AAA,BBB\n2024-01-02,1\n");
    REQUIRE_FALSE(garch::parse_prices_csv(ragged, garch::LoadOptions{}, table));

    std::istringstream unordered("Date,AAA\n2024-01-03,1\n2024-01-02,2\n");
    REQUIRE_FALSE(garch::parse_prices_csv(unordered, garch::LoadOptions{}, table));
    REQUIRE(table.rows() == 0);

    std::istringstream empty("");
    REQUIRE_FALSE(garch::parse_prices_csv(empty, garch::LoadOptions{}, table));
}

TEST_CASE("load_prices_csv fails on a missing file") {
    garch::PriceTable table;
    REQUIRE_FALSE(garch::load_prices_csv("/nonexistent/prices.csv", garch::LoadOptions{}, table));
}
