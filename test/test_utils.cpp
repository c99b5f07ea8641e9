#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <garch/utils.hpp>

#include <stdexcept>
#include <vector>

using Catch::Approx;

TEST_CASE("split_csv_line trims fields and keeps trailing empty field") {
    const auto fields = garch::split_csv_line(" 2024-01-02 , 101.5,-, ");
    REQUIRE(fields.size() == 4);
    REQUIRE(fields[0] == "2024-01-02");
    REQUIRE(fields[1] == "101.5");
    REQUIRE(fields[2] == "-");
    REQUIRE(fields[3].empty());

    const auto trailing = garch::split_csv_line("a,b,");
    REQUIRE(trailing.size() == 3);
    REQUIRE(trailing[2].empty());
}

TEST_CASE("parse_double rejects partial, empty and non-finite tokens") {
    double value = 0.0;
    REQUIRE(garch::parse_double("42.25", value));
    REQUIRE(value == Approx(42.25));

    REQUIRE_FALSE(garch::parse_double("", value));
    REQUIRE_FALSE(garch::parse_double("12abc", value));
    REQUIRE_FALSE(garch::parse_double("missing", value));
    REQUIRE_FALSE(garch::parse_double("nan", value));
    REQUIRE_FALSE(garch::parse_double("inf", value));
}

TEST_CASE("population_variance divides by the sample size") {
    const std::vector<double> data{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    REQUIRE(garch::mean(data) == Approx(5.0));
    REQUIRE(garch::population_variance(data) == Approx(4.0));

    const std::vector<double> single{3.5};
    REQUIRE(garch::population_variance(single) == 0.0);

    const std::vector<double> empty;
    REQUIRE_THROWS_AS(garch::population_variance(empty), std::invalid_argument);
}
