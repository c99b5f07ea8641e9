#include <catch2/catch_test_macros.hpp>

#include <garch/report.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace {

garch::Date day(unsigned d) {
    return std::chrono::sys_days{std::chrono::year{2024} / 1 / d};
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

garch::BatchResultTables small_results() {
    const std::vector<garch::Date> index{day(2), day(3), day(4)};

    garch::BatchResultTables results;
    results.prices = garch::DateTable(index);
    results.returns = garch::DateTable(index);
    results.stdevs = garch::DateTable(index);
    results.var = garch::DateTable(index);

    results.prices.add_column("AAA", {100.0, 101.0, std::nullopt});
    results.returns.add_column("AAA", {std::nullopt, 0.995, std::nullopt});
    results.stdevs.add_column("AAA", {std::nullopt, 1.5, std::numeric_limits<double>::infinity()});
    results.var.add_column("AAA", {std::nullopt, -3.75, std::nullopt});
    results.parameters.push_back({"AAA", garch::ModelParameters{0.25, 0.125, 0.75, 6.5}});
    results.skipped.push_back({"BBB", garch::SkipReason::InsufficientPrices, "42 valid prices, need 100"});
    return results;
}

} // namespace

TEST_CASE("render_date_table writes day-month-year dates and empty missing cells") {
    const auto results = small_results();
    const std::string csv = garch::render_date_table(results.prices, false);
    REQUIRE(csv ==
            "Date,AAA\n"
            "02-Jan-24,100\n"
            "03-Jan-24,101\n"
            "04-Jan-24,\n");
}

TEST_CASE("render_date_table marks the seed row") {
    const auto results = small_results();
    const std::string csv = garch::render_date_table(results.stdevs, true);
    REQUIRE(csv ==
            "Seed,Date,AAA\n"
            ",02-Jan-24,\n"
            "*,03-Jan-24,1.5\n"
            ",04-Jan-24,inf\n");
}

TEST_CASE("render_date_table marks each column's seed row") {
    garch::DateTable table({day(2), day(3), day(4), day(5)});
    table.add_column("EARLY", {std::nullopt, 1.25, 1.5, 1.75});
    table.add_column("LATE", {std::nullopt, std::nullopt, std::nullopt, 2.0});

    REQUIRE(table.first_populated_row(0) == std::optional<std::size_t>(1));
    REQUIRE(table.first_populated_row(1) == std::optional<std::size_t>(3));
    REQUIRE(table.first_populated_row() == std::optional<std::size_t>(1));

    REQUIRE(garch::render_date_table(table, true) ==
            "Seed,Date,EARLY,LATE\n"
            ",02-Jan-24,,\n"
            "*,03-Jan-24,1.25,\n"
            ",04-Jan-24,1.5,\n"
            "*,05-Jan-24,1.75,2\n");
}

TEST_CASE("render_parameters lists persistence next to the fitted values") {
    const auto results = small_results();
    REQUIRE(garch::render_parameters(results.parameters) ==
            "Asset,Omega,Alpha,Beta,Persistence,Nu (DF)\n"
            "AAA,0.25,0.125,0.75,0.875,6.5\n");
}

TEST_CASE("render_skipped quotes fields containing commas") {
    const auto results = small_results();
    REQUIRE(garch::render_skipped(results.skipped) ==
            "Asset,Reason,Detail\n"
            "BBB,insufficient prices,\"42 valid prices, need 100\"\n");
}

TEST_CASE("format_number spells out non-finite values") {
    REQUIRE(garch::format_number(std::numeric_limits<double>::quiet_NaN()) == "nan");
    REQUIRE(garch::format_number(-std::numeric_limits<double>::infinity()) == "-inf");
    REQUIRE(garch::format_number(0.1) == "0.1");
}

TEST_CASE("write_report creates the five named tables") {
    const auto dir = std::filesystem::temp_directory_path() / "garch_var_report_test";
    std::filesystem::remove_all(dir);

    const auto results = small_results();
    garch::ReportOptions options;
    options.output_dir = dir.string();
    REQUIRE(garch::write_report(results, options));

    for (const char* name : {garch::kPricesTable, garch::kReturnsTable, garch::kStdevTable,
                             garch::kVarTable, garch::kParametersTable}) {
        REQUIRE(std::filesystem::exists(dir / (std::string(name) + ".csv")));
    }
    REQUIRE_FALSE(std::filesystem::exists(dir / (std::string(garch::kSkippedTable) + ".csv")));
    REQUIRE(read_file(dir / "GARCH_VaR.csv") ==
            "Seed,Date,AAA\n"
            ",02-Jan-24,\n"
            "*,03-Jan-24,-3.75\n"
            ",04-Jan-24,\n");

    options.skip_report = true;
    REQUIRE(garch::write_report(results, options));
    REQUIRE(std::filesystem::exists(dir / "Skipped_Assets.csv"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("write_report requires an output directory") {
    REQUIRE_FALSE(garch::write_report(small_results(), garch::ReportOptions{}));
}
