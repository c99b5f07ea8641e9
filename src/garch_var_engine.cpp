#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <vector>

#include <garch/batch.hpp>
#include <garch/fitter.hpp>
#include <garch/market.hpp>
#include <garch/report.hpp>
#include <garch/var.hpp>

int main(int argc, char** argv) {
    CLI::App app{"garch_var_engine"};

    std::string input_path;
    garch::LoadOptions load_options;
    garch::FitterConfig fitter_config;
    garch::BatchOptions batch_options;
    garch::ReportOptions report_options;
    std::string log_level = "info";

    app.set_config("--config", "", "INI/TOML file with option values");
    app.add_option("-i,--input", input_path, "Prices CSV path (first column dates, one column per asset)")
        ->required();
    app.add_option("-o,--output", report_options.output_dir, "Directory receiving the report tables")->required();
    app.add_option("--missing-token", load_options.missing_tokens, "Placeholder tokens read as missing prices");
    app.add_option("--var-level", batch_options.var_level, "Tail probability of the VaR quantile")
        ->default_val(batch_options.var_level)
        ->check(CLI::Range(0.0, 1.0));
    app.add_option("--max-iterations", fitter_config.max_iterations, "Optimizer iteration budget per asset")
        ->default_val(fitter_config.max_iterations)
        ->check(CLI::PositiveNumber);
    app.add_option("--tolerance", fitter_config.tolerance, "Optimizer convergence tolerance")
        ->default_val(fitter_config.tolerance)
        ->check(CLI::PositiveNumber);
    app.add_option("--initial-nu", fitter_config.initial_nu, "Starting Student-t degrees of freedom")
        ->default_val(fitter_config.initial_nu);
    app.add_flag("--skip-report", report_options.skip_report, "Also write Skipped_Assets.csv with skip reasons");
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error, critical or off")
        ->default_val(log_level);

    try {
        CLI11_PARSE(app, argc, argv);

        spdlog::set_level(spdlog::level::from_str(log_level));

        garch::PriceTable table;
        if (!garch::load_prices_csv(input_path, load_options, table)) {
            return 1;
        }
        const std::size_t dropped = garch::drop_empty_columns(table);
        if (table.asset_count() == 0U) {
            spdlog::error("Prices CSV has no asset with valid prices");
            return 1;
        }

        spdlog::info("Loaded prices from '{}' with {} rows and {} assets ({} empty columns dropped).",
                     input_path,
                     table.rows(),
                     table.asset_count(),
                     dropped);

        const garch::MaximumLikelihoodFitter fitter(fitter_config);
        const auto progress = [](std::size_t completed, std::size_t total) {
            spdlog::info("Progress: {}/{} assets", completed, total);
        };

        const garch::BatchResultTables results = garch::run_batch(table, fitter, batch_options, progress);

        if (!garch::write_report(results, report_options)) {
            return 1;
        }

        spdlog::info("==================== Model Parameters ====================");
        for (const auto& row : results.parameters) {
            spdlog::info("{:>12} | omega={:.6f} alpha={:.6f} beta={:.6f} persistence={:.6f} nu={:.4f}",
                         row.asset,
                         row.params.omega,
                         row.params.alpha,
                         row.params.beta,
                         row.params.persistence(),
                         row.params.nu);
        }
    } catch (const CLI::ParseError& parse_error) {
        return app.exit(parse_error);
    } catch (const std::exception& ex) {
        spdlog::error("Failed to compute GARCH VaR report: {}", ex.what());
        return 1;
    }

    return 0;
}
