#include <garch/batch.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

namespace garch {

namespace {

std::vector<Cell> to_cells(const std::vector<double>& column) {
    std::vector<Cell> cells(column.size());
    for (std::size_t row = 0; row < column.size(); ++row) {
        if (!std::isnan(column[row])) {
            cells[row] = column[row];
        }
    }
    return cells;
}

StageResult<ModelParameters> fit_isolated(const ModelFitter& fitter, const ReturnSeries& returns) {
    StageResult<ModelParameters> fitted = Skip{};
    try {
        fitted = fitter.fit(returns);
    } catch (const std::exception& ex) {
        return Skip{SkipReason::FitFailed, ex.what()};
    }
    if (is_skip(fitted)) {
        return fitted;
    }
    if (!is_usable(std::get<ModelParameters>(fitted))) {
        return Skip{SkipReason::FitFailed, "fitter returned non-finite parameters or non-positive nu"};
    }
    return fitted;
}

} // namespace

BatchAccumulator::BatchAccumulator(const std::vector<Date>& index) {
    tables_.prices = DateTable(index);
    tables_.returns = DateTable(index);
    tables_.stdevs = DateTable(index);
    tables_.var = DateTable(index);
}

void BatchAccumulator::commit(AssetResult result) {
    // Every table is checked before any is touched so a bad result leaves the
    // accumulator unchanged.
    if (tables_.prices.find(result.asset)) {
        throw std::invalid_argument(fmt::format("asset '{}' committed twice", result.asset));
    }
    if (result.prices.size() != tables_.prices.rows()) {
        throw std::invalid_argument(fmt::format("price column for '{}' does not span the index", result.asset));
    }
    if (result.stdev.size() != result.returns.size() || result.var.size() != result.returns.size()) {
        throw std::invalid_argument(fmt::format("paths for '{}' are not aligned with its returns", result.asset));
    }
    for (const Date date : result.returns.dates) {
        if (!tables_.returns.row_of(date)) {
            throw std::out_of_range(fmt::format("returns for '{}' fall outside the date index", result.asset));
        }
    }

    tables_.prices.add_column(result.asset, std::move(result.prices));
    tables_.returns.add_column(result.asset, result.returns.dates, result.returns.values);
    tables_.stdevs.add_column(result.asset, result.returns.dates, result.stdev.values, result.stdev.first_defined);
    tables_.var.add_column(result.asset, result.returns.dates, result.var.values, result.var.first_defined);
    tables_.parameters.push_back(ParameterRow{std::move(result.asset), result.params});
}

void BatchAccumulator::skip(std::string asset, Skip reason) {
    tables_.skipped.push_back(SkippedAsset{std::move(asset), reason.reason, std::move(reason.detail)});
}

BatchResultTables BatchAccumulator::finish() && {
    return std::move(tables_);
}

StageResult<AssetResult> process_asset(const PriceTable& table,
                                       std::size_t column,
                                       const ModelFitter& fitter,
                                       const BatchOptions& options) {
    if (column >= table.asset_count()) {
        throw std::out_of_range("asset column index out of range");
    }
    const auto& prices = table.columns[column];

    StageResult<ReturnSeries> prepared = prepare_returns(table.dates, prices);
    if (is_skip(prepared)) {
        return std::get<Skip>(std::move(prepared));
    }
    ReturnSeries returns = std::get<ReturnSeries>(std::move(prepared));

    StageResult<ModelParameters> fitted = fit_isolated(fitter, returns);
    if (is_skip(fitted)) {
        return std::get<Skip>(std::move(fitted));
    }
    const ModelParameters params = std::get<ModelParameters>(fitted);

    const ConditionalSeries variance = reconstruct_variance(returns.values, params);

    AssetResult result;
    result.stdev = conditional_stdev(variance);
    try {
        result.var = map_var(result.stdev, params.nu, options.var_level);
    } catch (const std::exception& ex) {
        // Boost overflows on the quantile for tiny nu.
        return Skip{SkipReason::FitFailed, fmt::format("VaR quantile failed: {}", ex.what())};
    }
    result.asset = table.assets[column];
    result.prices = to_cells(prices);
    result.params = params;
    result.returns = std::move(returns);
    return result;
}

BatchResultTables run_batch(const PriceTable& table,
                            const ModelFitter& fitter,
                            const BatchOptions& options,
                            const ProgressCallback& progress) {
    if (!(options.var_level > 0.0 && options.var_level < 1.0)) {
        throw std::invalid_argument("var_level must be in (0,1)");
    }
    if (table.columns.size() != table.assets.size()) {
        throw std::invalid_argument("price table has mismatched asset names and columns");
    }

    BatchAccumulator accumulator(table.dates);
    const std::size_t total = table.asset_count();

    for (std::size_t i = 0; i < total; ++i) {
        const std::string& asset = table.assets[i];
        StageResult<AssetResult> outcome = process_asset(table, i, fitter, options);

        if (is_skip(outcome)) {
            Skip skip = std::get<Skip>(std::move(outcome));
            spdlog::debug("Skipping asset '{}': {} ({})", asset, to_string(skip.reason), skip.detail);
            accumulator.skip(asset, std::move(skip));
        } else {
            AssetResult result = std::get<AssetResult>(std::move(outcome));
            const ModelParameters& p = result.params;
            spdlog::debug("Asset '{}': omega={:.6f} alpha={:.6f} beta={:.6f} nu={:.4f}",
                          asset, p.omega, p.alpha, p.beta, p.nu);
            if (p.persistence() >= 1.0) {
                spdlog::warn("Asset '{}' has non-stationary fit (alpha+beta={:.6f})", asset, p.persistence());
            }
            accumulator.commit(std::move(result));
        }

        if (progress) {
            progress(i + 1, total);
        }
    }

    const std::size_t processed = accumulator.committed();
    spdlog::info("Processed {} of {} assets ({} skipped)", processed, total, total - processed);
    return std::move(accumulator).finish();
}

} // namespace garch
