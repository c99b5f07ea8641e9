#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <garch/date_table.hpp>
#include <garch/fitter.hpp>
#include <garch/market.hpp>
#include <garch/model_parameters.hpp>
#include <garch/series.hpp>
#include <garch/stage.hpp>
#include <garch/var.hpp>
#include <garch/variance.hpp>

namespace garch {

struct ParameterRow {
    std::string asset;
    ModelParameters params;
};

struct SkippedAsset {
    std::string asset;
    SkipReason reason = SkipReason::FitFailed;
    std::string detail;
};

struct BatchResultTables {
    DateTable prices;
    DateTable returns;
    DateTable stdevs;
    DateTable var;
    std::vector<ParameterRow> parameters;
    std::vector<SkippedAsset> skipped;
};

// Everything one asset contributes to the batch, produced only once every
// stage has succeeded.
struct AssetResult {
    std::string asset;
    std::vector<Cell> prices;
    ReturnSeries returns;
    ModelParameters params;
    ConditionalSeries stdev;
    ConditionalSeries var;
};

class BatchAccumulator {
public:
    explicit BatchAccumulator(const std::vector<Date>& index);

    BatchAccumulator(const BatchAccumulator&) = delete;
    BatchAccumulator& operator=(const BatchAccumulator&) = delete;
    BatchAccumulator(BatchAccumulator&&) noexcept = default;
    BatchAccumulator& operator=(BatchAccumulator&&) noexcept = default;

    void commit(AssetResult result);
    void skip(std::string asset, Skip reason);

    [[nodiscard]] std::size_t committed() const noexcept { return tables_.parameters.size(); }

    BatchResultTables finish() &&;

private:
    BatchResultTables tables_;
};

struct BatchOptions {
    double var_level = kDefaultVarLevel;
};

using ProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;

StageResult<AssetResult> process_asset(const PriceTable& table,
                                       std::size_t column,
                                       const ModelFitter& fitter,
                                       const BatchOptions& options);

BatchResultTables run_batch(const PriceTable& table,
                            const ModelFitter& fitter,
                            const BatchOptions& options = {},
                            const ProgressCallback& progress = {});

} // namespace garch
