#pragma once

#include <span>

#include <garch/model_parameters.hpp>
#include <garch/series.hpp>
#include <garch/stage.hpp>

namespace garch {

// Estimates GARCH(1,1)-t parameters for one return series. Implementations
// report failure by returning a Skip or by throwing a std::exception-derived
// type; the batch treats both as a failed fit. Anything else thrown is a
// programming error and propagates out of run_batch.
class ModelFitter {
public:
    virtual ~ModelFitter() = default;

    virtual StageResult<ModelParameters> fit(const ReturnSeries& returns) const = 0;
};

struct FitterConfig {
    int max_iterations = 4000;
    double tolerance = 1e-8;
    double initial_nu = 8.0;
};

class MaximumLikelihoodFitter final : public ModelFitter {
public:
    explicit MaximumLikelihoodFitter(FitterConfig config = {});

    StageResult<ModelParameters> fit(const ReturnSeries& returns) const override;

    [[nodiscard]] const FitterConfig& config() const noexcept { return config_; }

private:
    FitterConfig config_;
};

// Exponentially smoothed pre-sample variance of the demeaned returns.
double variance_backcast(std::span<const double> returns, double mu);

// Negative log-likelihood of r[t] = mu + sqrt(h[t]) z[t] with standardised
// Student-t z and h[t] = omega + alpha e[t-1]^2 + beta h[t-1]. Returns +inf
// when the parameters leave the admissible region.
double garch_t_negative_loglik(std::span<const double> returns,
                               double mu,
                               const ModelParameters& params);

} // namespace garch
