#include <garch/fitter.hpp>

#include <garch/optimizer.hpp>
#include <garch/utils.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

namespace garch {

namespace {

constexpr double kBackcastDecay = 0.94;
constexpr std::size_t kBackcastWindow = 75;
constexpr double kStartPersistence = 0.97;
constexpr double kStartBetaShare = 0.90;
constexpr double kMinNu = 2.0;
constexpr double kVarianceFloor = 1e-8;

double logistic(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

double logit(double p) {
    return std::log(p / (1.0 - p));
}

// theta = [mu, ln omega, logit(alpha + beta), logit(beta / (alpha + beta)), ln(nu - 2)]
struct Theta {
    double mu = 0.0;
    ModelParameters params;
};

Theta decode(const Eigen::VectorXd& theta) {
    const double persistence = logistic(theta(2));
    const double beta_share = logistic(theta(3));

    Theta decoded;
    decoded.mu = theta(0);
    decoded.params.omega = std::exp(theta(1));
    decoded.params.alpha = persistence * (1.0 - beta_share);
    decoded.params.beta = persistence * beta_share;
    decoded.params.nu = kMinNu + std::exp(theta(4));
    return decoded;
}

} // namespace

double variance_backcast(std::span<const double> returns, double mu) {
    if (returns.empty()) {
        throw std::invalid_argument("variance_backcast requires non-empty data");
    }
    const std::size_t window = std::min(kBackcastWindow, returns.size());
    double weight = 1.0;
    double weight_sum = 0.0;
    double backcast = 0.0;
    for (std::size_t t = 0; t < window; ++t) {
        const double e = returns[t] - mu;
        backcast += weight * e * e;
        weight_sum += weight;
        weight *= kBackcastDecay;
    }
    return backcast / weight_sum;
}

double garch_t_negative_loglik(std::span<const double> returns,
                               double mu,
                               const ModelParameters& params) {
    constexpr double kInf = std::numeric_limits<double>::infinity();
    const double nu = params.nu;
    if (returns.empty() || !(params.omega > 0.0) || params.alpha < 0.0 || params.beta < 0.0 ||
        !(nu > kMinNu) || !std::isfinite(mu)) {
        return kInf;
    }

    const double log_norm = std::lgamma(0.5 * (nu + 1.0)) - std::lgamma(0.5 * nu) -
                            0.5 * std::log(std::numbers::pi * (nu - 2.0));
    const double backcast = variance_backcast(returns, mu);

    double h = params.omega + (params.alpha + params.beta) * backcast;
    double prev_e = 0.0;
    double nll = 0.0;
    for (std::size_t t = 0; t < returns.size(); ++t) {
        if (t > 0) {
            h = params.omega + params.alpha * prev_e * prev_e + params.beta * h;
        }
        if (!(h > 0.0) || !std::isfinite(h)) {
            return kInf;
        }
        const double e = returns[t] - mu;
        nll -= log_norm - 0.5 * std::log(h) -
               0.5 * (nu + 1.0) * std::log1p(e * e / (h * (nu - 2.0)));
        prev_e = e;
    }
    return std::isfinite(nll) ? nll : kInf;
}

MaximumLikelihoodFitter::MaximumLikelihoodFitter(FitterConfig config)
    : config_(config) {
    if (config_.max_iterations <= 0) {
        throw std::invalid_argument("fitter max_iterations must be positive");
    }
    if (!(config_.tolerance > 0.0)) {
        throw std::invalid_argument("fitter tolerance must be positive");
    }
    if (!(config_.initial_nu > kMinNu)) {
        throw std::invalid_argument("fitter initial_nu must exceed 2");
    }
}

StageResult<ModelParameters> MaximumLikelihoodFitter::fit(const ReturnSeries& returns) const {
    if (returns.size() < kMinObservations) {
        return Skip{SkipReason::FitFailed,
                    fmt::format("{} returns, fitter needs {}", returns.size(), kMinObservations)};
    }

    const std::span<const double> r(returns.values);
    const double mu0 = mean(r);
    const double var0 = std::max(population_variance(r), kVarianceFloor);
    const double sd0 = std::sqrt(var0);

    Eigen::VectorXd start(5);
    start << mu0,
        std::log(var0 * (1.0 - kStartPersistence)),
        logit(kStartPersistence),
        logit(kStartBetaShare),
        std::log(config_.initial_nu - kMinNu);

    Eigen::VectorXd step(5);
    step << 0.1 * sd0, 0.5, 0.5, 0.5, 0.3;

    const Objective objective = [&](const Eigen::VectorXd& theta) {
        const Theta decoded = decode(theta);
        return garch_t_negative_loglik(r, decoded.mu, decoded.params);
    };

    const OptimizerOptions options{config_.max_iterations, config_.tolerance};
    const OptimizerResult first = nelder_mead_minimize(objective, start, step, options);
    const OptimizerResult refined = nelder_mead_minimize(objective, first.x, step, options);

    if (!refined.converged) {
        return Skip{SkipReason::FitFailed,
                    fmt::format("optimizer did not converge within {} iterations", config_.max_iterations)};
    }
    if (!std::isfinite(refined.value)) {
        return Skip{SkipReason::FitFailed, "log-likelihood is not finite at the optimum"};
    }

    const Theta best = decode(refined.x);
    spdlog::debug("GARCH-t fit: mu={:.6f} omega={:.6f} alpha={:.6f} beta={:.6f} nu={:.4f} nll={:.4f} ({}+{} iterations)",
                  best.mu,
                  best.params.omega,
                  best.params.alpha,
                  best.params.beta,
                  best.params.nu,
                  refined.value,
                  first.iterations,
                  refined.iterations);
    return best.params;
}

} // namespace garch
