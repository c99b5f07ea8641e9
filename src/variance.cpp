#include <garch/variance.hpp>

#include <garch/utils.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace garch {

std::optional<double> ConditionalSeries::at(std::size_t t) const {
    if (t >= values.size()) {
        throw std::out_of_range("conditional series index out of range");
    }
    if (!defined(t)) {
        return std::nullopt;
    }
    return values[t];
}

ConditionalSeries reconstruct_variance(std::span<const double> returns,
                                       const ModelParameters& params) {
    const std::size_t T = returns.size();
    if (T < kMinObservations) {
        throw std::invalid_argument("reconstruct_variance requires at least 100 returns");
    }

    ConditionalSeries path;
    path.first_defined = kSeedIndex;
    path.values.assign(T, std::numeric_limits<double>::quiet_NaN());

    path.values[kSeedIndex] = population_variance(returns.first(kMinObservations));

    // Unclamped; unstable parameter sets surface as NaN/Inf.
    for (std::size_t t = kSeedIndex + 1; t < T; ++t) {
        const double r = returns[t - 1];
        path.values[t] = params.omega + params.alpha * r * r + params.beta * path.values[t - 1];
    }
    return path;
}

ConditionalSeries conditional_stdev(const ConditionalSeries& variance) {
    ConditionalSeries stdev;
    stdev.first_defined = variance.first_defined;
    stdev.values.assign(variance.size(), std::numeric_limits<double>::quiet_NaN());
    for (std::size_t t = variance.first_defined; t < variance.size(); ++t) {
        stdev.values[t] = std::sqrt(variance.values[t]);
    }
    return stdev;
}

} // namespace garch
