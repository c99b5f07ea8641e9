#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <garch/model_parameters.hpp>
#include <garch/series.hpp>

namespace garch {

// Position of the seed variance in the return series.
inline constexpr std::size_t kSeedIndex = kMinObservations - 1;

// A path aligned 1:1 with a return series whose entries before first_defined
// carry no value. Defined entries may still be NaN or Inf when the recursion
// is numerically unstable.
struct ConditionalSeries {
    std::size_t first_defined = kSeedIndex;
    std::vector<double> values;

    [[nodiscard]] std::size_t size() const noexcept { return values.size(); }
    [[nodiscard]] bool defined(std::size_t t) const noexcept {
        return t >= first_defined && t < values.size();
    }
    [[nodiscard]] std::optional<double> at(std::size_t t) const;
};

ConditionalSeries reconstruct_variance(std::span<const double> returns,
                                       const ModelParameters& params);

ConditionalSeries conditional_stdev(const ConditionalSeries& variance);

} // namespace garch
