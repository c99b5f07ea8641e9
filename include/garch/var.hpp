#pragma once

#include <garch/variance.hpp>

namespace garch {

// Tail probability of the daily 99% VaR.
inline constexpr double kDefaultVarLevel = 0.01;

double student_t_quantile(double probability, double nu);

// VaR[t] = q(level, nu) * stdev[t]; negative for left-tail levels.
ConditionalSeries map_var(const ConditionalSeries& stdev,
                          double nu,
                          double level = kDefaultVarLevel);

} // namespace garch
