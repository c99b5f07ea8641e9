#include <garch/var.hpp>

#include <boost/math/distributions/students_t.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace garch {

double student_t_quantile(double probability, double nu) {
    if (!(probability > 0.0 && probability < 1.0)) {
        throw std::invalid_argument("quantile probability must be in (0,1)");
    }
    if (!(nu > 0.0) || !std::isfinite(nu)) {
        throw std::invalid_argument("degrees of freedom must be positive and finite");
    }
    const boost::math::students_t_distribution<double> dist(nu);
    return boost::math::quantile(dist, probability);
}

ConditionalSeries map_var(const ConditionalSeries& stdev,
                          double nu,
                          double level) {
    const double q = student_t_quantile(level, nu);

    ConditionalSeries var;
    var.first_defined = stdev.first_defined;
    var.values.assign(stdev.size(), std::numeric_limits<double>::quiet_NaN());
    for (std::size_t t = stdev.first_defined; t < stdev.size(); ++t) {
        var.values[t] = q * stdev.values[t];
    }
    return var;
}

} // namespace garch
