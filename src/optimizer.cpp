#include <garch/optimizer.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace garch {

namespace {

constexpr double kReflect = 1.0;
constexpr double kExpand = 2.0;
constexpr double kContract = 0.5;
constexpr double kShrink = 0.5;
constexpr double kTiny = 1e-10;

double evaluate(const Objective& objective, const Eigen::VectorXd& x) {
    const double value = objective(x);
    return std::isfinite(value) ? value : std::numeric_limits<double>::infinity();
}

bool has_converged(double best, double worst, double tolerance) {
    if (!std::isfinite(worst)) {
        return false;
    }
    return 2.0 * std::abs(worst - best) <= tolerance * (std::abs(best) + std::abs(worst) + kTiny);
}

} // namespace

OptimizerResult nelder_mead_minimize(const Objective& objective,
                                     const Eigen::VectorXd& start,
                                     const Eigen::VectorXd& step,
                                     const OptimizerOptions& options) {
    const Eigen::Index n = start.size();
    if (n == 0) {
        throw std::invalid_argument("nelder_mead_minimize requires a non-empty start point");
    }
    if (step.size() != n) {
        throw std::invalid_argument("step size dimension mismatch");
    }
    if (options.max_iterations <= 0) {
        throw std::invalid_argument("max_iterations must be positive");
    }
    if (!(options.tolerance > 0.0)) {
        throw std::invalid_argument("tolerance must be positive");
    }

    const std::size_t vertex_count = static_cast<std::size_t>(n) + 1;
    std::vector<Eigen::VectorXd> simplex(vertex_count, start);
    std::vector<double> values(vertex_count, 0.0);
    for (Eigen::Index i = 0; i < n; ++i) {
        simplex[static_cast<std::size_t>(i) + 1](i) += step(i);
    }
    for (std::size_t v = 0; v < vertex_count; ++v) {
        values[v] = evaluate(objective, simplex[v]);
    }

    std::vector<std::size_t> order(vertex_count);
    OptimizerResult result;

    for (int iter = 0; iter < options.max_iterations; ++iter) {
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            return values[a] < values[b];
        });

        const std::size_t best = order.front();
        const std::size_t worst = order.back();
        const std::size_t second_worst = order[vertex_count - 2];
        result.iterations = iter;

        if (has_converged(values[best], values[worst], options.tolerance)) {
            result.converged = true;
            break;
        }

        Eigen::VectorXd centroid = Eigen::VectorXd::Zero(n);
        for (std::size_t v = 0; v + 1 < vertex_count; ++v) {
            centroid += simplex[order[v]];
        }
        centroid /= static_cast<double>(n);

        const Eigen::VectorXd reflected = centroid + kReflect * (centroid - simplex[worst]);
        const double f_reflected = evaluate(objective, reflected);

        if (f_reflected < values[best]) {
            const Eigen::VectorXd expanded = centroid + kExpand * (reflected - centroid);
            const double f_expanded = evaluate(objective, expanded);
            if (f_expanded < f_reflected) {
                simplex[worst] = expanded;
                values[worst] = f_expanded;
            } else {
                simplex[worst] = reflected;
                values[worst] = f_reflected;
            }
            continue;
        }

        if (f_reflected < values[second_worst]) {
            simplex[worst] = reflected;
            values[worst] = f_reflected;
            continue;
        }

        const bool outside = f_reflected < values[worst];
        const Eigen::VectorXd contracted = outside
                                               ? Eigen::VectorXd(centroid + kContract * (reflected - centroid))
                                               : Eigen::VectorXd(centroid + kContract * (simplex[worst] - centroid));
        const double f_contracted = evaluate(objective, contracted);
        if (f_contracted < (outside ? f_reflected : values[worst])) {
            simplex[worst] = contracted;
            values[worst] = f_contracted;
            continue;
        }

        for (std::size_t v = 0; v < vertex_count; ++v) {
            if (v == best) {
                continue;
            }
            simplex[v] = simplex[best] + kShrink * (simplex[v] - simplex[best]);
            values[v] = evaluate(objective, simplex[v]);
        }
    }

    if (!result.converged) {
        result.iterations = options.max_iterations;
    }

    const auto best_it = std::min_element(values.begin(), values.end());
    const std::size_t best = static_cast<std::size_t>(std::distance(values.begin(), best_it));
    result.x = simplex[best];
    result.value = values[best];
    return result;
}

} // namespace garch
