#pragma once

#include <Eigen/Dense>

#include <functional>

namespace garch {

struct OptimizerOptions {
    int max_iterations = 4000;
    double tolerance = 1e-8;
};

struct OptimizerResult {
    Eigen::VectorXd x;
    double value = 0.0;
    int iterations = 0;
    bool converged = false;
};

using Objective = std::function<double(const Eigen::VectorXd&)>;

// Derivative-free simplex minimiser. The initial simplex is start plus one
// vertex per coordinate offset by step[i]. Non-finite objective values are
// treated as +inf.
OptimizerResult nelder_mead_minimize(const Objective& objective,
                                     const Eigen::VectorXd& start,
                                     const Eigen::VectorXd& step,
                                     const OptimizerOptions& options);

} // namespace garch
