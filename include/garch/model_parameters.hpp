#pragma once

namespace garch {

struct ModelParameters {
    double omega = 0.0;
    double alpha = 0.0;
    double beta = 0.0;
    double nu = 0.0; // Student-t degrees of freedom

    [[nodiscard]] double persistence() const noexcept { return alpha + beta; }
};

bool is_usable(const ModelParameters& params) noexcept;

} // namespace garch
