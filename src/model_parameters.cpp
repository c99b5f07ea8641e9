#include <garch/model_parameters.hpp>

#include <cmath>

namespace garch {

bool is_usable(const ModelParameters& params) noexcept {
    return std::isfinite(params.omega) && std::isfinite(params.alpha) &&
           std::isfinite(params.beta) && std::isfinite(params.nu) && params.nu > 0.0;
}

} // namespace garch
