#include <garch/stage.hpp>

namespace garch {

std::string_view to_string(SkipReason reason) noexcept {
    switch (reason) {
    case SkipReason::InsufficientPrices:
        return "insufficient prices";
    case SkipReason::InsufficientReturns:
        return "insufficient returns";
    case SkipReason::FitFailed:
        return "fit failed";
    }
    return "unknown";
}

} // namespace garch
