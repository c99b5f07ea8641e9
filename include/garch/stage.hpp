#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace garch {

enum class SkipReason { InsufficientPrices, InsufficientReturns, FitFailed };

std::string_view to_string(SkipReason reason) noexcept;

struct Skip {
    SkipReason reason = SkipReason::FitFailed;
    std::string detail;
};

// Outcome of one per-asset pipeline stage: either the payload or the reason
// the asset leaves the batch.
template <typename T>
using StageResult = std::variant<T, Skip>;

template <typename T>
[[nodiscard]] bool is_skip(const StageResult<T>& result) noexcept {
    return std::holds_alternative<Skip>(result);
}

} // namespace garch
