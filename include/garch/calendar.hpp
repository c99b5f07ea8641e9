#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace garch {

using Date = std::chrono::sys_days;

// Accepts YYYY-MM-DD, YYYY/MM/DD, DD-MM-YYYY, DD/MM/YYYY, DD.MM.YYYY and
// DD-Mon-YY(YY); a trailing time of day ("2024-01-05 00:00:00") is ignored.
std::optional<Date> parse_date(std::string_view text);

// dd-Mon-yy, e.g. 05-Jan-24.
std::string format_date(Date date);

} // namespace garch
