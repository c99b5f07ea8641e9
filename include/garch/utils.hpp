#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace garch {

std::string trim(std::string_view input);

std::vector<std::string> split_csv_line(const std::string& line);

bool parse_double(const std::string& token, double& value);

double mean(std::span<const double> values);

// Divisor is the sample size, not n - 1.
double population_variance(std::span<const double> values);

} // namespace garch
