#include <garch/utils.hpp>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace garch {

std::string trim(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return std::string{};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return std::string(input.substr(begin, end - begin + 1));
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(line);
    while (std::getline(stream, field, ',')) {
        fields.emplace_back(trim(field));
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

bool parse_double(const std::string& token, double& value) {
    if (token.empty()) {
        return false;
    }
    try {
        size_t idx = 0;
        value = std::stod(token, &idx);
        if (idx != token.size() || !std::isfinite(value)) {
            return false;
        }
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

double mean(std::span<const double> values) {
    if (values.empty()) {
        throw std::invalid_argument("mean requires non-empty data");
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

double population_variance(std::span<const double> values) {
    const double mu = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        const double d = v - mu;
        sum_sq += d * d;
    }
    return sum_sq / static_cast<double>(values.size());
}

} // namespace garch
