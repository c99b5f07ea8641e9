#include <garch/market.hpp>

#include <garch/utils.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

namespace garch {

namespace {

constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

bool is_missing_token(const std::string& token, const LoadOptions& options) {
    if (token.empty()) {
        return true;
    }
    return std::find(options.missing_tokens.begin(), options.missing_tokens.end(), token) !=
           options.missing_tokens.end();
}

double coerce_price(const std::string& token, const LoadOptions& options) {
    if (is_missing_token(token, options)) {
        return kMissing;
    }
    double value = 0.0;
    if (!parse_double(token, value) || value <= 0.0) {
        return kMissing;
    }
    return value;
}

bool is_missing(double value) {
    return std::isnan(value);
}

} // namespace

std::size_t PriceTable::rows() const noexcept {
    return dates.size();
}

std::size_t PriceTable::asset_count() const noexcept {
    return assets.size();
}

bool parse_prices_csv(std::istream& input,
                      const LoadOptions& options,
                      PriceTable& table) {
    table = PriceTable{};

    std::string line;
    if (!std::getline(input, line)) {
        spdlog::error("Prices CSV missing header row");
        return false;
    }

    const auto header = split_csv_line(line);
    if (header.size() < 2) {
        spdlog::error("Prices header needs a date column and at least one asset");
        return false;
    }

    for (std::size_t i = 1; i < header.size(); ++i) {
        if (header[i].empty()) {
            spdlog::error("Empty asset name at header column {}", i);
            table = PriceTable{};
            return false;
        }
        if (std::find(table.assets.begin(), table.assets.end(), header[i]) != table.assets.end()) {
            spdlog::error("Duplicate asset name '{}' at header column {}", header[i], i);
            table = PriceTable{};
            return false;
        }
        table.assets.push_back(header[i]);
    }

    const std::size_t N = table.assets.size();
    table.columns.assign(N, {});

    std::size_t row_index = 1;
    std::size_t dropped_rows = 0;
    while (std::getline(input, line)) {
        ++row_index;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }
        const auto fields = split_csv_line(line);
        if (fields.size() != N + 1) {
            spdlog::error("Unexpected field count in prices row {}", row_index);
            table = PriceTable{};
            return false;
        }

        const auto date = parse_date(fields.front());
        if (!date) {
            spdlog::warn("Dropping prices row {}: unparseable date '{}'", row_index, fields.front());
            ++dropped_rows;
            continue;
        }
        if (!table.dates.empty() && *date <= table.dates.back()) {
            spdlog::error("Dates must be strictly increasing (row {}, '{}')", row_index, fields.front());
            table = PriceTable{};
            return false;
        }

        table.dates.push_back(*date);
        for (std::size_t i = 0; i < N; ++i) {
            table.columns[i].push_back(coerce_price(fields[i + 1], options));
        }
    }

    if (table.dates.empty()) {
        spdlog::error("No dated rows found in prices CSV");
        table = PriceTable{};
        return false;
    }
    if (dropped_rows > 0) {
        spdlog::warn("Dropped {} row(s) without a valid date", dropped_rows);
    }
    return true;
}

bool load_prices_csv(const std::string& path,
                     const LoadOptions& options,
                     PriceTable& table) {
    std::ifstream input(path);
    if (!input.is_open()) {
        spdlog::error("Failed to open prices CSV: {}", path);
        return false;
    }
    return parse_prices_csv(input, options, table);
}

std::size_t drop_empty_columns(PriceTable& table) {
    std::size_t dropped = 0;
    std::size_t keep = 0;
    for (std::size_t i = 0; i < table.assets.size(); ++i) {
        const auto& column = table.columns[i];
        if (std::all_of(column.begin(), column.end(), is_missing)) {
            spdlog::info("Dropping asset '{}': no valid prices", table.assets[i]);
            ++dropped;
            continue;
        }
        if (keep != i) {
            table.assets[keep] = std::move(table.assets[i]);
            table.columns[keep] = std::move(table.columns[i]);
        }
        ++keep;
    }
    table.assets.resize(keep);
    table.columns.resize(keep);
    return dropped;
}

} // namespace garch
