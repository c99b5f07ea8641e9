#include <garch/calendar.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cctype>
#include <string>
#include <vector>

#include <garch/utils.hpp>

namespace garch {

namespace {

constexpr std::array<const char*, 12> kMonthNames = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool is_digits(std::string_view token) {
    if (token.empty()) {
        return false;
    }
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::optional<int> to_int(std::string_view token, std::size_t max_digits) {
    if (!is_digits(token) || token.size() > max_digits) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : token) {
        value = value * 10 + (c - '0');
    }
    return value;
}

std::optional<unsigned> month_from_name(std::string_view token) {
    if (token.size() < 3) {
        return std::nullopt;
    }
    for (std::size_t m = 0; m < kMonthNames.size(); ++m) {
        bool match = true;
        for (std::size_t i = 0; i < 3; ++i) {
            const char lhs = static_cast<char>(std::tolower(static_cast<unsigned char>(token[i])));
            const char rhs = static_cast<char>(std::tolower(static_cast<unsigned char>(kMonthNames[m][i])));
            if (lhs != rhs) {
                match = false;
                break;
            }
        }
        if (match) {
            return static_cast<unsigned>(m + 1);
        }
    }
    return std::nullopt;
}

// Two-digit years follow the strptime pivot: 00-68 -> 20xx, 69-99 -> 19xx.
std::optional<int> to_year(std::string_view token) {
    if (token.size() == 4) {
        return to_int(token, 4);
    }
    if (token.size() == 2) {
        const auto yy = to_int(token, 2);
        if (!yy) {
            return std::nullopt;
        }
        return *yy <= 68 ? 2000 + *yy : 1900 + *yy;
    }
    return std::nullopt;
}

std::optional<Date> make_date(std::optional<int> year,
                              std::optional<unsigned> month,
                              std::optional<int> day) {
    if (!year || !month || !day || *day <= 0) {
        return std::nullopt;
    }
    const std::chrono::year_month_day ymd{std::chrono::year{*year},
                                          std::chrono::month{*month},
                                          std::chrono::day{static_cast<unsigned>(*day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return std::chrono::sys_days{ymd};
}

} // namespace

std::optional<Date> parse_date(std::string_view text) {
    std::string cleaned = trim(text);
    const auto time_sep = cleaned.find(' ');
    if (time_sep != std::string::npos) {
        cleaned.resize(time_sep);
    }
    if (cleaned.size() > 10 && cleaned[10] == 'T') {
        cleaned.resize(10);
    }
    if (cleaned.empty()) {
        return std::nullopt;
    }

    const char sep = cleaned.find('-') != std::string::npos   ? '-'
                     : cleaned.find('/') != std::string::npos ? '/'
                                                              : '.';
    std::vector<std::string_view> parts;
    std::string_view rest(cleaned);
    while (true) {
        const auto pos = rest.find(sep);
        parts.push_back(rest.substr(0, pos));
        if (pos == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(pos + 1);
    }
    if (parts.size() != 3) {
        return std::nullopt;
    }

    if (parts[0].size() == 4) {
        const auto month = to_int(parts[1], 2);
        return make_date(to_int(parts[0], 4),
                         month ? std::optional<unsigned>(static_cast<unsigned>(*month)) : std::nullopt,
                         to_int(parts[2], 2));
    }

    std::optional<unsigned> month = month_from_name(parts[1]);
    if (!month) {
        const auto numeric = to_int(parts[1], 2);
        if (numeric && *numeric > 0) {
            month = static_cast<unsigned>(*numeric);
        }
    }
    return make_date(to_year(parts[2]), month, to_int(parts[0], 2));
}

std::string format_date(Date date) {
    const std::chrono::year_month_day ymd{date};
    const int year = static_cast<int>(ymd.year());
    const unsigned month = static_cast<unsigned>(ymd.month());
    const unsigned day = static_cast<unsigned>(ymd.day());
    const int yy = ((year % 100) + 100) % 100;
    return fmt::format("{:02}-{}-{:02}", day, kMonthNames.at(month - 1), yy);
}

} // namespace garch
