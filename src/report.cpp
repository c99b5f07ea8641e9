#include <garch/report.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace garch {

namespace {

std::string csv_field(const std::string& text) {
    if (text.find_first_of(",\"\n") == std::string::npos) {
        return text;
    }
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

std::string format_number(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0.0 ? "inf" : "-inf";
    }
    return fmt::format("{}", value);
}

std::string render_date_table(const DateTable& table, bool mark_seed) {
    std::string out;
    if (mark_seed) {
        out += "Seed,";
    }
    out += "Date";
    for (const auto& name : table.names()) {
        out += ',';
        out += csv_field(name);
    }
    out += '\n';

    std::vector<bool> seed_rows(table.rows(), false);
    if (mark_seed) {
        for (std::size_t col = 0; col < table.column_count(); ++col) {
            if (const auto row = table.first_populated_row(col)) {
                seed_rows[*row] = true;
            }
        }
    }
    for (std::size_t row = 0; row < table.rows(); ++row) {
        if (mark_seed) {
            out += seed_rows[row] ? "*," : ",";
        }
        out += format_date(table.index()[row]);
        for (std::size_t col = 0; col < table.column_count(); ++col) {
            out += ',';
            const Cell& cell = table.cell(row, col);
            if (cell) {
                out += format_number(*cell);
            }
        }
        out += '\n';
    }
    return out;
}

std::string render_parameters(const std::vector<ParameterRow>& rows) {
    std::string out = "Asset,Omega,Alpha,Beta,Persistence,Nu (DF)\n";
    for (const auto& row : rows) {
        const ModelParameters& p = row.params;
        out += fmt::format("{},{},{},{},{},{}\n",
                           csv_field(row.asset),
                           format_number(p.omega),
                           format_number(p.alpha),
                           format_number(p.beta),
                           format_number(p.persistence()),
                           format_number(p.nu));
    }
    return out;
}

std::string render_skipped(const std::vector<SkippedAsset>& skipped) {
    std::string out = "Asset,Reason,Detail\n";
    for (const auto& entry : skipped) {
        out += fmt::format("{},{},{}\n",
                           csv_field(entry.asset),
                           to_string(entry.reason),
                           csv_field(entry.detail));
    }
    return out;
}

std::vector<RenderedTable> render_report(const BatchResultTables& tables, bool include_skipped) {
    std::vector<RenderedTable> rendered;
    rendered.push_back({kPricesTable, render_date_table(tables.prices, false)});
    rendered.push_back({kReturnsTable, render_date_table(tables.returns, false)});
    rendered.push_back({kStdevTable, render_date_table(tables.stdevs, true)});
    rendered.push_back({kVarTable, render_date_table(tables.var, true)});
    rendered.push_back({kParametersTable, render_parameters(tables.parameters)});
    if (include_skipped) {
        rendered.push_back({kSkippedTable, render_skipped(tables.skipped)});
    }
    return rendered;
}

bool write_report(const BatchResultTables& tables, const ReportOptions& options) {
    if (options.output_dir.empty()) {
        spdlog::error("No output directory configured for the report");
        return false;
    }

    const std::vector<RenderedTable> rendered = render_report(tables, options.skip_report);

    const std::filesystem::path dir(options.output_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Failed to create report directory '{}': {}", options.output_dir, ec.message());
        return false;
    }

    for (const auto& table : rendered) {
        const std::filesystem::path path = dir / (table.name + ".csv");
        std::ofstream output(path, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            spdlog::error("Failed to open '{}' for writing", path.string());
            return false;
        }
        output << table.csv;
        if (!output) {
            spdlog::error("Failed to write '{}'", path.string());
            return false;
        }
    }

    spdlog::info("Wrote {} tables to '{}'", rendered.size(), options.output_dir);
    return true;
}

} // namespace garch
