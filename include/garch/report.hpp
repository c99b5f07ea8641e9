#pragma once

#include <string>
#include <vector>

#include <garch/batch.hpp>
#include <garch/date_table.hpp>

namespace garch {

inline constexpr const char* kPricesTable = "Original_Prices";
inline constexpr const char* kReturnsTable = "Returns_Scaled";
inline constexpr const char* kStdevTable = "GARCH_Stdev";
inline constexpr const char* kVarTable = "GARCH_VaR";
inline constexpr const char* kParametersTable = "Model_Parameters";
inline constexpr const char* kSkippedTable = "Skipped_Assets";

struct ReportOptions {
    std::string output_dir;
    bool skip_report = false;
};

struct RenderedTable {
    std::string name;
    std::string csv;
};

std::string format_number(double value);

// Date-indexed CSV; with mark_seed a leading "Seed" column flags with '*'
// every row holding some column's first value.
std::string render_date_table(const DateTable& table, bool mark_seed);

std::string render_parameters(const std::vector<ParameterRow>& rows);

std::string render_skipped(const std::vector<SkippedAsset>& skipped);

std::vector<RenderedTable> render_report(const BatchResultTables& tables, bool include_skipped);

bool write_report(const BatchResultTables& tables, const ReportOptions& options);

} // namespace garch
