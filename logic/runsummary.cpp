#include "runsummary.h"

#include "cbudget/constants.h"
#include "cbudget/errors.h"
#include "infra/cast.h"
#include "infra/exception.h"
#include "infra/log.h"
#include "infra/string.h"
#include "xlsxworkbook.h"

#include <algorithm>
#include <array>

namespace cbudget {

using namespace inf;

struct ColumnInfo
{
    const char* header = nullptr;
    double width       = 0.0;
};

std::string_view issue_category_name(IssueCategory category) noexcept
{
    switch (category) {
    case IssueCategory::DataRepairApplied:
        return "Data repair applied";
    case IssueCategory::UnitMismatch:
        return "Unit mismatch";
    case IssueCategory::IrrecoverableMisalignment:
        return "Irrecoverable misalignment";
    case IssueCategory::InvariantViolation:
        return "Invariant violation";
    case IssueCategory::UnresolvableScope:
        return "Unresolvable scope";
    case IssueCategory::SchemaValidationFailure:
        return "Schema validation failure";
    }

    return "";
}

void RunSummary::add_issue(IssueCategory category, std::string_view companyId, std::optional<Scope> scope, std::string message)
{
    Issue issue;
    issue.category  = category;
    issue.companyId = companyId;
    issue.scope     = scope;
    issue.message   = std::move(message);
    add_issue(std::move(issue));
}

void RunSummary::add_issue(Issue issue)
{
    std::scoped_lock lock(_mutex);
    _issues.push_back(std::move(issue));
}

void RunSummary::add_invariant_violation(const InvariantViolation& violation)
{
    Issue issue;
    issue.category  = IssueCategory::InvariantViolation;
    issue.companyId = violation.company_id();
    issue.years     = violation.years();
    issue.message   = violation.what();
    add_issue(std::move(issue));
}

void RunSummary::set_results(std::vector<CompanyAggregate> results)
{
    std::scoped_lock lock(_mutex);
    _results = std::move(results);
}

std::vector<RunSummary::Issue> RunSummary::issues() const
{
    std::scoped_lock lock(_mutex);
    return _issues;
}

std::vector<RunSummary::Issue> RunSummary::issues(IssueCategory category) const
{
    std::vector<Issue> result;

    std::scoped_lock lock(_mutex);
    std::copy_if(_issues.begin(), _issues.end(), std::back_inserter(result), [category](const Issue& issue) {
        return issue.category == category;
    });

    return result;
}

size_t RunSummary::issue_count(IssueCategory category) const
{
    std::scoped_lock lock(_mutex);
    return std::count_if(_issues.begin(), _issues.end(), [category](const Issue& issue) {
        return issue.category == category;
    });
}

void RunSummary::issues_to_spreadsheet(lxw_workbook* wb, const std::string& tabName, std::span<const Issue> issues) const
{
    const std::array<ColumnInfo, 5> headers = {
        ColumnInfo{"Category", 28.0},
        ColumnInfo{"Company", 20.0},
        ColumnInfo{"Scope", 10.0},
        ColumnInfo{"Years", 20.0},
        ColumnInfo{"Message", 125.0},
    };

    auto* ws = workbook_add_worksheet(wb, tabName.c_str());
    if (!ws) {
        throw RuntimeError("Failed to add sheet to excel document");
    }

    auto* headerFormat = workbook_add_format(wb);
    format_set_bold(headerFormat);
    format_set_bg_color(headerFormat, 0xD5EBFF);

    for (int i = 0; i < truncate<int>(headers.size()); ++i) {
        worksheet_set_column(ws, i, i, headers.at(i).width, nullptr);
        worksheet_write_string(ws, 0, i, headers.at(i).header, headerFormat);
    }

    int row = 1;
    for (const auto& issue : issues) {
        const std::string category(issue_category_name(issue.category));
        const std::string scope(issue.scope.has_value() ? scope_name(*issue.scope) : "");
        const auto years = str::join(issue.years, ", ", [](date::year year) {
            return std::to_string(static_cast<int>(year));
        });

        int index = 0;
        worksheet_write_string(ws, row, index++, category.c_str(), nullptr);
        worksheet_write_string(ws, row, index++, issue.companyId.c_str(), nullptr);
        worksheet_write_string(ws, row, index++, scope.c_str(), nullptr);
        worksheet_write_string(ws, row, index++, years.c_str(), nullptr);
        worksheet_write_string(ws, row, index++, issue.message.c_str(), nullptr);
        ++row;
    }

    worksheet_autofilter(ws, 0, 0, row, truncate<lxw_col_t>(headers.size() - 1));
}

void RunSummary::results_to_spreadsheet(lxw_workbook* wb, const std::string& tabName) const
{
    if (_results.empty()) {
        return;
    }

    const std::array<ColumnInfo, 10> headers = {
        ColumnInfo{"Company", 20.0},
        ColumnInfo{"Name", 30.0},
        ColumnInfo{"Sector", 20.0},
        ColumnInfo{"Region", 15.0},
        ColumnInfo{"Scope", 10.0},
        ColumnInfo{"Cumulative trajectory [Mt CO2]", 30.0},
        ColumnInfo{"Cumulative target [Mt CO2]", 30.0},
        ColumnInfo{"Cumulative budget [Mt CO2]", 30.0},
        ColumnInfo{"Trajectory exceedance year", 25.0},
        ColumnInfo{"Target exceedance year", 25.0},
    };

    auto* ws = workbook_add_worksheet(wb, tabName.c_str());
    if (!ws) {
        throw RuntimeError("Failed to add sheet to excel document");
    }

    auto* headerFormat = workbook_add_format(wb);
    format_set_bold(headerFormat);
    format_set_bg_color(headerFormat, 0xD5EBFF);

    auto* formatNumber = workbook_add_format(wb);
    format_set_num_format(formatNumber, "0.000000");

    for (int i = 0; i < truncate<int>(headers.size()); ++i) {
        worksheet_set_column(ws, i, i, headers.at(i).width, nullptr);
        worksheet_write_string(ws, 0, i, headers.at(i).header, headerFormat);
    }

    const auto emissionsUnit = Unit::parse(constants::emissionsUnit);

    auto writeYear = [ws](int row, int col, std::optional<date::year> year) {
        if (year.has_value()) {
            worksheet_write_number(ws, row, col, static_cast<int>(*year), nullptr);
        } else {
            worksheet_write_string(ws, row, col, "No exceedance", nullptr);
        }
    };

    int row = 1;
    for (const auto& result : _results) {
        const std::string scope(scope_name(result.scope));

        int index = 0;
        worksheet_write_string(ws, row, index++, result.companyId.c_str(), nullptr);
        worksheet_write_string(ws, row, index++, result.companyName.c_str(), nullptr);
        worksheet_write_string(ws, row, index++, result.sector.c_str(), nullptr);
        worksheet_write_string(ws, row, index++, result.region.c_str(), nullptr);
        worksheet_write_string(ws, row, index++, scope.c_str(), nullptr);
        worksheet_write_number(ws, row, index++, result.cumulativeTrajectory.value_in(emissionsUnit), formatNumber);
        worksheet_write_number(ws, row, index++, result.cumulativeTarget.value_in(emissionsUnit), formatNumber);
        worksheet_write_number(ws, row, index++, result.cumulativeBudget.value_in(emissionsUnit), formatNumber);
        writeYear(row, index++, result.trajectoryExceedanceYear);
        writeYear(row, index++, result.targetExceedanceYear);
        ++row;
    }

    worksheet_autofilter(ws, 0, 0, row, truncate<lxw_col_t>(headers.size() - 1));
}

void RunSummary::write_summary(const fs::path& outputDir) const
{
    write_summary_spreadsheet(outputDir / "summary.xlsx");
}

void RunSummary::write_summary_spreadsheet(const fs::path& path) const
{
    std::error_code ec;
    fs::remove(path, ec);

    std::scoped_lock lock(_mutex);

    xl::WorkBook wb(path);
    issues_to_spreadsheet(wb, "processing issues", _issues);
    results_to_spreadsheet(wb, "company results");
    wb.close();
}

}
