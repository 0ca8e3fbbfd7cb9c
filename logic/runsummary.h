#pragma once

#include "cbudget/company.h"
#include "cbudget/scope.h"
#include "infra/filesystem.h"

#include <date/date.h>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

struct lxw_workbook;

namespace cbudget {

class InvariantViolation;

enum class IssueCategory
{
    DataRepairApplied,
    UnitMismatch,
    IrrecoverableMisalignment,
    InvariantViolation,
    UnresolvableScope,
    SchemaValidationFailure,
};

std::string_view issue_category_name(IssueCategory category) noexcept;

/* Collects the data issues encountered while processing the companies
 * Issues can be added concurrently from the per company processing tasks
 */
class RunSummary
{
public:
    struct Issue
    {
        IssueCategory category = IssueCategory::DataRepairApplied;
        std::string companyId;
        std::optional<Scope> scope;
        std::vector<date::year> years;
        std::string message;
    };

    RunSummary() = default;

    void add_issue(IssueCategory category, std::string_view companyId, std::optional<Scope> scope, std::string message);
    void add_issue(Issue issue);
    void add_invariant_violation(const InvariantViolation& violation);

    void set_results(std::vector<CompanyAggregate> results);

    std::vector<Issue> issues() const;
    std::vector<Issue> issues(IssueCategory category) const;
    size_t issue_count(IssueCategory category) const;

    void write_summary(const fs::path& outputDir) const;

private:
    void issues_to_spreadsheet(lxw_workbook* wb, const std::string& tabName, std::span<const Issue> issues) const;
    void results_to_spreadsheet(lxw_workbook* wb, const std::string& tabName) const;
    void write_summary_spreadsheet(const fs::path& path) const;

    mutable std::mutex _mutex;
    std::vector<Issue> _issues;
    std::vector<CompanyAggregate> _results;
};

}
