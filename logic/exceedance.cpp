#include "cbudget/exceedance.h"

#include "infra/log.h"

#include <cmath>

namespace cbudget {

std::optional<date::year> exceedance_year(const YearSeries& subject, const YearSeries& budget, std::optional<date::year> budgetYear, const ProjectionControls& controls)
{
    const auto comparable = subject.converted_to(budget.unit());

    std::optional<double> flattenedBudget;
    if (budgetYear.has_value()) {
        flattenedBudget = budget.try_value(*budgetYear);
        if (!flattenedBudget.has_value() || std::isnan(*flattenedBudget)) {
            inf::Log::warn("No budget value for {}, the budget is not flattened", static_cast<int>(*budgetYear));
            flattenedBudget.reset();
        }
    }

    std::optional<date::year> furthest;
    const auto budgetPoints = budget.points();
    for (auto iter = budgetPoints.rbegin(); iter != budgetPoints.rend(); ++iter) {
        auto allowed = iter->value;
        if (flattenedBudget.has_value() && iter->year < *budgetYear) {
            allowed = *flattenedBudget;
        }

        auto value = comparable.try_value(iter->year);
        if (value.has_value() && !std::isnan(*value) && !std::isnan(allowed) && *value <= allowed) {
            furthest = iter->year;
            break;
        }
    }

    if (!furthest.has_value()) {
        return controls.baseYear;
    }

    if (*furthest >= controls.targetYear) {
        return std::nullopt;
    }

    return furthest;
}

std::vector<ExceedanceResult> exceedance_years(const YearTable& subject, const YearTable& budget, std::optional<date::year> budgetYear, const ProjectionControls& controls)
{
    std::vector<ExceedanceResult> result;
    for (const auto& row : budget.rows()) {
        if (const auto* subjectSeries = subject.find(row.id); subjectSeries != nullptr) {
            result.push_back(ExceedanceResult{row.id, exceedance_year(*subjectSeries, row.series, budgetYear, controls)});
        }
    }

    return result;
}

}
