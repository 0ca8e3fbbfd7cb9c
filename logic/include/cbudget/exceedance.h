#pragma once

#include "cbudget/projectioncontrols.h"
#include "cbudget/yeartable.h"

#include <optional>
#include <vector>

namespace cbudget {

struct ExceedanceResult
{
    RowId id;
    // Unset when the subject stays within the budget up to the target year
    std::optional<date::year> year;
};

/* Furthest year in which the cumulative subject emissions do not exceed the cumulative budget
 * With a budget year, the budget of every earlier year is replaced by the budget of the budget year
 * No year within budget results in the base year, a year at or beyond the target year means no exceedance
 */
std::optional<date::year> exceedance_year(const YearSeries& subject, const YearSeries& budget, std::optional<date::year> budgetYear, const ProjectionControls& controls);

// Results for the rows present in both tables, in the row order of the budget
std::vector<ExceedanceResult> exceedance_years(const YearTable& subject, const YearTable& budget, std::optional<date::year> budgetYear, const ProjectionControls& controls);

}
