#pragma once

#include "cbudget/yeartable.h"

namespace cbudget {

/* Running total of intensity x production over the years of the intensity series, expressed in Mt CO2
 * Throws InvariantViolation when a year has no value (missing production, missing intensity)
 */
YearSeries cumulative_emissions(const RowId& id, const YearSeries& intensity, const YearSeries& production);

// Cumulative emissions for every intensity row, the row order of the intensities is preserved
YearTable cumulative_emissions(const YearTable& intensities, const YearTable& production);

}
