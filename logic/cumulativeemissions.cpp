#include "cbudget/cumulativeemissions.h"
#include "cbudget/constants.h"
#include "cbudget/errors.h"

#include "infra/string.h"

namespace cbudget {

using namespace inf;

YearSeries cumulative_emissions(const RowId& id, const YearSeries& intensity, const YearSeries& production)
{
    const auto emissions = intensity.multiplied_by(production);
    if (emissions.has_missing_values()) {
        auto years = emissions.missing_years();
        auto yearList = str::join(years, ", ", [](date::year year) {
            return std::to_string(static_cast<int>(year));
        });

        throw InvariantViolation(id.companyId, std::move(years), fmt::format("Missing emission values for {} in years: {}", id, yearList));
    }

    return emissions.cumulative_sum().converted_to(Unit::parse(constants::emissionsUnit));
}

YearTable cumulative_emissions(const YearTable& intensities, const YearTable& production)
{
    YearTable result;
    for (const auto& row : intensities.rows()) {
        const auto* rowProduction = production.find(row.id);
        if (rowProduction == nullptr) {
            throw InvariantViolation(row.id.companyId, row.series.years(), fmt::format("No production available for {}", row.id));
        }

        result.add_row(row.id, cumulative_emissions(row.id, row.series, *rowProduction));
    }

    return result;
}

}
