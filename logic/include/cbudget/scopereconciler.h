#pragma once

#include "cbudget/company.h"

#include <string_view>

namespace cbudget {

class RunSummary;

/* Production centric accounting: scope 3 is counted against the direct emissions of the company
 * The S3 data of every bundle is added to S1 and S1S2, afterwards the S3 and S1S2S3 slots are empty
 * Reconciling an already reconciled company has no effect
 * Throws InvariantViolation when the historic data of the company cannot be combined
 */
CompanyRecord reconcile_production_centric(CompanyRecord company, RunSummary& summary);

/* Extends the S3 series backwards over the years of the primary series that precede the first S3 year
 * Back-cast values follow the shape of the primary series: S3[first] * primary[year] / primary[reference]
 * where the reference is the last primary point at or before the first S3 year
 */
YearSeries backcast_scope3(const YearSeries& primary, const YearSeries& s3, std::string_view companyId);

}
