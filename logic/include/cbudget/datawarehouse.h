#pragma once

#include "cbudget/companystore.h"
#include "cbudget/dataproviders.h"

#include <span>
#include <string>
#include <vector>

namespace cbudget {

class RunSummary;

/* Prepares the company data for scoring against a benchmark
 * On construction the missing S3 data is estimated (optional), production centric benchmarks fold S3 into S1 and S1S2
 * and the scoring scope of every company is resolved. Companies that fail one of these steps are excluded.
 */
class DataWarehouse
{
public:
    struct Options
    {
        bool estimateMissingS3 = false;
    };

    DataWarehouse(std::vector<CompanyRecord> companies,
                  ProjectionControls controls,
                  const IntensityBenchmarkDataProvider& intensityBenchmark,
                  const ProductionBenchmarkDataProvider& productionBenchmark,
                  Options options,
                  RunSummary& summary);

    const CompanyDataProvider& company_data() const noexcept;
    std::vector<std::string> company_ids() const;

    // Cumulative emissions and exceedance years of the requested companies, companies that cannot be scored are dropped
    std::vector<CompanyAggregate> get_preprocessed_company_data(std::span<const std::string> companyIds) const;

private:
    std::optional<CompanyAggregate> score_company(const CompanyRecord& company) const;

    const IntensityBenchmarkDataProvider& _intensityBenchmark;
    const ProductionBenchmarkDataProvider& _productionBenchmark;
    RunSummary& _summary;
    CompanyStore _companies;
};

/* Target intensities within the horizon, years before the first target value are taken from the trajectory
 * Leading years without target or trajectory value are dropped, gaps between target values are interpolated
 */
YearSeries fill_target_left_edge(const YearSeries& target, const YearSeries* trajectory, inf::Range<date::year> horizon);

}
