#include "cbudget/s3estimator.h"
#include "cbudget/constants.h"
#include "cbudget/errors.h"
#include "runsummary.h"

#include "infra/algo.h"
#include "infra/log.h"

namespace cbudget {

using namespace inf;

static YearSeries values_for_years(const YearSeries& source, const YearSeries& yearsOf, date::year fromYear)
{
    YearSeries result(source.unit());
    for (const auto& point : yearsOf.points()) {
        if (point.year < fromYear) {
            continue;
        }

        if (auto value = source.try_value(point.year); value.has_value()) {
            result.set_value(point.year, *value);
        }
    }

    return result;
}

// Adds the S3 series for the S1S2 years starting from the base year together with the S1S2S3 sum
static void add_historic_estimate(ScopeBundle<YearSeries>& data, const YearSeries& s3Source, date::year baseYear)
{
    const auto& s1s2 = data.get(Scope::S1S2);
    if (!s1s2.has_value()) {
        return;
    }

    auto s3 = values_for_years(s3Source, *s1s2, baseYear).converted_to(s1s2->unit());
    auto s1s2s3 = s1s2->restricted_to(inf::Range<date::year>(baseYear, date::year::max())).sum_overlap(s3);

    data.set(Scope::S3, std::move(s3));
    data.set(Scope::S1S2S3, std::move(s1s2s3));
}

static void add_projected_estimate(ScopeBundle<YearSeries>& trajectories, const YearSeries& s3Intensity)
{
    if (const auto& s1s2 = trajectories.get(Scope::S1S2); s1s2.has_value()) {
        auto s3     = values_for_years(s3Intensity, *s1s2, date::year::min()).converted_to(s1s2->unit());
        auto s1s2s3 = s1s2->sum_overlap(s3);
        trajectories.set(Scope::S3, std::move(s3));
        trajectories.set(Scope::S1S2S3, std::move(s1s2s3));
    } else if (const auto& s1 = trajectories.get(Scope::S1); s1.has_value()) {
        // without S2 data there is no S1S2S3 trajectory
        trajectories.set(Scope::S3, values_for_years(s3Intensity, *s1, date::year::min()).converted_to(s1->unit()));
    }
}

CompanyRecord estimate_missing_s3(CompanyRecord company,
                                  const IntensityBenchmarkDataProvider& intensityBenchmark,
                                  const ProductionBenchmarkDataProvider& productionBenchmark,
                                  const ProjectionControls& controls,
                                  RunSummary& summary)
{
    if (const auto& s3 = company.historicEmissions.get(Scope::S3); s3.has_value() && !s3->empty()) {
        return company;
    }

    std::string region = company.region;
    if (intensityBenchmark.scopes(company.sector, region).empty()) {
        region = constants::globalRegion;
    }

    const auto scopes = intensityBenchmark.scopes(company.sector, region);
    if (find_in_container(scopes, Scope::S3) == nullptr) {
        return company;
    }

    const auto* benchmarkS3 = intensityBenchmark.find_intensity(company.sector, region, Scope::S3);
    if (benchmarkS3 == nullptr) {
        return company;
    }

    const auto production = productionBenchmark.project_production(company.sector, region, company.baseYearProduction);
    if (!production.has_value()) {
        Log::warn("No production benchmark for {} ({} - {}), no S3 estimate", company.id, company.sector, region);
        return company;
    }

    try {
        const auto s3Intensity = benchmarkS3->restricted_to(controls.horizon());
        const auto s3Emissions = s3Intensity.multiplied_by(*production).converted_to(Unit::parse(constants::emissionsUnit));

        CompanyRecord estimated = company;
        if (auto baseYearEmissions = s3Emissions.try_value(controls.baseYear); baseYearEmissions.has_value()) {
            estimated.ghgS3 = Quantity(*baseYearEmissions, s3Emissions.unit());
        }

        add_historic_estimate(estimated.historicEmissions, s3Emissions, controls.baseYear);
        add_historic_estimate(estimated.historicIntensities, s3Intensity, controls.baseYear);
        add_projected_estimate(estimated.projectedIntensities, s3Intensity);

        Log::info("Added S3 estimates for {} (sector = {}, region = {})", company.id, company.sector, region);
        return estimated;
    } catch (const UnitMismatch& e) {
        auto message = fmt::format("Production unit '{}' and S3 intensity unit '{}' do not combine to emissions for {}: {}",
                                   production->unit(), benchmarkS3->unit(), company.id, e.what());
        Log::error("{}", message);
        summary.add_issue(IssueCategory::UnitMismatch, company.id, Scope::S3, std::move(message));
    }

    return company;
}

}
