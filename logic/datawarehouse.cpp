#include "cbudget/datawarehouse.h"
#include "cbudget/constants.h"
#include "cbudget/cumulativeemissions.h"
#include "cbudget/errors.h"
#include "cbudget/exceedance.h"
#include "cbudget/s3estimator.h"
#include "cbudget/scopereconciler.h"
#include "cbudget/scoperesolver.h"
#include "runsummary.h"

#include "infra/chrono.h"
#include "infra/log.h"
#include "infra/string.h"

#include <algorithm>
#include <cmath>
#include <oneapi/tbb/parallel_for.h>

namespace cbudget {

using namespace inf;

static void report_failure(RunSummary& summary, const std::string& companyId, IssueCategory category, const std::exception& e)
{
    Log::error("Company {} is excluded: {}", companyId, e.what());
    summary.add_issue(category, companyId, {}, e.what());
}

static std::vector<CompanyRecord> prepare_companies(std::vector<CompanyRecord> companies,
                                                    const ProjectionControls& controls,
                                                    const IntensityBenchmarkDataProvider& intensityBenchmark,
                                                    const ProductionBenchmarkDataProvider& productionBenchmark,
                                                    DataWarehouse::Options options,
                                                    RunSummary& summary)
{
    const bool productionCentric = intensityBenchmark.is_production_centric();
    if (productionCentric) {
        Log::info("Shifting S3 emissions data into S1 according to production centric benchmark rules");
    }

    std::vector<std::optional<CompanyRecord>> prepared(companies.size());
    tbb::parallel_for(size_t(0), companies.size(), [&](size_t index) {
        auto& company = companies[index];

        try {
            if (options.estimateMissingS3) {
                company = estimate_missing_s3(std::move(company), intensityBenchmark, productionBenchmark, controls, summary);
            }

            if (productionCentric) {
                company = reconcile_production_centric(std::move(company), summary);
            }

            prepared[index] = std::move(company);
        } catch (const InvariantViolation& e) {
            Log::error("Company {} is excluded: {}", e.company_id(), e.what());
            summary.add_invariant_violation(e);
        }
    });

    std::vector<CompanyRecord> result;
    result.reserve(prepared.size());
    for (auto& company : prepared) {
        if (company.has_value()) {
            result.push_back(std::move(*company));
        }
    }

    return result;
}

DataWarehouse::DataWarehouse(std::vector<CompanyRecord> companies,
                             ProjectionControls controls,
                             const IntensityBenchmarkDataProvider& intensityBenchmark,
                             const ProductionBenchmarkDataProvider& productionBenchmark,
                             Options options,
                             RunSummary& summary)
: _intensityBenchmark(intensityBenchmark)
, _productionBenchmark(productionBenchmark)
, _summary(summary)
{
    chrono::ScopedDurationLog d("Prepare company data");

    auto prepared = prepare_companies(std::move(companies), controls, intensityBenchmark, productionBenchmark, options, summary);
    _companies    = CompanyStore(resolve_scopes(std::move(prepared), intensityBenchmark, summary), controls);
}

const CompanyDataProvider& DataWarehouse::company_data() const noexcept
{
    return _companies;
}

std::vector<std::string> DataWarehouse::company_ids() const
{
    return _companies.company_ids();
}

YearSeries fill_target_left_edge(const YearSeries& target, const YearSeries* trajectory, inf::Range<date::year> horizon)
{
    auto result = target.restricted_to(horizon);

    const auto points     = result.points();
    const auto firstValid = std::find_if(points.begin(), points.end(), [](const YearSeries::Point& point) {
        return !std::isnan(point.value);
    });

    if (firstValid == points.end()) {
        return result;
    }

    const auto firstValidYear = firstValid->year;
    if (trajectory != nullptr) {
        for (const auto& point : trajectory->restricted_to(horizon).converted_to(result.unit()).points()) {
            if (point.year < firstValidYear) {
                result.set_value(point.year, point.value);
            }
        }
    }

    // leading years that remain without value are not part of the target path
    std::vector<YearSeries::Point> filled;
    bool leading = true;
    for (const auto& point : result.points()) {
        if (leading && std::isnan(point.value)) {
            continue;
        }

        leading = false;
        filled.push_back(point);
    }

    return YearSeries(result.unit(), std::move(filled)).interpolated();
}

static YearTable fill_targets(const YearTable& targets, const YearTable& trajectories, const YearTable& production, inf::Range<date::year> horizon)
{
    YearTable result;
    for (const auto& row : targets.rows()) {
        if (!production.contains(row.id)) {
            continue;
        }

        result.add_row(row.id, fill_target_left_edge(row.series, trajectories.find(row.id), horizon));
    }

    return result;
}

static std::optional<Quantity> final_value(const YearTable& table, const RowId& id)
{
    std::optional<Quantity> result;
    if (const auto* series = table.find(id); series != nullptr && !series->empty()) {
        result = Quantity(series->last_value(), series->unit());
    }

    return result;
}

static std::optional<ExceedanceResult> find_result(const std::vector<ExceedanceResult>& results, const RowId& id)
{
    std::optional<ExceedanceResult> result;
    auto iter = std::find_if(results.begin(), results.end(), [&id](const ExceedanceResult& entry) {
        return entry.id == id;
    });

    if (iter != results.end()) {
        result = *iter;
    }

    return result;
}

static bool is_valid_quantity(const std::optional<Quantity>& quantity) noexcept
{
    return quantity.has_value() && std::isfinite(quantity->magnitude());
}

std::optional<CompanyAggregate> DataWarehouse::score_company(const CompanyRecord& company) const
{
    const auto& controls = _companies.projection_controls();
    const std::vector<std::string> ids = {company.id};

    const auto baseYearInfo = _companies.get_company_intensity_and_production_at_base_year(ids);
    const auto production   = _productionBenchmark.get_company_projected_production(baseYearInfo);
    const auto trajectories = _companies.get_company_projected_trajectories(ids);
    const auto targets      = fill_targets(_companies.get_company_projected_targets(ids), trajectories, production, controls.horizon());

    const auto cumulativeTrajectory = cumulative_emissions(trajectories, production);
    const auto cumulativeTarget     = cumulative_emissions(targets, production);
    const auto cumulativeBudget     = cumulative_emissions(_intensityBenchmark.get_SDA_intensity_benchmarks(baseYearInfo), production);

    const auto trajectoryExceedance = exceedance_years(cumulativeTrajectory, cumulativeBudget, controls.targetYear, controls);
    const auto targetExceedance     = exceedance_years(cumulativeTarget, cumulativeBudget, controls.targetYear, controls);

    const RowId id{company.id, *company.scoringScope};

    const auto trajectory        = final_value(cumulativeTrajectory, id);
    const auto target            = final_value(cumulativeTarget, id);
    const auto budget            = final_value(cumulativeBudget, id);
    const auto trajectoryYear    = find_result(trajectoryExceedance, id);
    const auto targetYear        = find_result(targetExceedance, id);
    const auto globalBudget      = _intensityBenchmark.benchmark_global_budget();
    const auto globalTemperature = _intensityBenchmark.benchmark_temperature();

    if (!is_valid_quantity(trajectory) || !is_valid_quantity(target) || !is_valid_quantity(budget) || !trajectoryYear.has_value() || !targetYear.has_value()) {
        auto message = fmt::format("(one of) the input(s) of company {} ({}) is invalid and will be skipped", company.name, company.id);
        Log::warn("{}", message);
        _summary.add_issue(IssueCategory::SchemaValidationFailure, company.id, company.scoringScope, std::move(message));
        return {};
    }

    CompanyAggregate aggregate;
    aggregate.companyId                = company.id;
    aggregate.companyName              = company.name;
    aggregate.sector                   = company.sector;
    aggregate.region                   = company.region;
    aggregate.scope                    = *company.scoringScope;
    aggregate.baseYearProduction       = company.baseYearProduction;
    aggregate.ghgS1S2                  = company.ghgS1S2;
    aggregate.cumulativeTrajectory     = *trajectory;
    aggregate.cumulativeTarget         = *target;
    aggregate.cumulativeBudget         = *budget;
    aggregate.trajectoryExceedanceYear = trajectoryYear->year;
    aggregate.targetExceedanceYear     = targetYear->year;
    aggregate.benchmarkGlobalBudget    = globalBudget.to(constants::globalBudgetUnit);
    aggregate.benchmarkTemperature     = globalTemperature;
    return aggregate;
}

std::vector<CompanyAggregate> DataWarehouse::get_preprocessed_company_data(std::span<const std::string> companyIds) const
{
    chrono::ScopedDurationLog d("Compute cumulative emissions and exceedance years");

    const auto companies = _companies.get_company_data(companyIds);

    std::vector<std::optional<CompanyAggregate>> aggregates(companies.size());
    std::vector<char> unscored(companies.size(), 0);
    tbb::parallel_for(size_t(0), companies.size(), [&](size_t index) {
        const auto& company = companies[index];

        if (!company.scoringScope.has_value() || _intensityBenchmark.find_intensity(company.sector, company.region, *company.scoringScope) == nullptr) {
            // the benchmark does not cover the scope of the company
            unscored[index] = 1;
            return;
        }

        try {
            aggregates[index] = score_company(company);
        } catch (const InvariantViolation& e) {
            Log::error("Company {} is excluded: {}", e.company_id(), e.what());
            _summary.add_invariant_violation(e);
        } catch (const UnitMismatch& e) {
            report_failure(_summary, company.id, IssueCategory::UnitMismatch, e);
        } catch (const IrrecoverableMisalignment& e) {
            report_failure(_summary, company.id, IssueCategory::IrrecoverableMisalignment, e);
        }
    });

    std::vector<CompanyAggregate> result;
    std::vector<std::string_view> droppedIds;
    for (size_t i = 0; i < aggregates.size(); ++i) {
        if (aggregates[i].has_value()) {
            result.push_back(std::move(*aggregates[i]));
        } else if (unscored[i]) {
            droppedIds.push_back(companies[i].id);
        }
    }

    if (!droppedIds.empty()) {
        Log::warn("Dropping companies with no scope data: {}", str::join(droppedIds, ", "));
    }

    return result;
}

}
