#include "cbudget/benchmark.h"
#include "cbudget/constants.h"
#include "cbudget/errors.h"

#include "infra/exception.h"
#include "infra/log.h"
#include "infra/math.h"

#include <cmath>

namespace cbudget {

using namespace inf;

IntensityBenchmark::IntensityBenchmark(ProjectionControls controls, Properties properties)
: _controls(controls)
, _properties(std::move(properties))
{
}

void IntensityBenchmark::add_intensity(std::string sector, std::string region, Scope scope, YearSeries intensity)
{
    ScopedBenchmarkKey key{std::move(sector), std::move(region), scope};
    if (_intensities.count(key) > 0) {
        throw RuntimeError("Duplicate intensity benchmark for {} - {} - {}", key.sector, key.region, key.scope);
    }

    _intensities.emplace(std::move(key), std::move(intensity));
}

bool IntensityBenchmark::is_production_centric() const noexcept
{
    return _properties.productionCentric;
}

Quantity IntensityBenchmark::benchmark_global_budget() const
{
    return _properties.globalBudget;
}

Quantity IntensityBenchmark::benchmark_temperature() const
{
    return _properties.temperature;
}

std::vector<Scope> IntensityBenchmark::scopes(std::string_view sector, std::string_view region) const
{
    std::vector<Scope> result;
    for (auto scope : AllScopes) {
        if (_intensities.count(ScopedBenchmarkKey{std::string(sector), std::string(region), scope}) > 0) {
            result.push_back(scope);
        }
    }

    return result;
}

const YearSeries* IntensityBenchmark::find_intensity(std::string_view sector, std::string_view region, Scope scope) const noexcept
{
    if (auto iter = _intensities.find(ScopedBenchmarkKey{std::string(sector), std::string(region), scope}); iter != _intensities.end()) {
        return &iter->second;
    }

    if (auto iter = _intensities.find(ScopedBenchmarkKey{std::string(sector), std::string(constants::globalRegion), scope}); iter != _intensities.end()) {
        return &iter->second;
    }

    return nullptr;
}

YearSeries IntensityBenchmark::sda_intensity(const CompanyBaseYearInfo& company) const
{
    const auto* benchmark = find_intensity(company.sector, company.region, company.scope);
    if (benchmark == nullptr) {
        throw RuntimeError("No intensity benchmark for {} - {} - {}", company.sector, company.region, company.scope);
    }

    auto path = benchmark->restricted_to(_controls.horizon());
    if (path.empty() || !path.contains(_controls.baseYear)) {
        throw InvariantViolation(company.companyId, {_controls.baseYear}, fmt::format("Intensity benchmark for {} - {} has no value for the base year", company.sector, company.region));
    }

    const auto baseValue = path.value(_controls.baseYear);
    const auto endValue  = path.last_value();
    if (math::approx_equal(baseValue, endValue, 1e-12)) {
        // a flat pathway leaves no room for convergence
        return path;
    }

    const auto companyIntensity = company.intensity.value_in(path.unit());

    YearSeries result(path.unit());
    for (const auto& point : path.points()) {
        const auto decarbonization = (point.value - endValue) / (baseValue - endValue);
        result.set_value(point.year, decarbonization * (companyIntensity - endValue) + endValue);
    }

    return result;
}

YearTable IntensityBenchmark::get_SDA_intensity_benchmarks(std::span<const CompanyBaseYearInfo> companies) const
{
    YearTable result;
    for (const auto& company : companies) {
        result.add_row(RowId{company.companyId, company.scope}, sda_intensity(company));
    }

    return result;
}

ProductionBenchmark::ProductionBenchmark(ProjectionControls controls)
: _controls(controls)
{
}

void ProductionBenchmark::add_growth(std::string sector, std::string region, YearSeries growth)
{
    if (!growth.unit().is_dimensionless()) {
        throw UnitMismatch("Production growth for {} - {} should be dimensionless ({})", sector, region, growth.unit());
    }

    BenchmarkKey key{std::move(sector), std::move(region)};
    if (_growth.count(key) > 0) {
        throw RuntimeError("Duplicate production benchmark for {} - {}", key.sector, key.region);
    }

    _growth.emplace(std::move(key), std::move(growth));
}

const YearSeries* ProductionBenchmark::find_growth(std::string_view sector, std::string_view region) const noexcept
{
    if (auto iter = _growth.find(BenchmarkKey{std::string(sector), std::string(region)}); iter != _growth.end()) {
        return &iter->second;
    }

    if (auto iter = _growth.find(BenchmarkKey{std::string(sector), std::string(constants::globalRegion)}); iter != _growth.end()) {
        return &iter->second;
    }

    return nullptr;
}

std::optional<YearSeries> ProductionBenchmark::project_production(std::string_view sector, std::string_view region, const Quantity& baseYearProduction) const
{
    std::optional<YearSeries> result;

    const auto* growth = find_growth(sector, region);
    if (growth == nullptr) {
        return result;
    }

    YearSeries production(baseYearProduction.unit());
    double factor = 1.0;
    for (const auto& point : growth->restricted_to(_controls.horizon()).points()) {
        factor *= 1.0 + point.value;
        production.set_value(point.year, baseYearProduction.magnitude() * factor);
    }

    result = std::move(production);
    return result;
}

YearTable ProductionBenchmark::get_company_projected_production(std::span<const CompanyBaseYearInfo> companies) const
{
    YearTable result;
    for (const auto& company : companies) {
        if (auto production = project_production(company.sector, company.region, company.production); production.has_value()) {
            result.add_row(RowId{company.companyId, company.scope}, std::move(*production));
        } else {
            Log::warn("No production benchmark for {} ({} - {})", company.companyId, company.sector, company.region);
        }
    }

    return result;
}

}
