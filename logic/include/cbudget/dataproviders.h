#pragma once

#include "cbudget/company.h"
#include "cbudget/projectioncontrols.h"
#include "cbudget/scope.h"
#include "cbudget/units.h"
#include "cbudget/yeartable.h"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cbudget {

class CompanyDataProvider
{
public:
    virtual ~CompanyDataProvider() = default;

    virtual std::vector<CompanyRecord> get_company_data(std::span<const std::string> companyIds) const = 0;
    // Rows are keyed on the scoring scope of the company
    virtual YearTable get_company_projected_trajectories(std::span<const std::string> companyIds) const = 0;
    virtual YearTable get_company_projected_targets(std::span<const std::string> companyIds) const = 0;
    virtual std::vector<CompanyBaseYearInfo> get_company_intensity_and_production_at_base_year(std::span<const std::string> companyIds) const = 0;

    virtual const ProjectionControls& projection_controls() const noexcept = 0;
};

class ProductionBenchmarkDataProvider
{
public:
    virtual ~ProductionBenchmarkDataProvider() = default;

    // Projected production from the base year up to the target year, empty when the benchmark has no growth path
    virtual std::optional<YearSeries> project_production(std::string_view sector, std::string_view region, const Quantity& baseYearProduction) const = 0;
    virtual YearTable get_company_projected_production(std::span<const CompanyBaseYearInfo> companies) const = 0;
};

class IntensityBenchmarkDataProvider
{
public:
    virtual ~IntensityBenchmarkDataProvider() = default;

    virtual bool is_production_centric() const noexcept = 0;
    virtual Quantity benchmark_global_budget() const = 0;
    virtual Quantity benchmark_temperature() const = 0;

    // Scopes published for exactly this sector and region
    virtual std::vector<Scope> scopes(std::string_view sector, std::string_view region) const = 0;
    // Intensity path for the sector and region, falls back on the global region
    virtual const YearSeries* find_intensity(std::string_view sector, std::string_view region, Scope scope) const noexcept = 0;

    // Allowed intensity of every company following the sectoral decarbonization approach
    virtual YearTable get_SDA_intensity_benchmarks(std::span<const CompanyBaseYearInfo> companies) const = 0;
};

}
