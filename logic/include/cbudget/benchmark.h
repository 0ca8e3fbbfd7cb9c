#pragma once

#include "cbudget/dataproviders.h"
#include "infra/hash.h"

#include <string>
#include <unordered_map>

namespace cbudget {

struct BenchmarkKey
{
    std::string sector;
    std::string region;

    bool operator==(const BenchmarkKey& other) const noexcept = default;
};

struct ScopedBenchmarkKey
{
    std::string sector;
    std::string region;
    Scope scope = Scope::S1S2;

    bool operator==(const ScopedBenchmarkKey& other) const noexcept = default;
};

}

namespace std {
template <>
struct hash<cbudget::BenchmarkKey>
{
    size_t operator()(const cbudget::BenchmarkKey& key) const
    {
        size_t seed = 0;
        inf::hash_combine(seed, key.sector, key.region);
        return seed;
    }
};

template <>
struct hash<cbudget::ScopedBenchmarkKey>
{
    size_t operator()(const cbudget::ScopedBenchmarkKey& key) const
    {
        size_t seed = 0;
        inf::hash_combine(seed, key.sector, key.region, key.scope);
        return seed;
    }
};
}

namespace cbudget {

/* Emission intensity pathways per sector, region and scope
 * Lookups for a region without data fall back on the global region
 */
class IntensityBenchmark : public IntensityBenchmarkDataProvider
{
public:
    struct Properties
    {
        bool productionCentric = false;
        Quantity globalBudget;
        Quantity temperature;
    };

    IntensityBenchmark(ProjectionControls controls, Properties properties);

    void add_intensity(std::string sector, std::string region, Scope scope, YearSeries intensity);

    bool is_production_centric() const noexcept override;
    Quantity benchmark_global_budget() const override;
    Quantity benchmark_temperature() const override;

    std::vector<Scope> scopes(std::string_view sector, std::string_view region) const override;
    const YearSeries* find_intensity(std::string_view sector, std::string_view region, Scope scope) const noexcept override;

    YearTable get_SDA_intensity_benchmarks(std::span<const CompanyBaseYearInfo> companies) const override;

    // Allowed intensity path of a single company, throws when the benchmark does not cover the company
    YearSeries sda_intensity(const CompanyBaseYearInfo& company) const;

private:
    ProjectionControls _controls;
    Properties _properties;
    std::unordered_map<ScopedBenchmarkKey, YearSeries> _intensities;
};

/* Yearly production growth per sector and region */
class ProductionBenchmark : public ProductionBenchmarkDataProvider
{
public:
    explicit ProductionBenchmark(ProjectionControls controls);

    // Growth factors are dimensionless, 0.02 means 2% growth compared to the previous year
    void add_growth(std::string sector, std::string region, YearSeries growth);

    std::optional<YearSeries> project_production(std::string_view sector, std::string_view region, const Quantity& baseYearProduction) const override;
    YearTable get_company_projected_production(std::span<const CompanyBaseYearInfo> companies) const override;

private:
    const YearSeries* find_growth(std::string_view sector, std::string_view region) const noexcept;

    ProjectionControls _controls;
    std::unordered_map<BenchmarkKey, YearSeries> _growth;
};

}
