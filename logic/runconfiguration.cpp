#include "cbudget/runconfiguration.h"

namespace cbudget {

RunConfiguration::RunConfiguration(Input input,
                                   ProjectionControls controls,
                                   Benchmark benchmark,
                                   bool estimateMissingS3,
                                   std::vector<std::string> companySelection,
                                   const fs::path& outputPath)
: _input(std::move(input))
, _controls(controls)
, _benchmark(std::move(benchmark))
, _estimateMissingS3(estimateMissingS3)
, _companySelection(std::move(companySelection))
, _outputPath(outputPath)
{
}

const fs::path& RunConfiguration::companies_path() const noexcept
{
    return _input.companies;
}

const fs::path& RunConfiguration::company_series_path() const noexcept
{
    return _input.companySeries;
}

const fs::path& RunConfiguration::intensity_benchmark_path() const noexcept
{
    return _input.intensityBenchmark;
}

const fs::path& RunConfiguration::production_benchmark_path() const noexcept
{
    return _input.productionBenchmark;
}

const ProjectionControls& RunConfiguration::projection_controls() const noexcept
{
    return _controls;
}

const RunConfiguration::Benchmark& RunConfiguration::benchmark() const noexcept
{
    return _benchmark;
}

bool RunConfiguration::estimate_missing_s3() const noexcept
{
    return _estimateMissingS3;
}

std::span<const std::string> RunConfiguration::company_selection() const noexcept
{
    return _companySelection;
}

const fs::path& RunConfiguration::output_path() const noexcept
{
    return _outputPath;
}

void RunConfiguration::set_max_concurrency(std::optional<int32_t> concurrency) noexcept
{
    _concurrency = concurrency;
}

std::optional<int32_t> RunConfiguration::max_concurrency() const noexcept
{
    return _concurrency;
}

}
