#pragma once

#include "cbudget/projectioncontrols.h"
#include "cbudget/units.h"
#include "infra/filesystem.h"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cbudget {

class RunConfiguration
{
public:
    struct Input
    {
        fs::path companies;
        fs::path companySeries;
        fs::path intensityBenchmark;
        fs::path productionBenchmark;
    };

    struct Benchmark
    {
        bool productionCentric = false;
        Quantity globalBudget;
        Quantity temperature;
    };

    RunConfiguration(Input input,
                     ProjectionControls controls,
                     Benchmark benchmark,
                     bool estimateMissingS3,
                     std::vector<std::string> companySelection,
                     const fs::path& outputPath);

    const fs::path& companies_path() const noexcept;
    const fs::path& company_series_path() const noexcept;
    const fs::path& intensity_benchmark_path() const noexcept;
    const fs::path& production_benchmark_path() const noexcept;

    const ProjectionControls& projection_controls() const noexcept;
    const Benchmark& benchmark() const noexcept;
    bool estimate_missing_s3() const noexcept;

    // Companies to score, empty when all companies should be scored
    std::span<const std::string> company_selection() const noexcept;

    const fs::path& output_path() const noexcept;

    void set_max_concurrency(std::optional<int32_t> concurrency) noexcept;
    std::optional<int32_t> max_concurrency() const noexcept;

private:
    Input _input;
    ProjectionControls _controls;
    Benchmark _benchmark;
    bool _estimateMissingS3 = false;
    std::vector<std::string> _companySelection;
    fs::path _outputPath;
    std::optional<int32_t> _concurrency;
};

}
