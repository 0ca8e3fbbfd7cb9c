#pragma once

#include "cbudget/benchmark.h"
#include "cbudget/company.h"
#include "cbudget/projectioncontrols.h"
#include "infra/filesystem.h"

#include <span>
#include <string_view>
#include <vector>

namespace cbudget {

class RunConfiguration;

enum class SeriesType
{
    HistoricEmissions,
    HistoricIntensity,
    Trajectory,
    Target,
};

std::string_view series_type_name(SeriesType type) noexcept;
SeriesType series_type_from_string(std::string_view str);

// csv columns: company_id;company_name;sector;region;base_year_production;production_unit;ghg_s1s2;ghg_s3;emissions_unit
std::vector<CompanyRecord> parse_companies(const fs::path& companiesCsv);

// csv columns: company_id;type;scope;year;value;unit
// The series are stored in the matching company record, unknown company ids are an error
void parse_company_series(const fs::path& seriesCsv, std::span<CompanyRecord> companies);

// csv columns: sector;region;scope;year;value;unit
IntensityBenchmark parse_intensity_benchmark(const fs::path& benchmarkCsv, ProjectionControls controls, IntensityBenchmark::Properties properties);

// csv columns: sector;region;year;growth
ProductionBenchmark parse_production_benchmark(const fs::path& benchmarkCsv, ProjectionControls controls);

// Companies with their series as configured in the run configuration, limited to the company selection
std::vector<CompanyRecord> load_companies(const RunConfiguration& cfg);

}
