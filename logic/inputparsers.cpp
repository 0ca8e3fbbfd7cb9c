#include "cbudget/inputparsers.h"
#include "cbudget/runconfiguration.h"

#include "infra/chrono.h"
#include "infra/exception.h"
#include "infra/log.h"
#include "infra/string.h"

#include <cmath>
#include <csv.h>
#include <limits>
#include <map>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace cbudget {

using namespace inf;

namespace {

struct SeriesPoints
{
    std::string unit;
    std::vector<YearSeries::Point> points;
};

}

std::string_view series_type_name(SeriesType type) noexcept
{
    switch (type) {
    case SeriesType::HistoricEmissions:
        return "historic_emissions";
    case SeriesType::HistoricIntensity:
        return "historic_intensity";
    case SeriesType::Trajectory:
        return "trajectory";
    case SeriesType::Target:
        return "target";
    }

    return "";
}

SeriesType series_type_from_string(std::string_view str)
{
    const auto trimmed = str::trimmed_view(str);
    for (auto type : {SeriesType::HistoricEmissions, SeriesType::HistoricIntensity, SeriesType::Trajectory, SeriesType::Target}) {
        if (str::iequals(trimmed, series_type_name(type))) {
            return type;
        }
    }

    throw RuntimeError("Invalid series type: '{}'", str);
}

static double to_double(const char* valueString)
{
    if (valueString == nullptr) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    std::string_view trimmed = str::trimmed_view(valueString);
    if (trimmed.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    if (auto value = str::to_double(trimmed); value.has_value()) {
        return *value;
    }

    throw RuntimeError("Invalid numeric value: {}", valueString);
}

static std::string_view to_string_view(const char* value) noexcept
{
    return value == nullptr ? std::string_view() : str::trimmed_view(value);
}

static void add_point(SeriesPoints& series, std::string_view unit, date::year year, double value)
{
    if (series.points.empty()) {
        series.unit = unit;
    } else if (series.unit != unit) {
        throw RuntimeError("Unit '{}' differs from the unit of the previous values '{}'", unit, series.unit);
    }

    series.points.push_back(YearSeries::Point{year, value});
}

static YearSeries to_year_series(SeriesPoints series)
{
    return YearSeries(Unit::parse(series.unit), std::move(series.points));
}

std::vector<CompanyRecord> parse_companies(const fs::path& companiesCsv)
{
    try {
        Log::debug("Parse companies: {}", companiesCsv);

        std::vector<CompanyRecord> result;
        std::unordered_set<std::string> ids;

        using namespace io;
        CSVReader<9, trim_chars<' ', '\t'>, no_quote_escape<';'>, throw_on_overflow, single_line_comment<'#'>> in(str::from_u8(companiesCsv.u8string()));
        in.read_header(ignore_missing_column | ignore_extra_column,
                       "company_id",
                       "company_name",
                       "sector",
                       "region",
                       "base_year_production",
                       "production_unit",
                       "ghg_s1s2",
                       "ghg_s3",
                       "emissions_unit");

        for (const auto* column : {"company_id", "sector", "region", "base_year_production", "production_unit", "ghg_s1s2", "emissions_unit"}) {
            if (!in.has_column(column)) {
                throw RuntimeError("Missing '{}' column", column);
            }
        }

        char *id = nullptr, *name = nullptr, *sector = nullptr, *region = nullptr, *production = nullptr, *productionUnit = nullptr;
        char *ghgS1S2 = nullptr, *ghgS3 = nullptr, *emissionsUnit = nullptr;
        while (in.read_row(id, name, sector, region, production, productionUnit, ghgS1S2, ghgS3, emissionsUnit)) {
            try {
                CompanyRecord company;
                company.id     = to_string_view(id);
                company.name   = to_string_view(name);
                company.sector = to_string_view(sector);
                company.region = to_string_view(region);

                if (company.id.empty()) {
                    throw RuntimeError("Empty company id");
                }

                if (!ids.insert(company.id).second) {
                    throw RuntimeError("Duplicate company id: {}", company.id);
                }

                if (company.name.empty()) {
                    company.name = company.id;
                }

                company.baseYearProduction = Quantity(to_double(production), to_string_view(productionUnit));

                const auto emissionUnit = Unit::parse(to_string_view(emissionsUnit));
                if (auto value = to_double(ghgS1S2); !std::isnan(value)) {
                    company.ghgS1S2 = Quantity(value, emissionUnit);
                }

                if (auto value = to_double(ghgS3); !std::isnan(value)) {
                    company.ghgS3 = Quantity(value, emissionUnit);
                }

                result.push_back(std::move(company));
            } catch (const std::exception& e) {
                throw RuntimeError("{} (line {})", e.what(), in.get_file_line());
            }
        }

        Log::debug("Parsed {} companies", result.size());
        return result;
    } catch (const std::exception& e) {
        throw RuntimeError("Error parsing {} ({})", companiesCsv, e.what());
    }
}

static ScopeBundle<YearSeries>& series_bundle(CompanyRecord& company, SeriesType type) noexcept
{
    switch (type) {
    case SeriesType::HistoricEmissions:
        return company.historicEmissions;
    case SeriesType::HistoricIntensity:
        return company.historicIntensities;
    case SeriesType::Trajectory:
        return company.projectedIntensities;
    case SeriesType::Target:
        break;
    }

    return company.projectedTargets;
}

void parse_company_series(const fs::path& seriesCsv, std::span<CompanyRecord> companies)
{
    try {
        Log::debug("Parse company series: {}", seriesCsv);

        std::unordered_map<std::string_view, CompanyRecord*> companyLookup;
        for (auto& company : companies) {
            companyLookup.emplace(company.id, &company);
        }

        std::map<std::tuple<CompanyRecord*, SeriesType, Scope>, SeriesPoints> series;

        using namespace io;
        CSVReader<6, trim_chars<' ', '\t'>, no_quote_escape<';'>, throw_on_overflow, single_line_comment<'#'>> in(str::from_u8(seriesCsv.u8string()));
        in.read_header(ignore_extra_column, "company_id", "type", "scope", "year", "value", "unit");

        int32_t year;
        char *id, *type, *scope, *value, *unit;
        while (in.read_row(id, type, scope, year, value, unit)) {
            try {
                auto iter = companyLookup.find(to_string_view(id));
                if (iter == companyLookup.end()) {
                    throw RuntimeError("Unknown company id: {}", id);
                }

                auto& points = series[std::make_tuple(iter->second, series_type_from_string(type), scope_from_string(scope))];
                add_point(points, to_string_view(unit), date::year(year), to_double(value));
            } catch (const std::exception& e) {
                throw RuntimeError("{} (line {})", e.what(), in.get_file_line());
            }
        }

        for (auto& [key, points] : series) {
            auto& [company, seriesType, seriesScope] = key;

            try {
                series_bundle(*company, seriesType).set(seriesScope, to_year_series(std::move(points)));
            } catch (const std::exception& e) {
                throw RuntimeError("Invalid {} {} series of company {}: {}", series_type_name(seriesType), seriesScope, company->id, e.what());
            }
        }
    } catch (const std::exception& e) {
        throw RuntimeError("Error parsing {} ({})", seriesCsv, e.what());
    }
}

IntensityBenchmark parse_intensity_benchmark(const fs::path& benchmarkCsv, ProjectionControls controls, IntensityBenchmark::Properties properties)
{
    try {
        Log::debug("Parse intensity benchmark: {}", benchmarkCsv);

        std::map<std::tuple<std::string, std::string, Scope>, SeriesPoints> series;

        using namespace io;
        CSVReader<6, trim_chars<' ', '\t'>, no_quote_escape<';'>, throw_on_overflow, single_line_comment<'#'>> in(str::from_u8(benchmarkCsv.u8string()));
        in.read_header(ignore_extra_column, "sector", "region", "scope", "year", "value", "unit");

        int32_t year;
        char *sector, *region, *scope, *value, *unit;
        while (in.read_row(sector, region, scope, year, value, unit)) {
            try {
                auto& points = series[std::make_tuple(std::string(to_string_view(sector)), std::string(to_string_view(region)), scope_from_string(scope))];
                add_point(points, to_string_view(unit), date::year(year), to_double(value));
            } catch (const std::exception& e) {
                throw RuntimeError("{} (line {})", e.what(), in.get_file_line());
            }
        }

        IntensityBenchmark result(controls, std::move(properties));
        for (auto& [key, points] : series) {
            auto& [sectorName, regionName, scopeValue] = key;

            try {
                result.add_intensity(sectorName, regionName, scopeValue, to_year_series(std::move(points)));
            } catch (const std::exception& e) {
                throw RuntimeError("Invalid benchmark for {} - {} - {}: {}", sectorName, regionName, scopeValue, e.what());
            }
        }

        Log::debug("Parsed {} intensity benchmark pathways", series.size());
        return result;
    } catch (const std::exception& e) {
        throw RuntimeError("Error parsing {} ({})", benchmarkCsv, e.what());
    }
}

ProductionBenchmark parse_production_benchmark(const fs::path& benchmarkCsv, ProjectionControls controls)
{
    try {
        Log::debug("Parse production benchmark: {}", benchmarkCsv);

        std::map<std::tuple<std::string, std::string>, SeriesPoints> series;

        using namespace io;
        CSVReader<4, trim_chars<' ', '\t'>, no_quote_escape<';'>, throw_on_overflow, single_line_comment<'#'>> in(str::from_u8(benchmarkCsv.u8string()));
        in.read_header(ignore_extra_column, "sector", "region", "year", "growth");

        int32_t year;
        char *sector, *region, *growth;
        while (in.read_row(sector, region, year, growth)) {
            try {
                auto& points = series[std::make_tuple(std::string(to_string_view(sector)), std::string(to_string_view(region)))];
                add_point(points, "dimensionless", date::year(year), to_double(growth));
            } catch (const std::exception& e) {
                throw RuntimeError("{} (line {})", e.what(), in.get_file_line());
            }
        }

        ProductionBenchmark result(controls);
        for (auto& [key, points] : series) {
            auto& [sectorName, regionName] = key;

            try {
                result.add_growth(sectorName, regionName, YearSeries(Unit::dimensionless(), std::move(points.points)));
            } catch (const std::exception& e) {
                throw RuntimeError("Invalid production growth for {} - {}: {}", sectorName, regionName, e.what());
            }
        }

        return result;
    } catch (const std::exception& e) {
        throw RuntimeError("Error parsing {} ({})", benchmarkCsv, e.what());
    }
}

std::vector<CompanyRecord> load_companies(const RunConfiguration& cfg)
{
    chrono::ScopedDurationLog d("Load company data");

    auto companies = parse_companies(cfg.companies_path());
    parse_company_series(cfg.company_series_path(), companies);

    const auto selection = cfg.company_selection();
    if (selection.empty()) {
        return companies;
    }

    std::unordered_set<std::string_view> selected(selection.begin(), selection.end());

    std::unordered_set<std::string_view> known;
    for (const auto& company : companies) {
        known.insert(company.id);
    }

    std::vector<std::string_view> unknownIds;
    for (const auto& id : selection) {
        if (known.count(id) == 0) {
            unknownIds.push_back(id);
        }
    }

    if (!unknownIds.empty()) {
        Log::warn("Selected companies not present in the input: {}", str::join(unknownIds, ", "));
    }

    std::vector<CompanyRecord> result;
    for (auto& company : companies) {
        if (selected.count(company.id) > 0) {
            result.push_back(std::move(company));
        }
    }

    Log::info("Scoring {} of {} companies", result.size(), companies.size());
    return result;
}

}
