#include "outputwriters.h"
#include "cbudget/constants.h"
#include "cbudgetconfig.h"

#include "infra/exception.h"
#include "infra/log.h"

#include <fmt/compile.h>
#include <fmt/core.h>

namespace cbudget {

using namespace inf;

static std::string year_or_empty(const std::optional<date::year>& year)
{
    if (!year.has_value()) {
        return std::string();
    }

    return std::to_string(static_cast<int>(*year));
}

static std::string quantity_or_empty(const std::optional<Quantity>& quantity, const Unit& unit)
{
    if (!quantity.has_value()) {
        return std::string();
    }

    return fmt::format("{}", quantity->value_in(unit));
}

void write_company_aggregates(const fs::path& path, std::span<const CompanyAggregate> aggregates)
{
    fs::create_directories(path.parent_path());

    const auto emissionsUnit = Unit::parse(constants::emissionsUnit);
    const auto budgetUnit    = Unit::parse(constants::globalBudgetUnit);

    file::Handle fp(path, "wt");
    if (!fp.is_open()) {
        throw RuntimeError("Failed to create output file: {}", path);
    }

    fmt::print(fp, "# cbudget v" CBUDGET_VERSION "\n");
    fmt::print(fp, "company_id;company_name;sector;region;scope;base_year_production;production_unit;ghg_s1s2 [{0}];"
                   "cumulative_trajectory [{0}];cumulative_target [{0}];cumulative_budget [{0}];"
                   "trajectory_exceedance_year;target_exceedance_year;benchmark_global_budget [{1}];benchmark_temperature\n",
               constants::emissionsUnit,
               constants::globalBudgetUnit);

    for (const auto& entry : aggregates) {
        fmt::print(fp, FMT_COMPILE("{};{};{};{};{};{};{};{};{};{};{};{};{};{};{}\n"),
                   entry.companyId,
                   entry.companyName,
                   entry.sector,
                   entry.region,
                   scope_name(entry.scope),
                   entry.baseYearProduction.magnitude(),
                   entry.baseYearProduction.unit(),
                   quantity_or_empty(entry.ghgS1S2, emissionsUnit),
                   entry.cumulativeTrajectory.value_in(emissionsUnit),
                   entry.cumulativeTarget.value_in(emissionsUnit),
                   entry.cumulativeBudget.value_in(emissionsUnit),
                   year_or_empty(entry.trajectoryExceedanceYear),
                   year_or_empty(entry.targetExceedanceYear),
                   entry.benchmarkGlobalBudget.value_in(budgetUnit),
                   entry.benchmarkTemperature);
    }

    Log::info("Wrote {} company results to {}", aggregates.size(), path);
}

}
