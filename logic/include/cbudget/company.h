#pragma once

#include "cbudget/scope.h"
#include "cbudget/units.h"
#include "cbudget/yearseries.h"

#include <date/date.h>
#include <optional>
#include <string>

namespace cbudget {

struct CompanyRecord
{
    std::string id;
    std::string name;
    std::string sector;
    std::string region;

    Quantity baseYearProduction;
    std::optional<Quantity> ghgS1S2;
    std::optional<Quantity> ghgS3;

    ScopeBundle<YearSeries> historicEmissions;
    ScopeBundle<YearSeries> historicIntensities;
    ScopeBundle<YearSeries> projectedIntensities;
    ScopeBundle<YearSeries> projectedTargets;

    // Scope under which the benchmark scores the company, unset until resolved
    std::optional<Scope> scoringScope;
};

// Base year facts of a company for its scoring scope
struct CompanyBaseYearInfo
{
    std::string companyId;
    std::string sector;
    std::string region;
    Scope scope = Scope::S1S2;
    Quantity intensity;
    Quantity production;
};

struct CompanyAggregate
{
    std::string companyId;
    std::string companyName;
    std::string sector;
    std::string region;
    Scope scope = Scope::S1S2;

    Quantity baseYearProduction;
    std::optional<Quantity> ghgS1S2;

    Quantity cumulativeTrajectory;
    Quantity cumulativeTarget;
    Quantity cumulativeBudget;

    // Unset when the company stays within its budget up to the target year
    std::optional<date::year> trajectoryExceedanceYear;
    std::optional<date::year> targetExceedanceYear;

    Quantity benchmarkGlobalBudget;
    Quantity benchmarkTemperature;
};

}
