#pragma once

#include "cbudget/benchmark.h"
#include "cbudget/company.h"
#include "cbudget/projectioncontrols.h"

#include <string>

namespace cbudget::test {

namespace sectors {
const std::string Steel       = "Steel";
const std::string Electricity = "Electricity Utilities";
const std::string Cement      = "Cement";
}

namespace regions {
const std::string Europe       = "Europe";
const std::string NorthAmerica = "North America";
const std::string Global       = "Global";
}

namespace units {
const std::string SteelIntensity  = "t CO2/(t Steel)";
const std::string SteelProduction = "t Steel";
const std::string Emissions       = "Mt CO2";
}

const ProjectionControls ThreeYearHorizon{date::year(2019), date::year(2021)};

inline IntensityBenchmark::Properties benchmark_properties(bool productionCentric = false)
{
    IntensityBenchmark::Properties properties;
    properties.productionCentric = productionCentric;
    properties.globalBudget      = Quantity(396.0, "Gt CO2");
    properties.temperature       = Quantity(1.5, "delta_degC");
    return properties;
}

inline CompanyRecord create_company(std::string id, std::string sector = sectors::Steel, std::string region = regions::Europe)
{
    CompanyRecord company;
    company.id                 = std::move(id);
    company.name               = company.id;
    company.sector             = std::move(sector);
    company.region             = std::move(region);
    company.baseYearProduction = Quantity(1e6, units::SteelProduction);
    return company;
}

}
