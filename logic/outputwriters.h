#pragma once

#include "cbudget/company.h"
#include "infra/filesystem.h"

#include <span>

namespace cbudget {

// Semicolon separated table with one row per scored company, cumulative values are expressed in Mt CO2
void write_company_aggregates(const fs::path& path, std::span<const CompanyAggregate> aggregates);

}
