#pragma once

#include "cbudget/company.h"
#include "cbudget/dataproviders.h"

#include <optional>
#include <vector>

namespace cbudget {

class RunSummary;

/* Scope under which the benchmark scores the company
 * The benchmark is consulted for the region of the company first and for the global region next
 * When several scopes are published the first one of ScopePriority wins
 */
std::optional<Scope> resolve_scope(const CompanyRecord& company, const IntensityBenchmarkDataProvider& benchmark);

// Assigns the scoring scope to every company, unresolvable companies are dropped
std::vector<CompanyRecord> resolve_scopes(std::vector<CompanyRecord> companies, const IntensityBenchmarkDataProvider& benchmark, RunSummary& summary);

}
