#include "cbudget/scoperesolver.h"
#include "cbudget/constants.h"
#include "runsummary.h"

#include "infra/algo.h"
#include "infra/log.h"
#include "infra/string.h"

namespace cbudget {

using namespace inf;

std::optional<Scope> resolve_scope(const CompanyRecord& company, const IntensityBenchmarkDataProvider& benchmark)
{
    auto scopes = benchmark.scopes(company.sector, company.region);
    if (scopes.empty()) {
        scopes = benchmark.scopes(company.sector, constants::globalRegion);
    }

    if (scopes.size() == 1) {
        return scopes.front();
    }

    for (auto scope : ScopePriority) {
        if (find_in_container(scopes, scope) != nullptr) {
            return scope;
        }
    }

    return {};
}

std::vector<CompanyRecord> resolve_scopes(std::vector<CompanyRecord> companies, const IntensityBenchmarkDataProvider& benchmark, RunSummary& summary)
{
    std::vector<CompanyRecord> result;
    result.reserve(companies.size());

    std::vector<std::string> unresolved;
    for (auto& company : companies) {
        if (auto scope = resolve_scope(company, benchmark); scope.has_value()) {
            company.scoringScope = scope;
            result.push_back(std::move(company));
        } else {
            summary.add_issue(IssueCategory::UnresolvableScope, company.id, {}, fmt::format("No benchmark scope for sector '{}' in region '{}'", company.sector, company.region));
            unresolved.push_back(company.id);
        }
    }

    if (!unresolved.empty()) {
        Log::warn("The benchmark does not cover {} companies, they are excluded: {}", unresolved.size(), str::join(unresolved, ", "));
    }

    return result;
}

}
