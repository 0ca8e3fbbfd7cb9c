#include "cbudget/companystore.h"
#include "cbudget/errors.h"

#include "infra/exception.h"
#include "infra/log.h"
#include "infra/string.h"

#include <cmath>

namespace cbudget {

using namespace inf;

CompanyStore::CompanyStore(std::vector<CompanyRecord> companies, ProjectionControls controls)
: _companies(std::move(companies))
, _controls(controls)
{
    for (size_t i = 0; i < _companies.size(); ++i) {
        if (!_index.emplace(_companies[i].id, i).second) {
            throw RuntimeError("Duplicate company id: {}", _companies[i].id);
        }
    }
}

std::vector<std::string> CompanyStore::company_ids() const
{
    std::vector<std::string> result;
    result.reserve(_companies.size());
    for (const auto& company : _companies) {
        result.push_back(company.id);
    }

    return result;
}

const CompanyRecord* CompanyStore::find_company(std::string_view companyId) const noexcept
{
    if (auto iter = _index.find(std::string(companyId)); iter != _index.end()) {
        return &_companies[iter->second];
    }

    return nullptr;
}

std::span<const CompanyRecord> CompanyStore::companies() const noexcept
{
    return _companies;
}

std::vector<CompanyRecord> CompanyStore::get_company_data(std::span<const std::string> companyIds) const
{
    std::vector<CompanyRecord> result;
    std::vector<std::string_view> unknownIds;

    for (const auto& id : companyIds) {
        if (const auto* company = find_company(id); company != nullptr) {
            result.push_back(*company);
        } else {
            unknownIds.push_back(id);
        }
    }

    if (!unknownIds.empty()) {
        Log::warn("No data available for companies: {}", str::join(unknownIds, ", "));
    }

    return result;
}

YearTable CompanyStore::scoring_scope_table(std::span<const std::string> companyIds, ScopeBundle<YearSeries> CompanyRecord::*bundle) const
{
    YearTable result;
    for (const auto& id : companyIds) {
        const auto* company = find_company(id);
        if (company == nullptr || !company->scoringScope.has_value()) {
            continue;
        }

        if (const auto& series = (company->*bundle).get(*company->scoringScope); series.has_value() && !series->empty()) {
            result.add_row(RowId{company->id, *company->scoringScope}, series->restricted_to(_controls.horizon()));
        }
    }

    return result;
}

YearTable CompanyStore::get_company_projected_trajectories(std::span<const std::string> companyIds) const
{
    return scoring_scope_table(companyIds, &CompanyRecord::projectedIntensities);
}

YearTable CompanyStore::get_company_projected_targets(std::span<const std::string> companyIds) const
{
    return scoring_scope_table(companyIds, &CompanyRecord::projectedTargets);
}

static std::optional<Quantity> value_at(const std::optional<YearSeries>& series, date::year year)
{
    std::optional<Quantity> result;
    if (series.has_value()) {
        if (auto value = series->try_value(year); value.has_value() && !std::isnan(*value)) {
            result = Quantity(*value, series->unit());
        }
    }

    return result;
}

static Quantity base_year_intensity(const CompanyRecord& company, Scope scope, date::year baseYear)
{
    if (auto intensity = value_at(company.historicIntensities.get(scope), baseYear); intensity.has_value()) {
        return *intensity;
    }

    if (auto intensity = value_at(company.projectedIntensities.get(scope), baseYear); intensity.has_value()) {
        return *intensity;
    }

    if (auto emissions = value_at(company.historicEmissions.get(scope), baseYear); emissions.has_value()) {
        return *emissions / company.baseYearProduction;
    }

    if (scope == Scope::S1S2 && company.ghgS1S2.has_value() && !company.ghgS1S2->is_nan()) {
        return *company.ghgS1S2 / company.baseYearProduction;
    }

    throw InvariantViolation(company.id, {baseYear}, fmt::format("No {} intensity available for company {} in base year {}", scope, company.id, static_cast<int>(baseYear)));
}

std::vector<CompanyBaseYearInfo> CompanyStore::get_company_intensity_and_production_at_base_year(std::span<const std::string> companyIds) const
{
    std::vector<CompanyBaseYearInfo> result;
    for (const auto& id : companyIds) {
        const auto* company = find_company(id);
        if (company == nullptr || !company->scoringScope.has_value()) {
            continue;
        }

        CompanyBaseYearInfo info;
        info.companyId  = company->id;
        info.sector     = company->sector;
        info.region     = company->region;
        info.scope      = *company->scoringScope;
        info.intensity  = base_year_intensity(*company, info.scope, _controls.baseYear);
        info.production = company->baseYearProduction;
        result.push_back(std::move(info));
    }

    return result;
}

const ProjectionControls& CompanyStore::projection_controls() const noexcept
{
    return _controls;
}

}
