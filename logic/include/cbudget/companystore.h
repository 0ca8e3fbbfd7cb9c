#pragma once

#include "cbudget/dataproviders.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cbudget {

/* In memory company data, only companies with a scoring scope have trajectories, targets and base year info */
class CompanyStore : public CompanyDataProvider
{
public:
    CompanyStore() = default;
    CompanyStore(std::vector<CompanyRecord> companies, ProjectionControls controls);

    std::vector<std::string> company_ids() const;
    const CompanyRecord* find_company(std::string_view companyId) const noexcept;
    std::span<const CompanyRecord> companies() const noexcept;

    std::vector<CompanyRecord> get_company_data(std::span<const std::string> companyIds) const override;
    YearTable get_company_projected_trajectories(std::span<const std::string> companyIds) const override;
    YearTable get_company_projected_targets(std::span<const std::string> companyIds) const override;
    std::vector<CompanyBaseYearInfo> get_company_intensity_and_production_at_base_year(std::span<const std::string> companyIds) const override;

    const ProjectionControls& projection_controls() const noexcept override;

private:
    YearTable scoring_scope_table(std::span<const std::string> companyIds, ScopeBundle<YearSeries> CompanyRecord::*bundle) const;

    std::vector<CompanyRecord> _companies;
    std::unordered_map<std::string, size_t> _index;
    ProjectionControls _controls;
};

}
