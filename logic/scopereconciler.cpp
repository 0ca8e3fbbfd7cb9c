#include "cbudget/scopereconciler.h"
#include "cbudget/errors.h"
#include "runsummary.h"

#include "infra/exception.h"
#include "infra/log.h"

#include <cmath>

namespace cbudget {

using namespace inf;

namespace {

struct FoldContext
{
    const CompanyRecord& company;
    std::string_view dataset;
    RunSummary& summary;
};

std::string year_range(const YearSeries& series)
{
    if (series.empty()) {
        return "no years";
    }

    return fmt::format("{}-{}", static_cast<int>(series.first_year()), static_cast<int>(series.last_year()));
}

// Adds the addend series to the primary series, the primary series is returned unchanged when this is impossible
YearSeries add_scope(const YearSeries& primary, Scope primaryScope, const YearSeries& addend, Scope addendScope, const FoldContext& ctx)
{
    try {
        if (primary.is_aligned_with(addend)) {
            return primary.sum_aligned(addend);
        }

        auto folded = primary.sum_overlap(addend);
        if (folded.empty()) {
            throw IrrecoverableMisalignment("{} {} ({}) and {} ({}) have no years in common for company {}, {} data is ignored",
                                            ctx.dataset, primaryScope, year_range(primary), addendScope, year_range(addend), ctx.company.id, addendScope);
        }

        auto message = fmt::format("{} {} ({}) and {} ({}) are truncated to their common years ({}) for company {}",
                                   ctx.dataset, primaryScope, year_range(primary), addendScope, year_range(addend), year_range(folded), ctx.company.id);
        Log::warn("{}", message);
        ctx.summary.add_issue(IssueCategory::DataRepairApplied, ctx.company.id, primaryScope, std::move(message));
        return folded;
    } catch (const IrrecoverableMisalignment& e) {
        Log::error("{}", e.what());
        ctx.summary.add_issue(IssueCategory::IrrecoverableMisalignment, ctx.company.id, primaryScope, e.what());
    } catch (const UnitMismatch& e) {
        auto message = fmt::format("{} {} cannot be added to {} for company {}: {}", ctx.dataset, addendScope, primaryScope, ctx.company.id, e.what());
        Log::error("{}", message);
        ctx.summary.add_issue(IssueCategory::UnitMismatch, ctx.company.id, primaryScope, std::move(message));
    }

    return primary;
}

YearSeries fold_scope3(const YearSeries& primary, Scope primaryScope, const YearSeries& s3, const FoldContext& ctx)
{
    return add_scope(primary, primaryScope, s3, Scope::S3, ctx);
}

void fold_historic_scope(ScopeBundle<YearSeries>& data, Scope primaryScope, const FoldContext& ctx)
{
    const auto& s3 = *data.get(Scope::S3);
    auto& primary  = data.get(primaryScope);

    if (!primary.has_value() || primary->empty()) {
        primary = s3;
        return;
    }

    primary = fold_scope3(*primary, primaryScope, backcast_scope3(*primary, s3, ctx.company.id), ctx);
}

void fold_historic(ScopeBundle<YearSeries>& data, const FoldContext& ctx)
{
    if (data.has(Scope::S3) && !data.get(Scope::S3)->empty()) {
        fold_historic_scope(data, Scope::S1, ctx);
        fold_historic_scope(data, Scope::S1S2, ctx);
    }

    data.clear(Scope::S3);
    data.clear(Scope::S1S2S3);
}

void fold_trajectories(ScopeBundle<YearSeries>& trajectories, const FoldContext& ctx)
{
    if (trajectories.has(Scope::S3) && !trajectories.get(Scope::S3)->empty()) {
        const auto& s3 = *trajectories.get(Scope::S3);
        for (auto primaryScope : {Scope::S1, Scope::S1S2}) {
            auto& primary = trajectories.get(primaryScope);
            if (!primary.has_value() || primary->empty()) {
                primary = s3;
            } else {
                primary = fold_scope3(*primary, primaryScope, s3, ctx);
            }
        }
    }

    trajectories.clear(Scope::S3);
    trajectories.clear(Scope::S1S2S3);
}

void fold_targets(ScopeBundle<YearSeries>& targets, const FoldContext& ctx)
{
    if (targets.has(Scope::S3) && !targets.get(Scope::S3)->empty()) {
        const auto& s3        = *targets.get(Scope::S3);
        const auto s1Unfolded = targets.get(Scope::S1);

        if (s1Unfolded.has_value()) {
            targets.set(Scope::S1, fold_scope3(*s1Unfolded, Scope::S1, s3, ctx));
        }

        if (targets.has(Scope::S1S2)) {
            targets.set(Scope::S1S2, fold_scope3(*targets.get(Scope::S1S2), Scope::S1S2, s3, ctx));
        } else if (s1Unfolded.has_value()) {
            std::string message;
            YearSeries s1s2;
            if (targets.has(Scope::S2)) {
                message = fmt::format("Scope 1+2 target projections should have been created for {}; repairing", ctx.company.id);
                s1s2    = add_scope(*s1Unfolded, Scope::S1, *targets.get(Scope::S2), Scope::S2, ctx);
            } else {
                message = fmt::format("Scope 2 target projections missing for {}; treating as zero", ctx.company.id);
                s1s2    = *s1Unfolded;
            }

            Log::warn("{}", message);
            ctx.summary.add_issue(IssueCategory::DataRepairApplied, ctx.company.id, Scope::S1S2, std::move(message));
            targets.set(Scope::S1S2, fold_scope3(s1s2, Scope::S1S2, s3, ctx));
        } else if (targets.has(Scope::S2)) {
            auto message = fmt::format("No scope 1 or scope 1+2 target projections for {}; scope 1 treated as zero, using the scope 2 targets", ctx.company.id);
            Log::warn("{}", message);
            ctx.summary.add_issue(IssueCategory::DataRepairApplied, ctx.company.id, Scope::S1S2, std::move(message));
            targets.set(Scope::S1S2, fold_scope3(*targets.get(Scope::S2), Scope::S1S2, s3, ctx));
        } else {
            auto message = fmt::format("No scope 1 or scope 1+2 target projections for {}; using the scope 3 targets", ctx.company.id);
            Log::warn("{}", message);
            ctx.summary.add_issue(IssueCategory::DataRepairApplied, ctx.company.id, Scope::S1S2, std::move(message));
            targets.set(Scope::S1S2, s3);
        }
    }

    targets.clear(Scope::S3);
    targets.clear(Scope::S1S2S3);
}

void fold_emission_totals(CompanyRecord& company, RunSummary& summary)
{
    if (!company.ghgS3.has_value()) {
        return;
    }

    if (std::isfinite(company.ghgS3->magnitude())) {
        try {
            company.ghgS1S2 = company.ghgS1S2.has_value() ? *company.ghgS1S2 + *company.ghgS3 : *company.ghgS3;
        } catch (const UnitMismatch& e) {
            auto message = fmt::format("Scope 3 emissions cannot be added to the scope 1+2 emissions of {}: {}", company.id, e.what());
            Log::error("{}", message);
            summary.add_issue(IssueCategory::UnitMismatch, company.id, Scope::S1S2, std::move(message));
        }
    }

    company.ghgS3.reset();
}

}

YearSeries backcast_scope3(const YearSeries& primary, const YearSeries& s3, std::string_view companyId)
{
    if (s3.empty()) {
        return s3;
    }

    const auto anchor     = s3.first_year();
    const auto firstValue = s3.points().front().value;

    std::vector<YearSeries::Point> preceding;
    for (const auto& point : primary.points()) {
        if (point.year <= anchor) {
            preceding.push_back(point);
        }
    }

    if (preceding.empty()) {
        throw InvariantViolation(std::string(companyId), {anchor}, fmt::format("No data at or before the first scope 3 year {} for company {}", static_cast<int>(anchor), companyId));
    }

    const auto reference = preceding.back();
    if (reference.value == 0.0 || std::isnan(reference.value)) {
        throw InvariantViolation(std::string(companyId), {reference.year}, fmt::format("Invalid reference value for the scope 3 back-cast in {} for company {}", static_cast<int>(reference.year), companyId));
    }

    auto result = s3;
    for (const auto& point : preceding) {
        if (point.year < anchor) {
            result.set_value(point.year, firstValue * point.value / reference.value);
        }
    }

    return result;
}

CompanyRecord reconcile_production_centric(CompanyRecord company, RunSummary& summary)
{
    fold_emission_totals(company, summary);

    fold_historic(company.historicEmissions, FoldContext{company, "Historic emissions", summary});
    fold_historic(company.historicIntensities, FoldContext{company, "Historic intensities", summary});
    fold_trajectories(company.projectedIntensities, FoldContext{company, "Projected intensities", summary});
    fold_targets(company.projectedTargets, FoldContext{company, "Projected targets", summary});

    return company;
}

}
