#include "cbudget/errors.h"
#include "cbudget/scopereconciler.h"
#include "runsummary.h"
#include "testconstants.h"
#include "testprinters.h"

#include <doctest/doctest.h>
#include <limits>

namespace cbudget::test {

using namespace inf;
using namespace date;
using namespace doctest;

static void check_series(const std::optional<YearSeries>& actual, const YearSeries& expected)
{
    REQUIRE(actual.has_value());
    CHECK(actual->unit() == expected.unit());
    REQUIRE(actual->years() == expected.years());
    for (const auto& point : expected.points()) {
        CHECK(actual->value(point.year) == Approx(point.value));
    }
}

TEST_CASE("Production centric reconciliation")
{
    RunSummary summary;
    auto company = create_company("A");

    SUBCASE("aligned scope 3 data is added to S1 and S1S2")
    {
        company.ghgS1S2 = Quantity(15.0, units::Emissions);
        company.ghgS3   = Quantity(5000.0, "kt CO2");

        company.historicEmissions.set(Scope::S1, YearSeries(2019_y, {10.0, 11.0, 12.0}, units::Emissions));
        company.historicEmissions.set(Scope::S1S2, YearSeries(2019_y, {15.0, 16.0, 17.0}, units::Emissions));
        company.historicEmissions.set(Scope::S3, YearSeries(2019_y, {5.0, 5.0, 5.0}, units::Emissions));
        company.historicEmissions.set(Scope::S1S2S3, YearSeries(2019_y, {20.0, 21.0, 22.0}, units::Emissions));

        company.projectedIntensities.set(Scope::S1S2, YearSeries(2019_y, {2.0, 1.8, 1.6}, units::SteelIntensity));
        company.projectedIntensities.set(Scope::S3, YearSeries(2019_y, {0.5, 0.5, 0.5}, units::SteelIntensity));

        const auto reconciled = reconcile_production_centric(company, summary);

        check_series(reconciled.historicEmissions.get(Scope::S1), YearSeries(2019_y, {15.0, 16.0, 17.0}, units::Emissions));
        check_series(reconciled.historicEmissions.get(Scope::S1S2), YearSeries(2019_y, {20.0, 21.0, 22.0}, units::Emissions));
        CHECK_FALSE(reconciled.historicEmissions.has(Scope::S3));
        CHECK_FALSE(reconciled.historicEmissions.has(Scope::S1S2S3));

        // without S1 trajectory the S3 trajectory becomes the S1 trajectory
        check_series(reconciled.projectedIntensities.get(Scope::S1), YearSeries(2019_y, {0.5, 0.5, 0.5}, units::SteelIntensity));
        check_series(reconciled.projectedIntensities.get(Scope::S1S2), YearSeries(2019_y, {2.5, 2.3, 2.1}, units::SteelIntensity));
        CHECK_FALSE(reconciled.projectedIntensities.has(Scope::S3));

        REQUIRE(reconciled.ghgS1S2.has_value());
        CHECK(reconciled.ghgS1S2->value_in(Unit::parse(units::Emissions)) == Approx(20.0));
        CHECK_FALSE(reconciled.ghgS3.has_value());

        CHECK(summary.issues().empty());
    }

    SUBCASE("reconciliation is idempotent")
    {
        company.ghgS1S2 = Quantity(15.0, units::Emissions);
        company.ghgS3   = Quantity(5.0, units::Emissions);
        company.historicEmissions.set(Scope::S1S2, YearSeries(2017_y, {8.0, 9.0, 10.0, 11.0, 12.0}, units::Emissions));
        company.historicEmissions.set(Scope::S3, YearSeries(2019_y, {4.0, 4.0, 4.0}, units::Emissions));
        company.projectedIntensities.set(Scope::S1S2, YearSeries(2019_y, {2.0, 1.8, 1.6}, units::SteelIntensity));
        company.projectedIntensities.set(Scope::S3, YearSeries(2020_y, {0.5, 0.5, 0.5}, units::SteelIntensity));
        company.projectedTargets.set(Scope::S1, YearSeries(2019_y, {1.0, 0.9}, units::SteelIntensity));
        company.projectedTargets.set(Scope::S3, YearSeries(2019_y, {0.5, 0.4}, units::SteelIntensity));

        const auto once = reconcile_production_centric(company, summary);
        const auto issueCount = summary.issues().size();

        const auto twice = reconcile_production_centric(once, summary);
        CHECK(twice.historicEmissions == once.historicEmissions);
        CHECK(twice.historicIntensities == once.historicIntensities);
        CHECK(twice.projectedIntensities == once.projectedIntensities);
        CHECK(twice.projectedTargets == once.projectedTargets);
        REQUIRE(twice.ghgS1S2.has_value());
        CHECK(twice.ghgS1S2->magnitude() == once.ghgS1S2->magnitude());
        CHECK(summary.issues().size() == issueCount);
    }

    SUBCASE("historic scope 3 is back-cast over the earlier primary years")
    {
        company.historicEmissions.set(Scope::S1S2, YearSeries(2017_y, {8.0, 9.0, 10.0, 11.0, 12.0}, units::Emissions));
        company.historicEmissions.set(Scope::S3, YearSeries(2019_y, {4.0, 4.0, 4.0}, units::Emissions));

        const auto reconciled = reconcile_production_centric(company, summary);
        check_series(reconciled.historicEmissions.get(Scope::S1S2), YearSeries(2017_y, {11.2, 12.6, 14.0, 15.0, 16.0}, units::Emissions));
        CHECK(summary.issues().empty());
    }

    SUBCASE("historic data that cannot be back-cast")
    {
        company.historicEmissions.set(Scope::S1S2, YearSeries(2020_y, {10.0, 11.0}, units::Emissions));
        company.historicEmissions.set(Scope::S3, YearSeries(2019_y, {4.0, 4.0, 4.0}, units::Emissions));

        CHECK_THROWS_AS(reconcile_production_centric(company, summary), InvariantViolation);
    }

    SUBCASE("misaligned trajectories are summed over their common years")
    {
        company.projectedIntensities.set(Scope::S1S2, YearSeries(2019_y, {2.0, 1.8, 1.6, 1.4}, units::SteelIntensity));
        company.projectedIntensities.set(Scope::S3, YearSeries(2020_y, {0.5, 0.5, 0.5, 0.5}, units::SteelIntensity));

        const auto reconciled = reconcile_production_centric(company, summary);
        check_series(reconciled.projectedIntensities.get(Scope::S1S2), YearSeries(2020_y, {2.3, 2.1, 1.9}, units::SteelIntensity));
        CHECK(summary.issue_count(IssueCategory::DataRepairApplied) == 1);
    }

    SUBCASE("disjoint trajectories keep the primary data")
    {
        company.projectedIntensities.set(Scope::S1S2, YearSeries(2019_y, {2.0, 1.8}, units::SteelIntensity));
        company.projectedIntensities.set(Scope::S3, YearSeries(2025_y, {0.5, 0.5}, units::SteelIntensity));

        const auto reconciled = reconcile_production_centric(company, summary);
        check_series(reconciled.projectedIntensities.get(Scope::S1S2), YearSeries(2019_y, {2.0, 1.8}, units::SteelIntensity));
        CHECK_FALSE(reconciled.projectedIntensities.has(Scope::S3));

        const auto issues = summary.issues(IssueCategory::IrrecoverableMisalignment);
        REQUIRE(issues.size() == 1);
        CHECK(issues.front().companyId == "A");
        CHECK(issues.front().scope == Scope::S1S2);
    }

    SUBCASE("incompatible units keep the primary data")
    {
        company.projectedIntensities.set(Scope::S1S2, YearSeries(2019_y, {2.0, 1.8}, units::SteelIntensity));
        company.projectedIntensities.set(Scope::S3, YearSeries(2019_y, {0.5, 0.5}, "t CO2/GJ"));

        const auto reconciled = reconcile_production_centric(company, summary);
        check_series(reconciled.projectedIntensities.get(Scope::S1S2), YearSeries(2019_y, {2.0, 1.8}, units::SteelIntensity));
        CHECK(summary.issue_count(IssueCategory::UnitMismatch) == 1);
    }

    SUBCASE("S1S2 target synthesized from S1 and S2")
    {
        company.projectedTargets.set(Scope::S1, YearSeries(2019_y, {10.0, 9.0, 8.0}, units::SteelIntensity));
        company.projectedTargets.set(Scope::S2, YearSeries(2019_y, {1.0, 1.0, 1.0}, units::SteelIntensity));
        company.projectedTargets.set(Scope::S3, YearSeries(2019_y, {2.0, 2.0, 2.0}, units::SteelIntensity));

        const auto reconciled = reconcile_production_centric(company, summary);
        check_series(reconciled.projectedTargets.get(Scope::S1), YearSeries(2019_y, {12.0, 11.0, 10.0}, units::SteelIntensity));
        check_series(reconciled.projectedTargets.get(Scope::S1S2), YearSeries(2019_y, {13.0, 12.0, 11.0}, units::SteelIntensity));
        CHECK_FALSE(reconciled.projectedTargets.has(Scope::S3));
        CHECK(summary.issue_count(IssueCategory::DataRepairApplied) == 1);
    }

    SUBCASE("S1S2 target synthesized from S1 without S2")
    {
        company.projectedTargets.set(Scope::S1, YearSeries(2019_y, {10.0, 9.0, 8.0}, units::SteelIntensity));
        company.projectedTargets.set(Scope::S3, YearSeries(2019_y, {2.0, 2.0, 2.0}, units::SteelIntensity));

        const auto reconciled = reconcile_production_centric(company, summary);
        check_series(reconciled.projectedTargets.get(Scope::S1), YearSeries(2019_y, {12.0, 11.0, 10.0}, units::SteelIntensity));
        check_series(reconciled.projectedTargets.get(Scope::S1S2), YearSeries(2019_y, {12.0, 11.0, 10.0}, units::SteelIntensity));
        CHECK(summary.issue_count(IssueCategory::DataRepairApplied) == 1);
    }

    SUBCASE("only scope 3 targets")
    {
        company.projectedTargets.set(Scope::S3, YearSeries(2019_y, {2.0, 2.0, 2.0}, units::SteelIntensity));

        const auto reconciled = reconcile_production_centric(company, summary);
        check_series(reconciled.projectedTargets.get(Scope::S1S2), YearSeries(2019_y, {2.0, 2.0, 2.0}, units::SteelIntensity));
        CHECK_FALSE(reconciled.projectedTargets.has(Scope::S1));
        CHECK(summary.issue_count(IssueCategory::DataRepairApplied) == 1);
    }

    SUBCASE("S1S2 target synthesized from S2 without S1")
    {
        company.projectedTargets.set(Scope::S2, YearSeries(2019_y, {1.0, 1.0, 1.0}, units::SteelIntensity));
        company.projectedTargets.set(Scope::S3, YearSeries(2019_y, {2.0, 2.0, 2.0}, units::SteelIntensity));

        const auto reconciled = reconcile_production_centric(company, summary);
        check_series(reconciled.projectedTargets.get(Scope::S1S2), YearSeries(2019_y, {3.0, 3.0, 3.0}, units::SteelIntensity));
        CHECK_FALSE(reconciled.projectedTargets.has(Scope::S1));
        CHECK_FALSE(reconciled.projectedTargets.has(Scope::S3));
        REQUIRE(summary.issue_count(IssueCategory::DataRepairApplied) == 1);
        CHECK(summary.issues(IssueCategory::DataRepairApplied).front().scope == Scope::S1S2);
    }

    SUBCASE("empty scope 3 projections are not folded")
    {
        company.projectedIntensities.set(Scope::S1S2, YearSeries(2019_y, {2.0, 1.8}, units::SteelIntensity));
        company.projectedIntensities.set(Scope::S3, YearSeries(Unit::parse(units::SteelIntensity)));
        company.projectedTargets.set(Scope::S3, YearSeries(Unit::parse(units::SteelIntensity)));

        const auto reconciled = reconcile_production_centric(company, summary);
        check_series(reconciled.projectedIntensities.get(Scope::S1S2), YearSeries(2019_y, {2.0, 1.8}, units::SteelIntensity));
        CHECK_FALSE(reconciled.projectedIntensities.has(Scope::S1));
        CHECK_FALSE(reconciled.projectedIntensities.has(Scope::S3));
        CHECK_FALSE(reconciled.projectedTargets.has(Scope::S1S2));
        CHECK_FALSE(reconciled.projectedTargets.has(Scope::S3));
        CHECK(summary.issues().empty());
    }

    SUBCASE("non finite scope 3 emissions are not added")
    {
        company.ghgS1S2 = Quantity(15.0, units::Emissions);
        company.ghgS3   = Quantity(std::numeric_limits<double>::infinity(), units::Emissions);

        const auto reconciled = reconcile_production_centric(company, summary);
        REQUIRE(reconciled.ghgS1S2.has_value());
        CHECK(reconciled.ghgS1S2->magnitude() == Approx(15.0));
        CHECK_FALSE(reconciled.ghgS3.has_value());
    }

    SUBCASE("company without scope 3 data is unchanged")
    {
        company.ghgS1S2 = Quantity(15.0, units::Emissions);
        company.historicEmissions.set(Scope::S1S2, YearSeries(2019_y, {15.0, 16.0}, units::Emissions));
        company.projectedTargets.set(Scope::S1S2, YearSeries(2019_y, {1.0, 0.9}, units::SteelIntensity));

        const auto reconciled = reconcile_production_centric(company, summary);
        CHECK(reconciled.historicEmissions == company.historicEmissions);
        CHECK(reconciled.projectedTargets == company.projectedTargets);
        CHECK(reconciled.ghgS1S2->magnitude() == 15.0);
        CHECK(summary.issues().empty());
    }
}

TEST_CASE("Scope 3 back-cast")
{
    const YearSeries primary(2017_y, {8.0, 9.0, 10.0, 11.0, 12.0}, units::Emissions);

    SUBCASE("values follow the shape of the primary series")
    {
        const auto backcast = backcast_scope3(primary, YearSeries(2019_y, {4.0, 4.0, 4.0}, units::Emissions), "A");
        check_series(backcast, YearSeries(2017_y, {3.2, 3.6, 4.0, 4.0, 4.0}, units::Emissions));
    }

    SUBCASE("reference is the last primary year before the first scope 3 year")
    {
        const YearSeries gapped(Unit::parse(units::Emissions), {{2016_y, 5.0}, {2018_y, 10.0}, {2021_y, 12.0}});
        const auto backcast = backcast_scope3(gapped, YearSeries(2019_y, {4.0, 4.0}, units::Emissions), "A");
        check_series(backcast, YearSeries(Unit::parse(units::Emissions), {{2016_y, 2.0}, {2018_y, 4.0}, {2019_y, 4.0}, {2020_y, 4.0}}));
    }

    SUBCASE("scope 3 series starting before the primary series")
    {
        CHECK_THROWS_AS(backcast_scope3(primary, YearSeries(2015_y, {4.0}, units::Emissions), "A"), InvariantViolation);
    }

    SUBCASE("zero reference value")
    {
        const YearSeries zeroes(2018_y, {0.0, 0.0}, units::Emissions);
        CHECK_THROWS_AS(backcast_scope3(zeroes, YearSeries(2019_y, {4.0}, units::Emissions), "A"), InvariantViolation);
    }

    SUBCASE("empty scope 3 series")
    {
        CHECK(backcast_scope3(primary, YearSeries(Unit::parse(units::Emissions)), "A").empty());
    }
}

}
