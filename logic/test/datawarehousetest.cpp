#include "cbudget/benchmark.h"
#include "cbudget/datawarehouse.h"
#include "runsummary.h"
#include "testconstants.h"
#include "testprinters.h"

#include "infra/math.h"

#include <doctest/doctest.h>

namespace cbudget::test {

using namespace inf;
using namespace date;
using namespace doctest;

static CompanyRecord create_scored_company(std::string id, std::initializer_list<double> trajectory, std::initializer_list<double> target)
{
    auto company = create_company(std::move(id));
    company.projectedIntensities.set(Scope::S1S2, YearSeries(2019_y, trajectory, units::SteelIntensity));
    if (target.size() > 0) {
        company.projectedTargets.set(Scope::S1S2, YearSeries(2019_y, target, units::SteelIntensity));
    }

    return company;
}

static const CompanyAggregate* find_aggregate(const std::vector<CompanyAggregate>& aggregates, std::string_view id)
{
    for (const auto& aggregate : aggregates) {
        if (aggregate.companyId == id) {
            return &aggregate;
        }
    }

    return nullptr;
}

TEST_CASE("Data warehouse")
{
    RunSummary summary;

    IntensityBenchmark intensityBenchmark(ThreeYearHorizon, benchmark_properties());
    intensityBenchmark.add_intensity(sectors::Steel, regions::Global, Scope::S1S2, YearSeries(2019_y, {2.0, 1.5, 1.0}, units::SteelIntensity));

    ProductionBenchmark productionBenchmark(ThreeYearHorizon);
    productionBenchmark.add_growth(sectors::Steel, regions::Global, YearSeries(2019_y, {0.0, 0.0, 0.0}, "dimensionless"));

    std::vector<CompanyRecord> companies;
    // follows the benchmark
    companies.push_back(create_scored_company("A", {2.0, 1.5, 1.0}, {2.0, 1.0, 0.5}));
    // exceeds its budget with the trajectory, the target follows the budget
    companies.push_back(create_scored_company("B", {3.0, 3.0, 3.0}, {3.0, 2.0, 1.0}));
    // not covered by the benchmark
    companies.push_back(create_company("C", sectors::Cement));
    // no target
    companies.push_back(create_scored_company("D", {2.0, 1.5, 1.0}, {}));
    // gap in the trajectory
    companies.push_back(create_scored_company("E", {3.0, math::nan<double>(), 3.0}, {3.0, 2.0, 1.0}));

    const DataWarehouse warehouse(companies, ThreeYearHorizon, intensityBenchmark, productionBenchmark, DataWarehouse::Options(), summary);

    SUBCASE("unresolvable companies are excluded on construction")
    {
        CHECK((warehouse.company_ids() == std::vector<std::string>{"A", "B", "D", "E"}));
        REQUIRE(summary.issue_count(IssueCategory::UnresolvableScope) == 1);
        CHECK(summary.issues(IssueCategory::UnresolvableScope).front().companyId == "C");

        const std::vector<std::string> ids = {"A"};
        const auto data                    = warehouse.company_data().get_company_data(ids);
        REQUIRE(data.size() == 1);
        CHECK(data.front().scoringScope == Scope::S1S2);
    }

    SUBCASE("cumulative emissions and exceedance years")
    {
        const std::vector<std::string> ids = {"A", "B", "C", "D", "E"};
        const auto aggregates              = warehouse.get_preprocessed_company_data(ids);
        REQUIRE(aggregates.size() == 2);

        const auto emissionsUnit = Unit::parse(units::Emissions);

        const auto* a = find_aggregate(aggregates, "A");
        REQUIRE(a != nullptr);
        CHECK(a->scope == Scope::S1S2);
        CHECK(a->cumulativeTrajectory.value_in(emissionsUnit) == Approx(4.5));
        CHECK(a->cumulativeTarget.value_in(emissionsUnit) == Approx(3.5));
        CHECK(a->cumulativeBudget.value_in(emissionsUnit) == Approx(4.5));
        CHECK_FALSE(a->trajectoryExceedanceYear.has_value());
        CHECK_FALSE(a->targetExceedanceYear.has_value());
        CHECK(a->benchmarkGlobalBudget.value_in(Unit::parse("Gt CO2")) == Approx(396.0));
        CHECK(a->benchmarkTemperature.magnitude() == Approx(1.5));

        const auto* b = find_aggregate(aggregates, "B");
        REQUIRE(b != nullptr);
        CHECK(b->cumulativeTrajectory.value_in(emissionsUnit) == Approx(9.0));
        CHECK(b->cumulativeBudget.value_in(emissionsUnit) == Approx(6.0));
        CHECK(b->trajectoryExceedanceYear == 2020_y);
        CHECK_FALSE(b->targetExceedanceYear.has_value());

        REQUIRE(summary.issue_count(IssueCategory::SchemaValidationFailure) == 1);
        CHECK(summary.issues(IssueCategory::SchemaValidationFailure).front().companyId == "D");

        REQUIRE(summary.issue_count(IssueCategory::InvariantViolation) == 1);
        const auto violation = summary.issues(IssueCategory::InvariantViolation).front();
        CHECK(violation.companyId == "E");
        CHECK((violation.years == std::vector<date::year>{2020_y}));
    }

    SUBCASE("only the requested companies are scored")
    {
        const std::vector<std::string> ids = {"B"};
        const auto aggregates              = warehouse.get_preprocessed_company_data(ids);
        REQUIRE(aggregates.size() == 1);
        CHECK(aggregates.front().companyId == "B");
        CHECK(summary.issue_count(IssueCategory::SchemaValidationFailure) == 0);
    }
}

TEST_CASE("Data warehouse with a production centric benchmark")
{
    RunSummary summary;

    IntensityBenchmark intensityBenchmark(ThreeYearHorizon, benchmark_properties(true));
    intensityBenchmark.add_intensity(sectors::Steel, regions::Global, Scope::S1S2, YearSeries(2019_y, {3.0, 2.5, 2.0}, units::SteelIntensity));

    ProductionBenchmark productionBenchmark(ThreeYearHorizon);
    productionBenchmark.add_growth(sectors::Steel, regions::Global, YearSeries(2019_y, {0.0, 0.0, 0.0}, "dimensionless"));

    auto company = create_scored_company("A", {2.0, 1.5, 1.0}, {2.0, 1.5, 1.0});
    company.projectedIntensities.set(Scope::S3, YearSeries(2019_y, {1.0, 1.0, 1.0}, units::SteelIntensity));
    company.projectedTargets.set(Scope::S3, YearSeries(2019_y, {1.0, 1.0, 1.0}, units::SteelIntensity));

    const DataWarehouse warehouse({company}, ThreeYearHorizon, intensityBenchmark, productionBenchmark, DataWarehouse::Options(), summary);

    const std::vector<std::string> ids = {"A"};
    const auto data                    = warehouse.company_data().get_company_data(ids);
    REQUIRE(data.size() == 1);

    // scope 3 is folded into the direct emissions
    CHECK(data.front().projectedIntensities.get(Scope::S1S2) == YearSeries(2019_y, {3.0, 2.5, 2.0}, units::SteelIntensity));
    CHECK_FALSE(data.front().projectedIntensities.has(Scope::S3));
    CHECK_FALSE(data.front().projectedTargets.has(Scope::S3));

    const auto aggregates = warehouse.get_preprocessed_company_data(ids);
    REQUIRE(aggregates.size() == 1);
    CHECK(aggregates.front().cumulativeTrajectory.value_in(Unit::parse(units::Emissions)) == Approx(7.5));
    CHECK_FALSE(aggregates.front().trajectoryExceedanceYear.has_value());
}

TEST_CASE("Target left edge")
{
    const inf::Range<date::year> horizon(2019_y, 2021_y);

    SUBCASE("years before the first target value come from the trajectory")
    {
        const YearSeries target(2021_y, {1.5}, units::SteelIntensity);
        const YearSeries trajectory(2018_y, {2.1, 2.0, 1.9, 1.8}, units::SteelIntensity);

        CHECK(fill_target_left_edge(target, &trajectory, horizon) == YearSeries(2019_y, {2.0, 1.9, 1.5}, units::SteelIntensity));
    }

    SUBCASE("trajectory in a different unit")
    {
        const YearSeries target(2020_y, {1.5, 1.0}, units::SteelIntensity);
        const YearSeries trajectory(2019_y, {2000.0, 1900.0, 1800.0}, "kg CO2/(t Steel)");

        const auto filled = fill_target_left_edge(target, &trajectory, horizon);
        CHECK(filled.unit() == Unit::parse(units::SteelIntensity));
        CHECK(filled.value(2019_y) == Approx(2.0));
        CHECK(filled.value(2020_y) == Approx(1.5));
    }

    SUBCASE("leading years without value are dropped")
    {
        const YearSeries target(2019_y, {math::nan<double>(), 2.0, 1.0}, units::SteelIntensity);
        CHECK(fill_target_left_edge(target, nullptr, horizon) == YearSeries(2020_y, {2.0, 1.0}, units::SteelIntensity));
    }

    SUBCASE("gaps are interpolated")
    {
        const YearSeries target(2019_y, {3.0, math::nan<double>(), 1.0}, units::SteelIntensity);
        CHECK(fill_target_left_edge(target, nullptr, horizon) == YearSeries(2019_y, {3.0, 2.0, 1.0}, units::SteelIntensity));
    }

    SUBCASE("target values outside the horizon are ignored")
    {
        const YearSeries target(2018_y, {4.0, 3.0, 2.0, 1.0, 0.5}, units::SteelIntensity);
        CHECK(fill_target_left_edge(target, nullptr, horizon) == YearSeries(2019_y, {3.0, 2.0, 1.0}, units::SteelIntensity));
    }
}

}
