#include "cbudget/exceedance.h"
#include "infra/math.h"
#include "testprinters.h"

#include <doctest/doctest.h>

namespace cbudget::test {

using namespace inf;
using namespace date;
using namespace doctest;

TEST_CASE("Exceedance year")
{
    const ProjectionControls controls{2019_y, 2022_y};
    const YearSeries budget(2019_y, {10.0, 20.0, 30.0, 40.0}, "Mt CO2");

    SUBCASE("within budget up to the target year")
    {
        CHECK_FALSE(exceedance_year(YearSeries(2019_y, {10.0, 20.0, 30.0, 40.0}, "Mt CO2"), budget, {}, controls).has_value());
        CHECK_FALSE(exceedance_year(YearSeries(2019_y, {1.0, 2.0, 3.0, 4.0}, "Mt CO2"), budget, {}, controls).has_value());
    }

    SUBCASE("exceeding in every year")
    {
        CHECK(exceedance_year(YearSeries(2019_y, {11.0, 21.0, 31.0, 41.0}, "Mt CO2"), budget, {}, controls) == 2019_y);
    }

    SUBCASE("furthest year within budget")
    {
        const YearSeries subject(2019_y, {5.0, 15.0, 35.0, 45.0}, "Mt CO2");
        CHECK(exceedance_year(subject, budget, {}, controls) == 2020_y);

        // an earlier crossing does not matter once a later year is within budget again
        CHECK(exceedance_year(YearSeries(2019_y, {15.0, 15.0, 31.0, 38.0}, "Mt CO2"), budget, {}, controls) == std::nullopt);
    }

    SUBCASE("budget flattened before the budget year")
    {
        const YearSeries subject(2019_y, {5.0, 15.0, 35.0, 45.0}, "Mt CO2");
        CHECK(exceedance_year(subject, budget, 2022_y, controls) == 2021_y);
        CHECK(exceedance_year(subject, budget, 2021_y, controls) == 2020_y);

        // a budget year without budget value leaves the budget untouched
        CHECK(exceedance_year(subject, budget, 2030_y, controls) == 2020_y);
        const YearSeries budgetWithGap(2019_y, {10.0, 20.0, 30.0, math::nan<double>()}, "Mt CO2");
        CHECK(exceedance_year(subject, budgetWithGap, 2022_y, controls) == 2020_y);
    }

    SUBCASE("subject converted to the budget unit")
    {
        const YearSeries budgetGt(2019_y, {0.01, 0.02, 0.03, 0.04}, "Gt CO2");
        CHECK(exceedance_year(YearSeries(2019_y, {5.0, 15.0, 35.0, 45.0}, "Mt CO2"), budgetGt, {}, controls) == 2020_y);
    }

    SUBCASE("years without subject value are not within budget")
    {
        CHECK(exceedance_year(YearSeries(2019_y, {5.0, 15.0}, "Mt CO2"), budget, {}, controls) == 2020_y);
        CHECK(exceedance_year(YearSeries(2019_y, {5.0, 15.0, math::nan<double>(), math::nan<double>()}, "Mt CO2"), budget, {}, controls) == 2020_y);
        CHECK(exceedance_year(YearSeries(Unit::parse("Mt CO2")), budget, {}, controls) == 2019_y);
    }
}

TEST_CASE("Exceedance years of a table")
{
    const ProjectionControls controls{2019_y, 2020_y};

    YearTable budget;
    budget.add_row(RowId{"A", Scope::S1S2}, YearSeries(2019_y, {10.0, 20.0}, "Mt CO2"));
    budget.add_row(RowId{"B", Scope::S1S2}, YearSeries(2019_y, {10.0, 20.0}, "Mt CO2"));
    budget.add_row(RowId{"C", Scope::S1}, YearSeries(2019_y, {10.0, 20.0}, "Mt CO2"));

    YearTable subject;
    subject.add_row(RowId{"C", Scope::S1}, YearSeries(2019_y, {11.0, 21.0}, "Mt CO2"));
    subject.add_row(RowId{"A", Scope::S1S2}, YearSeries(2019_y, {5.0, 10.0}, "Mt CO2"));
    subject.add_row(RowId{"D", Scope::S1S2}, YearSeries(2019_y, {5.0, 10.0}, "Mt CO2"));
    // same company, different scope
    subject.add_row(RowId{"B", Scope::S1}, YearSeries(2019_y, {5.0, 10.0}, "Mt CO2"));

    const auto results = exceedance_years(subject, budget, controls.targetYear, controls);
    REQUIRE(results.size() == 2);
    CHECK(results[0].id == RowId{"A", Scope::S1S2});
    CHECK_FALSE(results[0].year.has_value());
    CHECK(results[1].id == RowId{"C", Scope::S1});
    CHECK(results[1].year == 2019_y);
}

}
