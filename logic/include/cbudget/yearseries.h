#pragma once

#include "cbudget/units.h"
#include "infra/range.h"

#include <date/date.h>
#include <fmt/core.h>
#include <optional>
#include <span>
#include <vector>

namespace cbudget {

/* Year indexed sequence of magnitudes that share a single unit
 * Points are kept sorted on year, a missing value is represented by NaN
 */
class YearSeries
{
public:
    struct Point
    {
        date::year year;
        double value = 0.0;

        bool operator==(const Point& other) const noexcept = default;
    };

    YearSeries() = default;
    explicit YearSeries(Unit unit);
    YearSeries(Unit unit, std::vector<Point> points);
    // Consecutive values starting at the given year
    YearSeries(date::year firstYear, std::span<const double> values, Unit unit);
    YearSeries(date::year firstYear, std::initializer_list<double> values, std::string_view unit);

    bool empty() const noexcept;
    size_t size() const noexcept;
    const Unit& unit() const noexcept;
    std::span<const Point> points() const noexcept;
    std::vector<date::year> years() const;

    date::year first_year() const;
    date::year last_year() const;
    bool contains(date::year year) const noexcept;

    double value(date::year year) const;
    std::optional<double> try_value(date::year year) const noexcept;
    Quantity quantity(date::year year) const;
    // Value of the last point, NaN for an empty series
    double last_value() const noexcept;

    // Inserts the point or overwrites the value of an existing year
    void set_value(date::year year, double value);

    bool has_missing_values() const noexcept;
    std::vector<date::year> missing_years() const;
    bool is_aligned_with(const YearSeries& other) const noexcept;

    YearSeries converted_to(const Unit& unit) const;
    YearSeries restricted_to(inf::Range<date::year> range) const;
    YearSeries scaled(double factor) const;

    // Sum over the years present in both series, the result is expressed in the unit of this series
    YearSeries sum_overlap(const YearSeries& other) const;
    // Sum of two series that cover the same years, throws IrrecoverableMisalignment otherwise
    YearSeries sum_aligned(const YearSeries& other) const;
    // Product over the years of this series, years missing in the other series result in NaN
    YearSeries multiplied_by(const YearSeries& other) const;
    // Running total from the first to the last year
    YearSeries cumulative_sum() const;
    // Linear interpolation of missing values that have valid values on both sides
    YearSeries interpolated() const;

    bool operator==(const YearSeries& other) const noexcept;

private:
    std::vector<Point>::iterator find_point(date::year year) noexcept;
    std::vector<Point>::const_iterator find_point(date::year year) const noexcept;

    Unit _unit;
    std::vector<Point> _points;
};

}

namespace fmt {
template <>
struct formatter<cbudget::YearSeries>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const cbudget::YearSeries& val, FormatContext& ctx) const
    {
        auto out = format_to(ctx.out(), "[");
        bool first = true;
        for (const auto& point : val.points()) {
            out   = format_to(out, "{}{}: {}", first ? "" : ", ", static_cast<int>(point.year), point.value);
            first = false;
        }

        return format_to(out, "] {}", val.unit());
    }
};
}
