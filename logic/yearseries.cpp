#include "cbudget/yearseries.h"
#include "cbudget/errors.h"

#include "infra/exception.h"
#include "infra/math.h"

#include <algorithm>
#include <cmath>

namespace cbudget {

using namespace inf;

static bool year_compare(const YearSeries::Point& lhs, const YearSeries::Point& rhs) noexcept
{
    return lhs.year < rhs.year;
}

YearSeries::YearSeries(Unit unit)
: _unit(std::move(unit))
{
}

YearSeries::YearSeries(Unit unit, std::vector<Point> points)
: _unit(std::move(unit))
, _points(std::move(points))
{
    std::sort(_points.begin(), _points.end(), year_compare);
    auto duplicate = std::adjacent_find(_points.begin(), _points.end(), [](const Point& lhs, const Point& rhs) {
        return lhs.year == rhs.year;
    });

    if (duplicate != _points.end()) {
        throw RuntimeError("Duplicate year in series: {}", static_cast<int>(duplicate->year));
    }
}

YearSeries::YearSeries(date::year firstYear, std::span<const double> values, Unit unit)
: _unit(std::move(unit))
{
    _points.reserve(values.size());
    auto year = firstYear;
    for (double value : values) {
        _points.push_back({year, value});
        ++year;
    }
}

YearSeries::YearSeries(date::year firstYear, std::initializer_list<double> values, std::string_view unit)
: YearSeries(firstYear, std::span<const double>(values.begin(), values.size()), Unit::parse(unit))
{
}

bool YearSeries::empty() const noexcept
{
    return _points.empty();
}

size_t YearSeries::size() const noexcept
{
    return _points.size();
}

const Unit& YearSeries::unit() const noexcept
{
    return _unit;
}

std::span<const YearSeries::Point> YearSeries::points() const noexcept
{
    return _points;
}

std::vector<date::year> YearSeries::years() const
{
    std::vector<date::year> result;
    result.reserve(_points.size());
    std::transform(_points.begin(), _points.end(), std::back_inserter(result), [](const Point& point) {
        return point.year;
    });

    return result;
}

date::year YearSeries::first_year() const
{
    if (_points.empty()) {
        throw RuntimeError("No first year in an empty series");
    }

    return _points.front().year;
}

date::year YearSeries::last_year() const
{
    if (_points.empty()) {
        throw RuntimeError("No last year in an empty series");
    }

    return _points.back().year;
}

std::vector<YearSeries::Point>::iterator YearSeries::find_point(date::year year) noexcept
{
    auto iter = std::lower_bound(_points.begin(), _points.end(), Point{year, 0.0}, year_compare);
    if (iter != _points.end() && iter->year == year) {
        return iter;
    }

    return _points.end();
}

std::vector<YearSeries::Point>::const_iterator YearSeries::find_point(date::year year) const noexcept
{
    auto iter = std::lower_bound(_points.begin(), _points.end(), Point{year, 0.0}, year_compare);
    if (iter != _points.end() && iter->year == year) {
        return iter;
    }

    return _points.end();
}

bool YearSeries::contains(date::year year) const noexcept
{
    return find_point(year) != _points.end();
}

double YearSeries::value(date::year year) const
{
    auto iter = find_point(year);
    if (iter == _points.end()) {
        throw RuntimeError("No value available for year {}", static_cast<int>(year));
    }

    return iter->value;
}

std::optional<double> YearSeries::try_value(date::year year) const noexcept
{
    std::optional<double> result;
    if (auto iter = find_point(year); iter != _points.end()) {
        result = iter->value;
    }

    return result;
}

Quantity YearSeries::quantity(date::year year) const
{
    return Quantity(value(year), _unit);
}

double YearSeries::last_value() const noexcept
{
    return _points.empty() ? math::nan<double>() : _points.back().value;
}

void YearSeries::set_value(date::year year, double value)
{
    auto iter = std::lower_bound(_points.begin(), _points.end(), Point{year, 0.0}, year_compare);
    if (iter != _points.end() && iter->year == year) {
        iter->value = value;
    } else {
        _points.insert(iter, Point{year, value});
    }
}

bool YearSeries::has_missing_values() const noexcept
{
    return std::any_of(_points.begin(), _points.end(), [](const Point& point) {
        return std::isnan(point.value);
    });
}

std::vector<date::year> YearSeries::missing_years() const
{
    std::vector<date::year> result;
    for (const auto& point : _points) {
        if (std::isnan(point.value)) {
            result.push_back(point.year);
        }
    }

    return result;
}

bool YearSeries::is_aligned_with(const YearSeries& other) const noexcept
{
    return std::equal(_points.begin(), _points.end(), other._points.begin(), other._points.end(), [](const Point& lhs, const Point& rhs) {
        return lhs.year == rhs.year;
    });
}

YearSeries YearSeries::converted_to(const Unit& unit) const
{
    const auto factor = _unit.conversion_factor_to(unit);

    YearSeries result(unit);
    result._points = _points;
    for (auto& point : result._points) {
        point.value *= factor;
    }

    return result;
}

YearSeries YearSeries::restricted_to(inf::Range<date::year> range) const
{
    YearSeries result(_unit);
    std::copy_if(_points.begin(), _points.end(), std::back_inserter(result._points), [&range](const Point& point) {
        return range.contains(point.year);
    });

    return result;
}

YearSeries YearSeries::scaled(double factor) const
{
    YearSeries result = *this;
    for (auto& point : result._points) {
        point.value *= factor;
    }

    return result;
}

YearSeries YearSeries::sum_overlap(const YearSeries& other) const
{
    const auto factor = other._unit.conversion_factor_to(_unit);

    YearSeries result(_unit);
    for (const auto& point : _points) {
        if (auto otherValue = other.try_value(point.year); otherValue.has_value()) {
            result._points.push_back({point.year, point.value + *otherValue * factor});
        }
    }

    return result;
}

YearSeries YearSeries::sum_aligned(const YearSeries& other) const
{
    if (!is_aligned_with(other)) {
        throw IrrecoverableMisalignment("Series cover different years ({}-{} and {}-{})",
                                        empty() ? 0 : static_cast<int>(first_year()),
                                        empty() ? 0 : static_cast<int>(last_year()),
                                        other.empty() ? 0 : static_cast<int>(other.first_year()),
                                        other.empty() ? 0 : static_cast<int>(other.last_year()));
    }

    return sum_overlap(other);
}

YearSeries YearSeries::multiplied_by(const YearSeries& other) const
{
    YearSeries result(_unit * other._unit);
    result._points.reserve(_points.size());
    for (const auto& point : _points) {
        result._points.push_back({point.year, point.value * other.try_value(point.year).value_or(math::nan<double>())});
    }

    return result;
}

YearSeries YearSeries::cumulative_sum() const
{
    YearSeries result = *this;

    double total = 0.0;
    for (auto& point : result._points) {
        total += point.value;
        point.value = total;
    }

    return result;
}

YearSeries YearSeries::interpolated() const
{
    YearSeries result = *this;
    auto& points      = result._points;

    std::optional<size_t> previousValid;
    for (size_t i = 0; i < points.size(); ++i) {
        if (std::isnan(points[i].value)) {
            continue;
        }

        if (previousValid.has_value() && *previousValid + 1 < i) {
            const auto& start = points[*previousValid];
            const auto& end   = points[i];
            const auto span   = static_cast<double>(static_cast<int>(end.year) - static_cast<int>(start.year));
            for (size_t j = *previousValid + 1; j < i; ++j) {
                const auto offset = static_cast<double>(static_cast<int>(points[j].year) - static_cast<int>(start.year));
                points[j].value   = start.value + (end.value - start.value) * offset / span;
            }
        }

        previousValid = i;
    }

    return result;
}

bool YearSeries::operator==(const YearSeries& other) const noexcept
{
    if (_unit != other._unit) {
        return false;
    }

    return std::equal(_points.begin(), _points.end(), other._points.begin(), other._points.end(), [](const Point& lhs, const Point& rhs) {
        if (lhs.year != rhs.year) {
            return false;
        }

        if (std::isnan(lhs.value) || std::isnan(rhs.value)) {
            return std::isnan(lhs.value) && std::isnan(rhs.value);
        }

        return lhs.value == rhs.value;
    });
}

}
