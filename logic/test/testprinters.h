#pragma once

#include "cbudget/scope.h"
#include "cbudget/units.h"
#include "cbudget/yearseries.h"

#include <doctest/doctest.h>
#include <fmt/format.h>

namespace cbudget {

inline doctest::String toString(Scope scope)
{
    const auto name = scope_name(scope);
    return doctest::String(name.data(), static_cast<int>(name.size()));
}

inline doctest::String toString(const Unit& unit)
{
    return doctest::String(unit.name().c_str());
}

inline doctest::String toString(const Quantity& quantity)
{
    return doctest::String(fmt::format("{}", quantity).c_str());
}

inline doctest::String toString(const YearSeries& series)
{
    return doctest::String(fmt::format("{}", series).c_str());
}

}

namespace date {

inline doctest::String toString(const date::year& year)
{
    return doctest::String(std::to_string(static_cast<int>(year)).c_str());
}

}
