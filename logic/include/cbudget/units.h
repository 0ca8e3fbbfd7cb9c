#pragma once

#include <cstdint>
#include <fmt/core.h>
#include <map>
#include <string>
#include <string_view>

namespace cbudget {

class UnitParser;

/* A physical unit: a scale relative to the base units combined with the exponents of its dimensions
 * Mass is expressed in gram, energy in joule, every other identifier (CO2, Steel, ...) is a dimension of its own
 * Unit strings are parsed as a sequence of factors: "t CO2/GWh", "Mt CO2", "t CO2/(t Steel)", "GJ^2"
 * Factors separated by a space or '*' are multiplied, '/' divides by the next factor only
 */
class Unit
{
public:
    Unit() = default;

    static Unit parse(std::string_view unit);
    static Unit dimensionless();

    double scale() const noexcept;
    const std::string& name() const noexcept;
    bool is_dimensionless() const noexcept;

    bool is_compatible_with(const Unit& other) const noexcept;
    // Factor to multiply a magnitude in this unit with to obtain the magnitude in the other unit
    double conversion_factor_to(const Unit& other) const;

    Unit operator*(const Unit& other) const;
    Unit operator/(const Unit& other) const;

    bool operator==(const Unit& other) const noexcept;
    bool operator!=(const Unit& other) const noexcept;

private:
    friend class UnitParser;
    Unit(double scale, std::map<std::string, int32_t> dimensions, std::string name);

    double _scale = 1.0;
    std::map<std::string, int32_t> _dimensions;
    std::string _name = "dimensionless";
};

class Quantity
{
public:
    Quantity() = default;
    Quantity(double magnitude, Unit unit);
    Quantity(double magnitude, std::string_view unit);

    // Parse a magnitude followed by a unit: "396 Gt CO2"
    static Quantity parse(std::string_view quantity);

    double magnitude() const noexcept;
    const Unit& unit() const noexcept;
    bool is_nan() const noexcept;

    Quantity to(const Unit& unit) const;
    Quantity to(std::string_view unit) const;
    double value_in(const Unit& unit) const;

    Quantity operator+(const Quantity& other) const;
    Quantity operator-(const Quantity& other) const;
    Quantity operator*(const Quantity& other) const;
    Quantity operator/(const Quantity& other) const;
    Quantity operator*(double factor) const;

    bool approx_equals(const Quantity& other, double epsilon = 1e-9) const;

private:
    double _magnitude = 0.0;
    Unit _unit;
};

}

namespace fmt {
template <>
struct formatter<cbudget::Unit>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const cbudget::Unit& val, FormatContext& ctx) const
    {
        return format_to(ctx.out(), "{}", val.name());
    }
};

template <>
struct formatter<cbudget::Quantity>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const cbudget::Quantity& val, FormatContext& ctx) const
    {
        if (val.unit().is_dimensionless()) {
            return format_to(ctx.out(), "{}", val.magnitude());
        }

        return format_to(ctx.out(), "{} {}", val.magnitude(), val.unit().name());
    }
};
}
