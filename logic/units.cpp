#include "cbudget/units.h"
#include "cbudget/errors.h"

#include "infra/exception.h"
#include "infra/math.h"
#include "infra/string.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace cbudget {

using namespace inf;

namespace {

struct BaseUnit
{
    std::string_view symbol;
    double scale = 1.0;
    std::string_view dimension;
};

struct Alias
{
    std::string_view name;
    std::string_view replacement;
};

const std::array<BaseUnit, 4> s_baseUnits = {
    BaseUnit{"g", 1.0, "[mass]"},
    BaseUnit{"t", 1e6, "[mass]"},
    BaseUnit{"J", 1.0, "[energy]"},
    BaseUnit{"Wh", 3600.0, "[energy]"},
};

const std::array<std::pair<char, double>, 6> s_prefixes = {{
    {'k', 1e3},
    {'M', 1e6},
    {'G', 1e9},
    {'T', 1e12},
    {'P', 1e15},
    {'E', 1e18},
}};

const std::array<Alias, 6> s_aliases = {
    Alias{"ton", "t"},
    Alias{"tonne", "t"},
    Alias{"tonnes", "t"},
    Alias{"CO2e", "CO2"},
    Alias{"CO2eq", "CO2"},
    Alias{"CO2_eq", "CO2"},
};

const BaseUnit* find_base_unit(std::string_view symbol) noexcept
{
    for (const auto& base : s_baseUnits) {
        if (base.symbol == symbol) {
            return &base;
        }
    }

    return nullptr;
}

std::string_view resolve_alias(std::string_view name) noexcept
{
    for (const auto& alias : s_aliases) {
        if (alias.name == name) {
            return alias.replacement;
        }
    }

    return name;
}

}

class UnitParser
{
public:
    UnitParser(std::string_view unit)
    : _unit(unit)
    {
    }

    Unit parse()
    {
        auto result = parse_expression();
        skip_spaces();
        if (_pos != _unit.size()) {
            throw RuntimeError("Invalid unit '{}': unexpected '{}' at position {}", _unit, _unit[_pos], _pos);
        }

        return result;
    }

private:
    Unit parse_expression()
    {
        Unit result;
        bool divide  = false;
        bool isFirst = true;

        for (;;) {
            skip_spaces();
            if (at_end() || peek() == ')') {
                break;
            }

            if (peek() == '/') {
                if (isFirst || divide) {
                    throw RuntimeError("Invalid unit '{}': misplaced '/'", _unit);
                }

                divide = true;
                ++_pos;
                continue;
            }

            if (peek() == '*') {
                ++_pos;
                continue;
            }

            auto factor = parse_factor();
            result      = divide ? result / factor : result * factor;
            divide      = false;
            isFirst     = false;
        }

        if (divide) {
            throw RuntimeError("Invalid unit '{}': missing denominator", _unit);
        }

        return result;
    }

    Unit parse_factor()
    {
        Unit factor;
        if (peek() == '(') {
            ++_pos;
            factor = parse_expression();
            if (at_end() || peek() != ')') {
                throw RuntimeError("Invalid unit '{}': missing ')'", _unit);
            }
            ++_pos;
        } else {
            factor = parse_atom();
        }

        if (auto exponent = parse_exponent(); exponent.has_value()) {
            Unit powered;
            if (*exponent >= 0) {
                for (int32_t i = 0; i < *exponent; ++i) {
                    powered = powered * factor;
                }
            } else {
                for (int32_t i = 0; i < -*exponent; ++i) {
                    powered = powered / factor;
                }
            }

            factor = powered;
        }

        return factor;
    }

    std::optional<int32_t> parse_exponent()
    {
        if (peek() == '^') {
            ++_pos;
        } else if (peek() == '*' && _pos + 1 < _unit.size() && _unit[_pos + 1] == '*') {
            _pos += 2;
        } else {
            return {};
        }

        const auto start = _pos;
        if (peek() == '-' || peek() == '+') {
            ++_pos;
        }

        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
            ++_pos;
        }

        auto value = str::to_int32(_unit.substr(start, _pos - start));
        if (!value.has_value()) {
            throw RuntimeError("Invalid unit '{}': invalid exponent", _unit);
        }

        return value;
    }

    Unit parse_atom()
    {
        const auto start = _pos;
        if (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '.') {
            while (!at_end() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '.' || peek() == 'e' || peek() == 'E')) {
                ++_pos;
                if ((_unit[_pos - 1] == 'e' || _unit[_pos - 1] == 'E') && (peek() == '-' || peek() == '+')) {
                    ++_pos;
                }
            }

            auto token = _unit.substr(start, _pos - start);
            auto value = str::to_double(token);
            if (!value.has_value()) {
                throw RuntimeError("Invalid unit '{}': invalid number '{}'", _unit, token);
            }

            return unit_from_symbol("", *value, token);
        }

        while (!at_end() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
            ++_pos;
        }

        if (_pos == start) {
            throw RuntimeError("Invalid unit '{}': unexpected '{}' at position {}", _unit, peek(), _pos);
        }

        auto token = resolve_alias(_unit.substr(start, _pos - start));
        if (token == "dimensionless") {
            return Unit::dimensionless();
        }

        if (auto* base = find_base_unit(token); base != nullptr) {
            return unit_from_symbol(base->dimension, base->scale, token);
        }

        if (token.size() > 1) {
            for (auto& [prefix, scale] : s_prefixes) {
                if (token.front() == prefix) {
                    if (auto* base = find_base_unit(token.substr(1)); base != nullptr) {
                        return unit_from_symbol(base->dimension, base->scale * scale, token);
                    }
                }
            }
        }

        // substance or other counted entity
        return unit_from_symbol(token, 1.0, token);
    }

    static Unit unit_from_symbol(std::string_view dimension, double scale, std::string_view name);

    bool at_end() const noexcept
    {
        return _pos >= _unit.size();
    }

    char peek() const noexcept
    {
        return at_end() ? '\0' : _unit[_pos];
    }

    void skip_spaces() noexcept
    {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) {
            ++_pos;
        }
    }

    std::string_view _unit;
    size_t _pos = 0;
};

Unit::Unit(double scale, std::map<std::string, int32_t> dimensions, std::string name)
: _scale(scale)
, _dimensions(std::move(dimensions))
, _name(std::move(name))
{
}

Unit UnitParser::unit_from_symbol(std::string_view dimension, double scale, std::string_view name)
{
    std::map<std::string, int32_t> dimensions;
    if (!dimension.empty()) {
        dimensions.emplace(std::string(dimension), 1);
    }

    return Unit(scale, std::move(dimensions), std::string(name));
}

Unit Unit::parse(std::string_view unit)
{
    auto trimmed = str::trimmed_view(unit);
    if (trimmed.empty()) {
        return dimensionless();
    }

    auto result  = UnitParser(trimmed).parse();
    result._name = result.is_dimensionless() && result._scale == 1.0 ? std::string("dimensionless") : std::string(trimmed);
    return result;
}

Unit Unit::dimensionless()
{
    return Unit(1.0, {}, "dimensionless");
}

double Unit::scale() const noexcept
{
    return _scale;
}

const std::string& Unit::name() const noexcept
{
    return _name;
}

bool Unit::is_dimensionless() const noexcept
{
    return _dimensions.empty();
}

bool Unit::is_compatible_with(const Unit& other) const noexcept
{
    return _dimensions == other._dimensions;
}

double Unit::conversion_factor_to(const Unit& other) const
{
    if (!is_compatible_with(other)) {
        throw UnitMismatch("Cannot convert from '{}' to '{}'", _name, other._name);
    }

    return _scale / other._scale;
}

static std::map<std::string, int32_t> combine_dimensions(const std::map<std::string, int32_t>& lhs, const std::map<std::string, int32_t>& rhs, int32_t sign)
{
    auto result = lhs;
    for (auto& [dimension, exponent] : rhs) {
        auto& combined = result[dimension];
        combined += sign * exponent;
        if (combined == 0) {
            result.erase(dimension);
        }
    }

    return result;
}

static bool is_dimensionless_name(const std::string& name)
{
    return name.empty() || name == "dimensionless";
}

static bool is_single_symbol(const std::string& name)
{
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
    });
}

Unit Unit::operator*(const Unit& other) const
{
    std::string name;
    if (is_dimensionless_name(_name)) {
        name = other._name;
    } else if (is_dimensionless_name(other._name)) {
        name = _name;
    } else {
        name = fmt::format("{} {}", _name, other._name);
    }

    return Unit(_scale * other._scale, combine_dimensions(_dimensions, other._dimensions, 1), std::move(name));
}

Unit Unit::operator/(const Unit& other) const
{
    std::string name;
    if (is_dimensionless_name(other._name)) {
        name = _name;
    } else {
        const auto numerator = is_dimensionless_name(_name) ? std::string("1") : _name;
        if (is_single_symbol(other._name)) {
            name = fmt::format("{}/{}", numerator, other._name);
        } else {
            name = fmt::format("{}/({})", numerator, other._name);
        }
    }

    return Unit(_scale / other._scale, combine_dimensions(_dimensions, other._dimensions, -1), std::move(name));
}

bool Unit::operator==(const Unit& other) const noexcept
{
    return _dimensions == other._dimensions && math::approx_equal(_scale, other._scale, _scale * 1e-12);
}

bool Unit::operator!=(const Unit& other) const noexcept
{
    return !(*this == other);
}

Quantity::Quantity(double magnitude, Unit unit)
: _magnitude(magnitude)
, _unit(std::move(unit))
{
}

Quantity::Quantity(double magnitude, std::string_view unit)
: _magnitude(magnitude)
, _unit(Unit::parse(unit))
{
}

Quantity Quantity::parse(std::string_view quantity)
{
    auto trimmed = str::trimmed_view(quantity);

    size_t end = 0;
    while (end < trimmed.size() && !std::isspace(static_cast<unsigned char>(trimmed[end]))) {
        ++end;
    }

    auto magnitude = str::to_double(trimmed.substr(0, end));
    if (!magnitude.has_value()) {
        throw RuntimeError("Invalid quantity '{}': expected a number followed by a unit (e.g. \"396 Gt CO2\")", quantity);
    }

    return Quantity(*magnitude, Unit::parse(trimmed.substr(end)));
}

double Quantity::magnitude() const noexcept
{
    return _magnitude;
}

const Unit& Quantity::unit() const noexcept
{
    return _unit;
}

bool Quantity::is_nan() const noexcept
{
    return std::isnan(_magnitude);
}

Quantity Quantity::to(const Unit& unit) const
{
    return Quantity(_magnitude * _unit.conversion_factor_to(unit), unit);
}

Quantity Quantity::to(std::string_view unit) const
{
    return to(Unit::parse(unit));
}

double Quantity::value_in(const Unit& unit) const
{
    return _magnitude * _unit.conversion_factor_to(unit);
}

Quantity Quantity::operator+(const Quantity& other) const
{
    return Quantity(_magnitude + other.value_in(_unit), _unit);
}

Quantity Quantity::operator-(const Quantity& other) const
{
    return Quantity(_magnitude - other.value_in(_unit), _unit);
}

Quantity Quantity::operator*(const Quantity& other) const
{
    return Quantity(_magnitude * other._magnitude, _unit * other._unit);
}

Quantity Quantity::operator/(const Quantity& other) const
{
    return Quantity(_magnitude / other._magnitude, _unit / other._unit);
}

Quantity Quantity::operator*(double factor) const
{
    return Quantity(_magnitude * factor, _unit);
}

bool Quantity::approx_equals(const Quantity& other, double epsilon) const
{
    if (!_unit.is_compatible_with(other._unit)) {
        return false;
    }

    return math::approx_equal(_magnitude, other.value_in(_unit), epsilon);
}

}
