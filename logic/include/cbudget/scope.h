#pragma once

#include <array>
#include <fmt/core.h>
#include <optional>
#include <string_view>
#include <utility>

namespace cbudget {

enum class Scope
{
    S1,
    S2,
    S1S2,
    S3,
    S1S2S3,
};

inline constexpr std::array<Scope, 5> AllScopes = {Scope::S1, Scope::S2, Scope::S1S2, Scope::S3, Scope::S1S2S3};

// Order in which a scope is selected when a benchmark publishes several scopes
inline constexpr std::array<Scope, 4> ScopePriority = {Scope::S1S2S3, Scope::S1S2, Scope::S1, Scope::S3};

std::string_view scope_name(Scope scope) noexcept;
std::optional<Scope> try_scope_from_string(std::string_view str) noexcept;
Scope scope_from_string(std::string_view str);

/* Fixed mapping of every scope to an optional value */
template <typename T>
class ScopeBundle
{
public:
    bool has(Scope scope) const noexcept
    {
        return slot(scope).has_value();
    }

    const std::optional<T>& get(Scope scope) const noexcept
    {
        return slot(scope);
    }

    std::optional<T>& get(Scope scope) noexcept
    {
        return slot(scope);
    }

    void set(Scope scope, T value)
    {
        slot(scope) = std::move(value);
    }

    void clear(Scope scope) noexcept
    {
        slot(scope).reset();
    }

    bool empty() const noexcept
    {
        return !(_s1 || _s2 || _s1s2 || _s3 || _s1s2s3);
    }

    bool operator==(const ScopeBundle<T>& other) const = default;

private:
    std::optional<T>& slot(Scope scope) noexcept
    {
        return const_cast<std::optional<T>&>(std::as_const(*this).slot(scope));
    }

    const std::optional<T>& slot(Scope scope) const noexcept
    {
        switch (scope) {
        case Scope::S1:
            return _s1;
        case Scope::S2:
            return _s2;
        case Scope::S1S2:
            return _s1s2;
        case Scope::S3:
            return _s3;
        case Scope::S1S2S3:
            return _s1s2s3;
        }

        return _s1;
    }

    std::optional<T> _s1;
    std::optional<T> _s2;
    std::optional<T> _s1s2;
    std::optional<T> _s3;
    std::optional<T> _s1s2s3;
};

}

namespace fmt {
template <>
struct formatter<cbudget::Scope>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(cbudget::Scope val, FormatContext& ctx) const
    {
        return format_to(ctx.out(), "{}", cbudget::scope_name(val));
    }
};
}
