#pragma once

#include "cbudget/scope.h"
#include "cbudget/yearseries.h"
#include "infra/hash.h"

#include <fmt/core.h>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace cbudget {

struct RowId
{
    std::string companyId;
    Scope scope = Scope::S1S2;

    bool operator==(const RowId& other) const noexcept = default;
};

}

namespace std {
template <>
struct hash<cbudget::RowId>
{
    size_t operator()(const cbudget::RowId& id) const
    {
        size_t seed = 0;
        inf::hash_combine(seed, id.companyId, id.scope);
        return seed;
    }
};
}

namespace cbudget {

/* Collection of year series keyed on (company, scope), rows keep their insertion order */
class YearTable
{
public:
    struct Row
    {
        RowId id;
        YearSeries series;
    };

    YearTable() = default;

    // Throws when a row with the same id is already present
    void add_row(RowId id, YearSeries series);

    bool empty() const noexcept;
    size_t size() const noexcept;
    bool contains(const RowId& id) const noexcept;

    const YearSeries* find(const RowId& id) const noexcept;
    const YearSeries& series(const RowId& id) const;
    std::span<const Row> rows() const noexcept;

private:
    std::vector<Row> _rows;
    std::unordered_map<RowId, size_t> _index;
};

}

namespace fmt {
template <>
struct formatter<cbudget::RowId>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const cbudget::RowId& val, FormatContext& ctx) const
    {
        return format_to(ctx.out(), "{} ({})", val.companyId, val.scope);
    }
};
}
