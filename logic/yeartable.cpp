#include "cbudget/yeartable.h"

#include "infra/exception.h"

namespace cbudget {

using namespace inf;

void YearTable::add_row(RowId id, YearSeries series)
{
    if (_index.count(id) > 0) {
        throw RuntimeError("Duplicate row in table: {}", id);
    }

    _index.emplace(id, _rows.size());
    _rows.push_back(Row{std::move(id), std::move(series)});
}

bool YearTable::empty() const noexcept
{
    return _rows.empty();
}

size_t YearTable::size() const noexcept
{
    return _rows.size();
}

bool YearTable::contains(const RowId& id) const noexcept
{
    return _index.count(id) > 0;
}

const YearSeries* YearTable::find(const RowId& id) const noexcept
{
    if (auto iter = _index.find(id); iter != _index.end()) {
        return &_rows[iter->second].series;
    }

    return nullptr;
}

const YearSeries& YearTable::series(const RowId& id) const
{
    if (auto* series = find(id); series != nullptr) {
        return *series;
    }

    throw RuntimeError("No row in table for {}", id);
}

std::span<const YearTable::Row> YearTable::rows() const noexcept
{
    return _rows;
}

}
