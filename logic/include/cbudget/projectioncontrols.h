#pragma once

#include "cbudget/constants.h"
#include "infra/range.h"

#include <date/date.h>

namespace cbudget {

// Years that delimit every projection and cumulative computation
struct ProjectionControls
{
    date::year baseYear   = date::year(constants::defaultBaseYear);
    date::year targetYear = date::year(constants::defaultTargetYear);

    inf::Range<date::year> horizon() const noexcept
    {
        return inf::Range<date::year>(baseYear, targetYear);
    }
};

}
