#pragma once

#include <string_view>

namespace cbudget::constants {

// Unit of all cumulative emission results
inline const std::string_view emissionsUnit = "Mt CO2";
inline const std::string_view globalBudgetUnit = "Gt CO2";

// Region used when a benchmark has no entry for the region of a company
inline const std::string_view globalRegion = "Global";

inline constexpr const int32_t defaultBaseYear   = 2019;
inline constexpr const int32_t defaultTargetYear = 2050;

}
