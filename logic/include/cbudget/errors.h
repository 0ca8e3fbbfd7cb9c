#pragma once

#include "infra/exception.h"

#include <date/date.h>
#include <string>
#include <vector>

namespace cbudget {

// Arithmetic or conversion between quantities of incompatible dimensions
class UnitMismatch : public inf::RuntimeError
{
public:
    using RuntimeError::RuntimeError;
};

// Two year series cannot be brought onto a common set of years
class IrrecoverableMisalignment : public inf::RuntimeError
{
public:
    using RuntimeError::RuntimeError;
};

// A structural precondition of a computation does not hold for a company
class InvariantViolation : public inf::RuntimeError
{
public:
    InvariantViolation(std::string companyId, std::vector<date::year> years, const std::string& message)
    : RuntimeError("{}", message)
    , _companyId(std::move(companyId))
    , _years(std::move(years))
    {
    }

    const std::string& company_id() const noexcept
    {
        return _companyId;
    }

    const std::vector<date::year>& years() const noexcept
    {
        return _years;
    }

private:
    std::string _companyId;
    std::vector<date::year> _years;
};

}
