#pragma once

#include "base/exception.hpp"

namespace ms
{
// A coordinate, radius, bound or point set is outside of its legal domain.
DECLARE_EXCEPTION(ValidationError, RootException);
// Latitude, longitude or altitude is out of range or is not finite.
DECLARE_EXCEPTION(OutOfRangeError, ValidationError);
// An operation which is undefined for an empty point set was called with one.
DECLARE_EXCEPTION(EmptyInputError, ValidationError);
}  // namespace ms
