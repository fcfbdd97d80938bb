#pragma once

#include <source_location>

namespace oc
{
/// Type alias for std::source_location
/// Captured by every assertion so reports point at the failing call site.
using source_location = std::source_location;
} // namespace oc
