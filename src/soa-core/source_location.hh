#pragma once

#include <source_location>

namespace soa
{
/// Type alias for std::source_location, captured by the assertion macros
using source_location = std::source_location;
} // namespace soa
