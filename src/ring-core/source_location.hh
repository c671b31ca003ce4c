#pragma once

#include <source_location>

namespace rc
{
/// Where an assertion fired (file, line, column, function).
/// Captured via rc::source_location::current() inside the assert macros.
using source_location = std::source_location;
} // namespace rc
