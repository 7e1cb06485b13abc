#pragma once

#include <source_location>

namespace lc
{
/// Type alias for std::source_location
/// Captured by the assertion macros so reports point at the violated contract, not at the handler
/// Usage:
///   void log(lc::source_location loc = lc::source_location::current()) {
///       std::cout << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace lc
