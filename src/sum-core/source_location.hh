#pragma once

#include <source_location>

namespace sc
{
/// Type alias for std::source_location
/// Provides information about source code location (file, line, column, function)
/// Captured by assertion failures and by sc::any_error at the site an error is raised
/// Usage:
///   void log(sc::source_location loc = sc::source_location::current()) {
///       std::cout << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace sc
