#pragma once

#include <stacktrace>

namespace sc
{
/// Type alias for std::stacktrace
/// Snapshot of the call stack, printed by the default assertion handler
using stacktrace = std::stacktrace;
} // namespace sc
