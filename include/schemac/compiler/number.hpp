#pragma once
#include "schemac/compiler/check.hpp"
#include "schemac/settings.hpp"

namespace schemac::compiler::number
{

/// Compiles "maximum", "minimum", "exclusiveMaximum", "exclusiveMinimum" and "multipleOf"
/// into one combined check. Both exclusivity conventions are accepted: a boolean
/// modifier of "maximum"/"minimum", or a standalone numeric bound.
/// Serves "integer" nodes too, with whole-number semantics for value and bounds.
CheckList compile(const Json& schema, const Settings& settings = Settings{});

} // namespace schemac::compiler::number
