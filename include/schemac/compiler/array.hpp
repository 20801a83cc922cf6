#pragma once
#include "schemac/compiler/check.hpp"
#include "schemac/settings.hpp"

namespace schemac::compiler::array
{

/// Compiles "items", "additionalItems", "contains", "maxItems", "minItems", "uniqueItems".
CheckList compile(const Json& schema, const Settings& settings = Settings{});

} // namespace schemac::compiler::array
