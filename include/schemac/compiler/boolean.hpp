#pragma once
#include "schemac/compiler/check.hpp"
#include "schemac/settings.hpp"

namespace schemac::compiler::boolean
{

/// Booleans have no keywords of their own; yields a type check when "type" is "boolean".
CheckList compile(const Json& schema, const Settings& settings = Settings{});

} // namespace schemac::compiler::boolean
