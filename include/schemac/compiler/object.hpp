#pragma once
#include "schemac/compiler/check.hpp"
#include "schemac/settings.hpp"

namespace schemac::compiler::object
{

/// Compiles "properties", "patternProperties", "additionalProperties", "dependencies",
/// "propertyNames", "required", "maxProperties" and "minProperties" into at most one
/// check. Per-key keywords run during a single pass over the object's own keys;
/// count keywords run once after it.
/// @throws SchemaError if any of those keywords is malformed.
CheckList compile(const Json& schema, const Settings& settings = Settings{});

} // namespace schemac::compiler::object
