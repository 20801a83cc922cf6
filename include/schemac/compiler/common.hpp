#pragma once
#include "schemac/compiler/check.hpp"
#include "schemac/settings.hpp"

namespace schemac::compiler::common
{

/// Compiles keywords that apply to every kind of value: "type" (name validation and the
/// "null" type check), "enum" and "const".
CheckList compile(const Json& schema, const Settings& settings = Settings{});

} // namespace schemac::compiler::common
