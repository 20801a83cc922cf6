#pragma once
#include "schemac/compiler/check.hpp"
#include "schemac/settings.hpp"

namespace schemac::compiler::string
{

/// Compiles "minLength", "maxLength" (in code points), "pattern" and "format".
CheckList compile(const Json& schema, const Settings& settings = Settings{});

} // namespace schemac::compiler::string
