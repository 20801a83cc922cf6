#pragma once

/// @file schemac.hpp
/// @brief Main header for schemac - includes the commonly used components
///
/// Usage:
/// @code
/// #include <schemac.hpp>
///
/// int main() {
///     schemac::Schema schema(schemac::Json{
///         {"type", "object"},
///         {"required", {"name"}},
///         {"properties", {{"name", {{"type", "string"}}}}},
///     });
///     schema.validate(schemac::Json{{"name", "Ada"}});
/// }
/// @endcode

// Core types, errors and configuration
#include "schemac/types.hpp"
#include "schemac/exceptions.hpp"
#include "schemac/settings.hpp"
#include "schemac/logging.hpp"

// Orchestration
#include "schemac/schema.hpp"
#include "schemac/check_cache.hpp"

// Compilers and their primitives
#include "schemac/compiler/check.hpp"
#include "schemac/compiler/predicates.hpp"
#include "schemac/compiler/pattern.hpp"
#include "schemac/compiler/object.hpp"
#include "schemac/compiler/number.hpp"
#include "schemac/compiler/string.hpp"
#include "schemac/compiler/array.hpp"
#include "schemac/compiler/boolean.hpp"
#include "schemac/compiler/common.hpp"
