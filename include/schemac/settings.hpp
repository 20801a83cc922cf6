#pragma once
#include "schemac/types.hpp"

#include <string>

namespace schemac
{

struct Settings
{
    std::string log_level{"INFO"};
    /// Largest distance from a whole quotient still accepted by "multipleOf".
    /// Zero selects an exact remainder comparison.
    double multiple_of_tolerance{1e-9};
    /// Compile the whole tree when a Schema is constructed instead of on first use.
    bool eager_compile{false};

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace schemac
