#pragma once
#include "schemac/types.hpp"

#include <cmath>
#include <string>

namespace schemac::predicates
{

inline bool is_object(const Json& v)
{
    return v.is_object();
}

inline bool is_array(const Json& v)
{
    return v.is_array();
}

inline bool is_string(const Json& v)
{
    return v.is_string();
}

inline bool is_boolean(const Json& v)
{
    return v.is_boolean();
}

inline bool is_number(const Json& v)
{
    return v.is_number();
}

/// Integers stored as doubles (2.0) count as integers.
inline bool is_integer(const Json& v)
{
    if (v.is_number_integer())
        return true;
    if (!v.is_number_float())
        return false;
    double d = v.get<double>();
    return std::isfinite(d) && d == std::floor(d);
}

/// A schema is an object of keywords, or a boolean accepting/rejecting everything.
inline bool is_schema(const Json& v)
{
    return v.is_object() || v.is_boolean();
}

/// True for an array whose every element satisfies `pred`. Empty arrays qualify.
template <typename Pred>
bool is_typed_array(const Json& v, Pred pred)
{
    if (!v.is_array())
        return false;
    for (const auto& item : v)
        if (!pred(item))
            return false;
    return true;
}

/// A non-empty typed array.
template <typename Pred>
bool is_enum(const Json& v, Pred pred)
{
    return is_typed_array(v, pred) && !v.empty();
}

using Predicate = bool (*)(const Json&);

/// Number predicate selected by a node's "type": integer semantics for "integer".
inline Predicate numeric_predicate(const Json* type)
{
    if (type && type->is_string() && type->get_ref<const std::string&>() == "integer")
        return &is_integer;
    return &is_number;
}

} // namespace schemac::predicates
