#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace schemac
{

using Json = nlohmann::json;

/// Value kinds a schema's "type" keyword may name.
enum class ValueType
{
    Null,
    Boolean,
    Object,
    Array,
    Number,
    Integer,
    String
};

inline std::string to_string(ValueType type)
{
    switch (type)
    {
    case ValueType::Null:
        return "null";
    case ValueType::Boolean:
        return "boolean";
    case ValueType::Object:
        return "object";
    case ValueType::Array:
        return "array";
    case ValueType::Number:
        return "number";
    case ValueType::Integer:
        return "integer";
    case ValueType::String:
        return "string";
    }
    return "null";
}

/// Returns false if `name` is not a known type name.
inline bool value_type_from_string(const std::string& name, ValueType& out)
{
    static const std::pair<const char*, ValueType> names[] = {
        {"null", ValueType::Null},       {"boolean", ValueType::Boolean},
        {"object", ValueType::Object},   {"array", ValueType::Array},
        {"number", ValueType::Number},   {"integer", ValueType::Integer},
        {"string", ValueType::String},
    };
    for (const auto& [n, t] : names)
    {
        if (name == n)
        {
            out = t;
            return true;
        }
    }
    return false;
}

} // namespace schemac
