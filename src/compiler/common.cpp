#include "schemac/compiler/common.hpp"
#include "schemac/compiler/predicates.hpp"

#include <string>
#include <utility>
#include <vector>

namespace schemac::compiler::common
{
namespace
{

bool matches_type(const Json& value, ValueType type)
{
    switch (type)
    {
    case ValueType::Null:
        return value.is_null();
    case ValueType::Boolean:
        return value.is_boolean();
    case ValueType::Object:
        return value.is_object();
    case ValueType::Array:
        return value.is_array();
    case ValueType::Number:
        return value.is_number();
    case ValueType::Integer:
        return predicates::is_integer(value);
    case ValueType::String:
        return value.is_string();
    }
    return false;
}

ValueType parse_type(const Json& name)
{
    ValueType type;
    if (!name.is_string() || !value_type_from_string(name.get<std::string>(), type))
        throw SchemaError("type", Reason::UnknownType, "unknown type " + name.dump());
    return type;
}

// A single "type" name is enforced by that type's compiler; only "null" and
// lists of names are checked here.
CompiledCheck type_check(const Json& type)
{
    if (type.is_string())
    {
        if (parse_type(type) != ValueType::Null)
            return nullptr;
        return [](const Json& value, const SchemaRef&)
        {
            if (!value.is_null())
                throw ValidationError("type", Reason::TypeMismatch, "value is not a(n) null");
        };
    }

    if (!type.is_array() || type.empty())
        throw SchemaError("type", Reason::WrongKeywordType,
                          "must be a type name or a non-empty array of type names");
    std::vector<ValueType> allowed;
    for (const auto& name : type)
        allowed.push_back(parse_type(name));

    return [allowed, names = type.dump()](const Json& value, const SchemaRef&)
    {
        for (auto t : allowed)
            if (matches_type(value, t))
                return;
        throw ValidationError("type", Reason::TypeMismatch, "value is not any of " + names);
    };
}

CompiledCheck enum_check(const Json& values)
{
    if (!values.is_array() || values.empty())
        throw SchemaError("enum", Reason::WrongKeywordType, "must be a non-empty array");

    return [](const Json& value, const SchemaRef& ref)
    {
        const Json* allowed = ref.keyword("enum");
        if (!allowed || !allowed->is_array())
            return;
        for (const auto& candidate : *allowed)
            if (candidate == value)
                return;
        throw ValidationError("enum", Reason::NotEnum, "value is not one of the allowed values");
    };
}

} // namespace

CheckList compile(const Json& schema, const Settings&)
{
    CheckList list;
    if (const Json* type = find_keyword(schema, "type"))
    {
        if (auto check = type_check(*type))
            list.push_back(std::move(check));
    }
    if (const Json* values = find_keyword(schema, "enum"))
        list.push_back(enum_check(*values));
    if (find_keyword(schema, "const"))
    {
        list.push_back(
            [](const Json& value, const SchemaRef& ref)
            {
                const Json* expected = ref.keyword("const");
                if (expected && *expected != value)
                    throw ValidationError("const", Reason::NotEnum,
                                          "value does not equal " + expected->dump());
            });
    }
    return list;
}

} // namespace schemac::compiler::common
