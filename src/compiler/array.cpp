#include "schemac/compiler/array.hpp"
#include "schemac/compiler/predicates.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace schemac::compiler::array
{
namespace
{

using predicates::is_schema;
using predicates::is_typed_array;

struct ItemEntry
{
    std::size_t index;
    const Json& value;
};

Check<ItemEntry> items_check(const Json& items, const Json* additional_items)
{
    if (!is_schema(items) && !is_typed_array(items, is_schema))
        throw SchemaError("items", Reason::WrongKeywordType,
                          "must be a schema or an array of schemas");
    if (additional_items && !is_schema(*additional_items))
        throw SchemaError("additionalItems", Reason::WrongKeywordType,
                          "must be either a schema or a boolean");

    return [](const ItemEntry& entry, const SchemaRef& ref)
    {
        const Json* items = ref.keyword("items");
        if (!items)
            return;
        if (!items->is_array())
        {
            validate_subschema(entry.value, ref, *items);
            return;
        }
        if (entry.index < items->size())
        {
            validate_subschema(entry.value, ref, (*items)[entry.index]);
            return;
        }

        const Json* additional = ref.keyword("additionalItems");
        if (!additional)
            return;
        if (additional->is_boolean())
        {
            if (!additional->get<bool>())
                throw ValidationError("additionalItems", Reason::TooLong,
                                      "additional items not allowed");
            return;
        }
        validate_subschema(entry.value, ref, *additional);
    };
}

Check<Json> contains_check(const Json& contains)
{
    if (!is_schema(contains))
        throw SchemaError("contains", Reason::WrongKeywordType, "must be a schema");

    return [](const Json& value, const SchemaRef& ref)
    {
        const Json* sub = ref.keyword("contains");
        if (!sub)
            return;
        for (const auto& item : value)
        {
            try
            {
                validate_subschema(item, ref, *sub);
                return;
            }
            catch (const ValidationError&)
            {
                // try the next item
            }
        }
        throw ValidationError("contains", Reason::NoneContained,
                              "no item matches the contains schema");
    };
}

Check<Json> unique_items_check(const Json& unique)
{
    if (!unique.is_boolean())
        throw SchemaError("uniqueItems", Reason::WrongKeywordType, "must be a boolean");

    return [](const Json& value, const SchemaRef& ref)
    {
        const Json* flag = ref.keyword("uniqueItems");
        if (!flag || !flag->is_boolean() || !flag->get<bool>())
            return;
        for (std::size_t i = 0; i < value.size(); ++i)
            for (std::size_t j = i + 1; j < value.size(); ++j)
                if (value[i] == value[j])
                    throw ValidationError("uniqueItems", Reason::NotUnique,
                                          "items " + std::to_string(i) + " and " +
                                              std::to_string(j) + " are equal");
    };
}

} // namespace

CheckList compile(const Json& schema, const Settings&)
{
    if (!schema.is_object())
        return {};

    Checks<ItemEntry> per_item;
    if (const Json* items = find_keyword(schema, "items"))
        per_item.push_back(items_check(*items, find_keyword(schema, "additionalItems")));
    else if (const Json* additional = find_keyword(schema, "additionalItems");
             additional && !is_schema(*additional))
        throw SchemaError("additionalItems", Reason::WrongKeywordType,
                          "must be either a schema or a boolean");

    Checks<Measurement> counts;
    if (const Json* max = find_keyword(schema, "maxItems"))
        counts.push_back(size_threshold(*max, "maxItems", SizeMode::Max));
    if (const Json* min = find_keyword(schema, "minItems"))
        counts.push_back(size_threshold(*min, "minItems", SizeMode::Min));

    Checks<Json> whole;
    if (const Json* unique = find_keyword(schema, "uniqueItems"))
        whole.push_back(unique_items_check(*unique));
    if (const Json* contains = find_keyword(schema, "contains"))
        whole.push_back(contains_check(*contains));

    if (!per_item.empty() || !counts.empty() || !whole.empty())
    {
        return {[per_item = std::move(per_item), counts = std::move(counts),
                 whole = std::move(whole)](const Json& value, const SchemaRef& ref)
                {
                    if (!value.is_array())
                    {
                        if (ref.declares_type("array"))
                            throw ValidationError("type", Reason::TypeMismatch,
                                                  "value is not an array");
                        return;
                    }

                    if (!per_item.empty())
                    {
                        for (std::size_t i = 0; i < value.size(); ++i)
                        {
                            ItemEntry entry{i, value[i]};
                            run_compiled(entry, ref, per_item);
                        }
                    }

                    Measurement m;
                    m.length = value.size();
                    run_compiled(m, ref, counts);
                    run_compiled(value, ref, whole);
                }};
    }

    if (const Json* type = find_keyword(schema, "type"); type && *type == "array")
    {
        return {[](const Json& value, const SchemaRef&)
                {
                    if (!value.is_array())
                        throw ValidationError("type", Reason::TypeMismatch,
                                              "value is not an array");
                }};
    }
    return {};
}

} // namespace schemac::compiler::array
