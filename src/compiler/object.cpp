#include "schemac/compiler/object.hpp"
#include "schemac/compiler/pattern.hpp"
#include "schemac/compiler/predicates.hpp"

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace schemac::compiler::object
{
namespace
{

using predicates::is_boolean;
using predicates::is_enum;
using predicates::is_object;
using predicates::is_schema;
using predicates::is_string;
using predicates::is_typed_array;

// "properties", "patternProperties", "additionalProperties"
Checks<KeyEntry> property_checks(const Json& schema)
{
    Checks<KeyEntry> list;

    if (const Json* properties = find_keyword(schema, "properties"))
    {
        if (!is_object(*properties))
            throw SchemaError("properties", Reason::WrongKeywordType, "must be an object");
        for (const auto& sub : *properties)
            if (!is_schema(sub))
                throw SchemaError("properties", Reason::WrongKeywordType,
                                  "every property must map to a schema");

        list.push_back(
            [](const KeyEntry& entry, const SchemaRef& ref)
            {
                const Json* props = ref.keyword("properties");
                if (!props || !props->is_object())
                    return;
                auto it = props->find(entry.key);
                if (it != props->end() && is_schema(*it))
                    validate_subschema(entry.value, ref, *it);
            });
    }

    if (const Json* pattern_properties = find_keyword(schema, "patternProperties"))
    {
        if (!is_object(*pattern_properties))
            throw SchemaError("patternProperties", Reason::WrongKeywordType, "must be an object");

        std::vector<Pattern> patterns;
        for (auto it = pattern_properties->begin(); it != pattern_properties->end(); ++it)
        {
            if (!is_schema(it.value()))
                throw SchemaError("patternProperties", Reason::WrongKeywordType,
                                  "every pattern must map to a schema");
            patterns.emplace_back(it.key(), "patternProperties");
        }

        list.push_back(
            [patterns = std::move(patterns)](const KeyEntry& entry, const SchemaRef& ref)
            {
                const Json* pattern_props = ref.keyword("patternProperties");
                for (const auto& pattern : patterns)
                {
                    if (!pattern.search(entry.key))
                        continue;
                    entry.pattern_matched = true;
                    if (!pattern_props)
                        continue;
                    auto it = pattern_props->find(pattern.source());
                    if (it != pattern_props->end())
                        validate_subschema(entry.value, ref, *it);
                }
            });
    }

    if (const Json* additional = find_keyword(schema, "additionalProperties"))
    {
        auto is_additional = [](const KeyEntry& entry, const SchemaRef& ref)
        {
            if (entry.pattern_matched)
                return false;
            const Json* props = ref.keyword("properties");
            return !(props && props->is_object() && props->contains(entry.key));
        };

        if (is_object(*additional))
        {
            list.push_back(
                [is_additional](const KeyEntry& entry, const SchemaRef& ref)
                {
                    if (!is_additional(entry, ref))
                        return;
                    if (const Json* sub = ref.keyword("additionalProperties"))
                        validate_subschema(entry.value, ref, *sub);
                });
        }
        else if (is_boolean(*additional))
        {
            // `true` allows anything, so only `false` needs a check
            if (!additional->get<bool>())
            {
                list.push_back(
                    [is_additional](const KeyEntry& entry, const SchemaRef& ref)
                    {
                        if (is_additional(entry, ref))
                            throw ValidationError("additionalProperties", Reason::UnknownProperty,
                                                  "additional property '" + entry.key +
                                                      "' not allowed");
                    });
            }
        }
        else
        {
            throw SchemaError("additionalProperties", Reason::WrongKeywordType,
                              "must be either a schema or a boolean");
        }
    }

    return list;
}

Check<KeyEntry> dependencies_check(const Json& dependencies)
{
    if (!is_object(dependencies))
        throw SchemaError("dependencies", Reason::WrongKeywordType, "must be an object");
    for (const auto& dep : dependencies)
    {
        if (!(is_enum(dep, is_string) || is_schema(dep)))
            throw SchemaError("dependencies", Reason::InvalidDependency,
                              "all dependencies must either be schemas or non-empty arrays of "
                              "strings");
    }

    return [](const KeyEntry& entry, const SchemaRef& ref)
    {
        const Json* deps = ref.keyword("dependencies");
        if (!deps || !deps->is_object())
            return;
        auto it = deps->find(entry.key);
        if (it == deps->end())
            return;

        if (it->is_array())
        {
            for (const auto& companion : *it)
            {
                if (!companion.is_string())
                    continue;
                const auto& name = companion.get_ref<const std::string&>();
                if (!entry.object.contains(name))
                    throw ValidationError("dependencies", Reason::MissingDependency,
                                          "value has '" + entry.key + "' but not its dependency '" +
                                              name + "'");
            }
        }
        else
        {
            // schema dependencies constrain the whole object, not just this key
            validate_subschema(entry.object, ref, *it);
        }
    };
}

Check<KeyEntry> property_names_check(const Json& property_names)
{
    if (!is_schema(property_names))
        throw SchemaError("propertyNames", Reason::WrongKeywordType, "must be a schema");

    return [](const KeyEntry& entry, const SchemaRef& ref)
    {
        if (const Json* names = ref.keyword("propertyNames"))
            validate_subschema(Json(entry.key), ref, *names);
    };
}

struct RequiredKeys
{
    std::unordered_set<std::string> keys;
    Check<Measurement> check;
};

RequiredKeys required_check(const Json* required)
{
    RequiredKeys out;
    if (!required)
        return out;
    if (!is_typed_array(*required, is_string))
        throw SchemaError("required", Reason::WrongKeywordType,
                          "required properties must be defined in an array of strings");

    for (const auto& name : *required)
    {
        if (!out.keys.insert(name.get<std::string>()).second)
            throw SchemaError("required", Reason::DuplicateEntry,
                              "'" + name.get<std::string>() + "' is listed more than once");
    }

    out.check = [](const Measurement& m, const SchemaRef& ref)
    {
        const Json* req = ref.keyword("required");
        if (req && req->is_array() && m.required_count != req->size())
            throw ValidationError("required", Reason::MissingProperty,
                                  "value does not have all required properties");
    };
    return out;
}

} // namespace

CheckList compile(const Json& schema, const Settings&)
{
    if (!schema.is_object())
        return {};

    Checks<KeyEntry> per_key = property_checks(schema);
    if (const Json* dependencies = find_keyword(schema, "dependencies"))
        per_key.push_back(dependencies_check(*dependencies));
    if (const Json* property_names = find_keyword(schema, "propertyNames"))
        per_key.push_back(property_names_check(*property_names));

    Checks<Measurement> whole;
    RequiredKeys required = required_check(find_keyword(schema, "required"));
    if (required.check)
        whole.push_back(std::move(required.check));
    if (const Json* max = find_keyword(schema, "maxProperties"))
        whole.push_back(size_threshold(*max, "maxProperties", SizeMode::Max));
    if (const Json* min = find_keyword(schema, "minProperties"))
        whole.push_back(size_threshold(*min, "minProperties", SizeMode::Min));

    if (!per_key.empty() || !whole.empty())
    {
        return {[per_key = std::move(per_key), whole = std::move(whole),
                 required_keys = std::move(required.keys)](const Json& value, const SchemaRef& ref)
                {
                    if (!value.is_object())
                    {
                        if (ref.declares_type("object"))
                            throw ValidationError("type", Reason::TypeMismatch,
                                                  "value is not an object");
                        return;
                    }

                    Measurement m;
                    m.length = value.size();

                    // one pass: per-key checks and the required tally together
                    if (!per_key.empty() || !required_keys.empty())
                    {
                        for (auto it = value.begin(); it != value.end(); ++it)
                        {
                            if (required_keys.count(it.key()))
                                ++m.required_count;
                            if (!per_key.empty())
                            {
                                KeyEntry entry{value, it.key(), it.value()};
                                run_compiled(entry, ref, per_key);
                            }
                        }
                    }

                    if (!whole.empty())
                        run_compiled(m, ref, whole);
                }};
    }

    if (const Json* type = find_keyword(schema, "type"); type && *type == "object")
    {
        return {[](const Json& value, const SchemaRef&)
                {
                    if (!value.is_object())
                        throw ValidationError("type", Reason::TypeMismatch,
                                              "value is not an object");
                }};
    }
    return {};
}

} // namespace schemac::compiler::object
