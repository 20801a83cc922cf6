#include "schemac/schema.hpp"
#include "schemac/compiler/array.hpp"
#include "schemac/compiler/boolean.hpp"
#include "schemac/compiler/common.hpp"
#include "schemac/compiler/number.hpp"
#include "schemac/compiler/object.hpp"
#include "schemac/compiler/predicates.hpp"
#include "schemac/compiler/string.hpp"
#include "schemac/logging.hpp"

#include <utility>

namespace schemac
{
namespace
{

// Keywords whose value maps names to sub-schemas.
constexpr const char* kSchemaMapKeywords[] = {"properties", "patternProperties", "dependencies"};

// Keywords whose value is a single sub-schema.
constexpr const char* kSchemaKeywords[] = {"additionalProperties", "propertyNames",
                                           "additionalItems", "contains"};

std::string escape_pointer_token(const std::string& token)
{
    std::string out;
    out.reserve(token.size());
    for (char c : token)
    {
        if (c == '~')
            out += "~0";
        else if (c == '/')
            out += "~1";
        else
            out += c;
    }
    return out;
}

void append(CheckList& to, CheckList from)
{
    for (auto& check : from)
        to.push_back(std::move(check));
}

struct Kinds
{
    bool object{false};
    bool array{false};
    bool string{false};
    bool number{false};
    bool boolean{false};

    void add(ValueType type)
    {
        switch (type)
        {
        case ValueType::Object:
            object = true;
            break;
        case ValueType::Array:
            array = true;
            break;
        case ValueType::String:
            string = true;
            break;
        case ValueType::Number:
        case ValueType::Integer:
            number = true;
            break;
        case ValueType::Boolean:
            boolean = true;
            break;
        case ValueType::Null:
            break;
        }
    }
};

Kinds select_kinds(const Json* type)
{
    Kinds kinds;
    if (!type)
    {
        kinds.object = kinds.array = kinds.string = kinds.number = kinds.boolean = true;
        return kinds;
    }
    // unknown names were already rejected by the common compiler
    ValueType parsed;
    if (type->is_string())
    {
        if (value_type_from_string(type->get<std::string>(), parsed))
            kinds.add(parsed);
    }
    else if (type->is_array())
    {
        for (const auto& name : *type)
            if (name.is_string() && value_type_from_string(name.get<std::string>(), parsed))
                kinds.add(parsed);
    }
    return kinds;
}

} // namespace

CheckList compile_node(const Json& node, const Settings& settings)
{
    if (node.is_boolean())
        return {};
    if (!node.is_object())
        throw SchemaError("schema", Reason::WrongKeywordType,
                          "schema must be an object or a boolean");

    // compiled first so a bad "type" is reported before anything else
    CheckList common = compiler::common::compile(node, settings);

    CheckList checks;
    Kinds kinds = select_kinds(find_keyword(node, "type"));
    if (kinds.object)
        append(checks, compiler::object::compile(node, settings));
    if (kinds.array)
        append(checks, compiler::array::compile(node, settings));
    if (kinds.string)
        append(checks, compiler::string::compile(node, settings));
    if (kinds.number)
        append(checks, compiler::number::compile(node, settings));
    if (kinds.boolean)
        append(checks, compiler::boolean::compile(node, settings));
    append(checks, std::move(common));
    return checks;
}

Schema::Schema(Json root, Settings settings)
    : root_(std::move(root)), settings_(std::move(settings)),
      cache_(
          [this](const Json& node)
          {
              // reached only for nodes the tree walk has not seen
              auto checks = schemac::compile_node(node, settings_);
              log::debug("compiled sub-schema on demand: " + std::to_string(checks.size()) +
                         " check(s)");
              if (observer_)
                  observer_(node, std::string());
              return checks;
          })
{
    if (settings_.eager_compile)
        compile();
}

void Schema::compile_tree(const Json& node, const std::string& pointer)
{
    if (!cache_.find(node))
    {
        const CheckList& checks = cache_.store(node, schemac::compile_node(node, settings_));
        log::debug("compiled " + (pointer.empty() ? std::string("#") : pointer) + ": " +
                   std::to_string(checks.size()) + " check(s)");
        if (observer_)
            observer_(node, pointer);
    }
    if (!node.is_object())
        return;

    for (const char* keyword : kSchemaMapKeywords)
    {
        const Json* map = find_keyword(node, keyword);
        if (!map || !map->is_object())
            continue;
        for (auto it = map->begin(); it != map->end(); ++it)
        {
            // array-form dependencies are not schemas
            if (predicates::is_schema(it.value()))
                compile_tree(it.value(), pointer + "/" + keyword + "/" + escape_pointer_token(it.key()));
        }
    }

    for (const char* keyword : kSchemaKeywords)
    {
        const Json* sub = find_keyword(node, keyword);
        if (sub && predicates::is_schema(*sub))
            compile_tree(*sub, pointer + "/" + keyword);
    }

    if (const Json* items = find_keyword(node, "items"))
    {
        if (items->is_array())
        {
            for (std::size_t i = 0; i < items->size(); ++i)
                compile_tree((*items)[i], pointer + "/items/" + std::to_string(i));
        }
        else
        {
            compile_tree(*items, pointer + "/items");
        }
    }
}

void Schema::compile()
{
    try
    {
        compile_tree(root_, "");
    }
    catch (const SchemaError& e)
    {
        // a partially compiled tree must not be used
        cache_.clear();
        compiled_ = false;
        log::warning(std::string("schema compilation failed: ") + e.what());
        throw;
    }
    compiled_ = true;
}

void Schema::recompile()
{
    log::info("recompiling schema (" + std::to_string(cache_.size()) + " cached node(s) dropped)");
    cache_.clear();
    compiled_ = false;
    compile();
}

void Schema::validate(const Json& value)
{
    if (!compiled_)
        compile();
    run_compiled(value, SchemaRef(root_, cache_), cache_.get(root_));
}

bool Schema::is_valid(const Json& value)
{
    try
    {
        validate(value);
    }
    catch (const ValidationError&)
    {
        return false;
    }
    return true;
}

} // namespace schemac
