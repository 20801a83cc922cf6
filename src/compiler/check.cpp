#include "schemac/compiler/check.hpp"
#include "schemac/check_cache.hpp"
#include "schemac/compiler/predicates.hpp"

namespace schemac
{

void fail_false_schema()
{
    throw ValidationError("false", Reason::Invalid, "schema invalidates all values");
}

void validate_subschema(const Json& value, const SchemaRef& ref, const Json& node)
{
    const CheckList& checks = ref.cache().get(node);
    run_compiled(value, ref.child(node), checks);
}

Check<Measurement> size_threshold(const Json& size, const std::string& keyword, SizeMode mode)
{
    if (!(predicates::is_integer(size) && size.get<double>() > 0))
        throw SchemaError(keyword, Reason::NotPositiveInteger, "keyword must be a positive integer");

    if (mode == SizeMode::Max)
    {
        return [keyword](const Measurement& m, const SchemaRef& ref)
        {
            const Json* limit = ref.keyword(keyword);
            if (limit && limit->is_number() && static_cast<double>(m.length) > limit->get<double>())
                throw ValidationError(keyword, Reason::TooLong, "value maximum exceeded");
        };
    }
    return [keyword](const Measurement& m, const SchemaRef& ref)
    {
        const Json* limit = ref.keyword(keyword);
        if (limit && limit->is_number() && static_cast<double>(m.length) < limit->get<double>())
            throw ValidationError(keyword, Reason::TooShort, "value minimum not met");
    };
}

} // namespace schemac
