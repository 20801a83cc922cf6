#include "schemac/compiler/boolean.hpp"

namespace schemac::compiler::boolean
{

CheckList compile(const Json& schema, const Settings&)
{
    const Json* type = find_keyword(schema, "type");
    if (!type || *type != "boolean")
        return {};

    return {[](const Json& value, const SchemaRef&)
            {
                if (!value.is_boolean())
                    throw ValidationError("type", Reason::TypeMismatch, "value is not a boolean");
            }};
}

} // namespace schemac::compiler::boolean
