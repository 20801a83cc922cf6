#include "schemac/compiler/string.hpp"
#include "schemac/compiler/pattern.hpp"
#include "schemac/compiler/predicates.hpp"

#include <string>
#include <utility>

namespace schemac::compiler::string
{
namespace
{

// Counts code points; continuation bytes don't start a character.
std::size_t utf8_length(const std::string& s)
{
    std::size_t count = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80)
            ++count;
    return count;
}

Check<std::string> pattern_check(const Json& pattern)
{
    if (!pattern.is_string())
        throw SchemaError("pattern", Reason::WrongKeywordType, "must be a string");
    Pattern re(pattern.get<std::string>(), "pattern");

    return [re = std::move(re)](const std::string& value, const SchemaRef&)
    {
        if (!re.search(value))
            throw ValidationError("pattern", Reason::PatternMismatch,
                                  "value does not match pattern '" + re.source() + "'");
    };
}

// Unknown formats are annotations only and produce no check.
Check<std::string> format_check(const Json& format)
{
    if (!format.is_string())
        throw SchemaError("format", Reason::WrongKeywordType, "must be a string");

    const auto& name = format.get_ref<const std::string&>();
    const char* expr = nullptr;
    if (name == "date-time")
        expr = R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(?:\.\d+)?(?:Z|[+-]\d{2}:\d{2})$)";
    else if (name == "email")
        expr = R"(^[^@\s]+@[^@\s]+\.[^@\s]+$)";
    else if (name == "uri")
        expr = R"(^[a-zA-Z][a-zA-Z0-9+.-]*:.+)";
    if (!expr)
        return nullptr;

    return [name, re = Pattern(expr, "format")](const std::string& value, const SchemaRef&)
    {
        if (!re.match(value))
            throw ValidationError("format", Reason::FormatMismatch,
                                  "value is not a valid " + name);
    };
}

} // namespace

CheckList compile(const Json& schema, const Settings&)
{
    if (!schema.is_object())
        return {};

    Checks<Measurement> lengths;
    if (const Json* max = find_keyword(schema, "maxLength"))
        lengths.push_back(size_threshold(*max, "maxLength", SizeMode::Max));
    if (const Json* min = find_keyword(schema, "minLength"))
        lengths.push_back(size_threshold(*min, "minLength", SizeMode::Min));

    Checks<std::string> content;
    if (const Json* pattern = find_keyword(schema, "pattern"))
        content.push_back(pattern_check(*pattern));
    if (const Json* format = find_keyword(schema, "format"))
    {
        if (auto check = format_check(*format))
            content.push_back(std::move(check));
    }

    if (!lengths.empty() || !content.empty())
    {
        return {[lengths = std::move(lengths), content = std::move(content)](const Json& value,
                                                                             const SchemaRef& ref)
                {
                    if (!value.is_string())
                    {
                        if (ref.declares_type("string"))
                            throw ValidationError("type", Reason::TypeMismatch,
                                                  "value is not a string");
                        return;
                    }
                    const auto& str = value.get_ref<const std::string&>();
                    if (!lengths.empty())
                    {
                        Measurement m;
                        m.length = utf8_length(str);
                        run_compiled(m, ref, lengths);
                    }
                    run_compiled(str, ref, content);
                }};
    }

    if (const Json* type = find_keyword(schema, "type"); type && *type == "string")
    {
        return {[](const Json& value, const SchemaRef&)
                {
                    if (!value.is_string())
                        throw ValidationError("type", Reason::TypeMismatch,
                                              "value is not a string");
                }};
    }
    return {};
}

} // namespace schemac::compiler::string
