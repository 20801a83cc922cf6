#include "schemac/compiler/number.hpp"
#include "schemac/compiler/predicates.hpp"

#include <cmath>
#include <cstdint>
#include <string>

namespace schemac::compiler::number
{
namespace
{

using predicates::is_boolean;
using predicates::is_number;
using predicates::Predicate;

bool is_numeric_type(const Json* type)
{
    return type && (*type == "number" || *type == "integer");
}

// A bound must match the node's numeric kind; its exclusivity keyword is either a
// boolean modifier or a standalone numeric bound.
void check_bound(const Json* bound, const Json* exclusive, const char* keyword,
                 const char* exclusive_keyword, Predicate assertion)
{
    if (bound && !assertion(*bound))
        throw SchemaError(keyword, Reason::WrongKeywordType, "keyword is not the right type");
    if (exclusive && !is_number(*exclusive) && !is_boolean(*exclusive))
        throw SchemaError(exclusive_keyword, Reason::WrongKeywordType,
                          "keyword is not a boolean or a number");
}

bool flag_set(const Json* flag)
{
    return flag && flag->is_boolean() && flag->get<bool>();
}

template <typename T>
int three_way(T a, T b)
{
    return (a > b) - (a < b);
}

// Orders two numbers. Integers compare exactly across their signed and unsigned
// storage; anything involving a float compares as doubles.
int compare(const Json& a, const Json& b)
{
    if (!a.is_number_integer() || !b.is_number_integer())
        return three_way(a.get<double>(), b.get<double>());

    bool a_unsigned = a.is_number_unsigned();
    bool b_unsigned = b.is_number_unsigned();
    if (a_unsigned == b_unsigned)
    {
        if (a_unsigned)
            return three_way(a.get<std::uint64_t>(), b.get<std::uint64_t>());
        return three_way(a.get<std::int64_t>(), b.get<std::int64_t>());
    }
    // a negative signed value is below every unsigned one
    if (a_unsigned)
    {
        std::int64_t y = b.get<std::int64_t>();
        return y < 0 ? 1 : three_way(a.get<std::uint64_t>(), static_cast<std::uint64_t>(y));
    }
    std::int64_t x = a.get<std::int64_t>();
    return x < 0 ? -1 : three_way(static_cast<std::uint64_t>(x), b.get<std::uint64_t>());
}

std::uint64_t magnitude(const Json& n)
{
    if (n.is_number_unsigned())
        return n.get<std::uint64_t>();
    std::int64_t v = n.get<std::int64_t>();
    return v < 0 ? static_cast<std::uint64_t>(-(v + 1)) + 1 : static_cast<std::uint64_t>(v);
}

/// Two integers use an exact remainder. Otherwise exact mode reproduces a plain
/// remainder test on the quotient and tolerant mode accepts quotients within
/// `tolerance` of a whole number.
bool is_multiple(const Json& value, const Json& divisor, double tolerance)
{
    if (value.is_number_integer() && divisor.is_number_integer())
    {
        std::uint64_t d = magnitude(divisor);
        return d != 0 && magnitude(value) % d == 0;
    }
    double quotient = value.get<double>() / divisor.get<double>();
    if (!std::isfinite(quotient))
        return false;
    if (tolerance == 0.0)
        return std::fmod(quotient, 1.0) == 0.0;
    return std::fabs(quotient - std::round(quotient)) <= tolerance;
}

[[noreturn]] void fail_type(const SchemaRef& ref)
{
    const Json* type = ref.keyword("type");
    std::string name = type && type->is_string() ? type->get<std::string>() : "number";
    throw ValidationError("type", Reason::TypeMismatch, "value is not a(n) " + name);
}

} // namespace

CheckList compile(const Json& schema, const Settings& settings)
{
    if (!schema.is_object())
        return {};

    const Json* type = find_keyword(schema, "type");
    const Json* maximum = find_keyword(schema, "maximum");
    const Json* minimum = find_keyword(schema, "minimum");
    const Json* exclusive_maximum = find_keyword(schema, "exclusiveMaximum");
    const Json* exclusive_minimum = find_keyword(schema, "exclusiveMinimum");
    const Json* multiple_of = find_keyword(schema, "multipleOf");

    Predicate assertion = predicates::numeric_predicate(type);

    check_bound(maximum, exclusive_maximum, "maximum", "exclusiveMaximum", assertion);
    check_bound(minimum, exclusive_minimum, "minimum", "exclusiveMinimum", assertion);
    if (multiple_of)
    {
        if (!assertion(*multiple_of))
            throw SchemaError("multipleOf", Reason::WrongKeywordType,
                              "keyword is not the right type");
        if (multiple_of->get<double>() <= 0)
            throw SchemaError("multipleOf", Reason::NotPositive, "keyword must be greater than 0");
    }

    auto numeric = [](const Json* v) { return v && is_number(*v); };
    if (numeric(maximum) || numeric(exclusive_maximum) || numeric(minimum) ||
        numeric(exclusive_minimum) || numeric(multiple_of))
    {
        double tolerance = settings.multiple_of_tolerance;
        return {[assertion, tolerance](const Json& value, const SchemaRef& ref)
                {
                    if (!assertion(value))
                    {
                        if (is_numeric_type(ref.keyword("type")))
                            fail_type(ref);
                        return;
                    }
                    const Json* max = ref.keyword("maximum");
                    const Json* xmax = ref.keyword("exclusiveMaximum");
                    if (max && max->is_number())
                    {
                        int order = compare(value, *max);
                        if (flag_set(xmax) && order >= 0)
                            throw ValidationError("maximum", Reason::OutOfRange,
                                                  "value is greater than or equal to " + max->dump());
                        if (order > 0)
                            throw ValidationError("maximum", Reason::OutOfRange,
                                                  "value is greater than " + max->dump());
                    }
                    if (xmax && xmax->is_number() && compare(value, *xmax) >= 0)
                        throw ValidationError("exclusiveMaximum", Reason::OutOfRange,
                                              "value is greater than or equal to " + xmax->dump());

                    const Json* min = ref.keyword("minimum");
                    const Json* xmin = ref.keyword("exclusiveMinimum");
                    if (min && min->is_number())
                    {
                        int order = compare(value, *min);
                        if (flag_set(xmin) && order <= 0)
                            throw ValidationError("minimum", Reason::OutOfRange,
                                                  "value is less than or equal to " + min->dump());
                        if (order < 0)
                            throw ValidationError("minimum", Reason::OutOfRange,
                                                  "value is less than " + min->dump());
                    }
                    if (xmin && xmin->is_number() && compare(value, *xmin) <= 0)
                        throw ValidationError("exclusiveMinimum", Reason::OutOfRange,
                                              "value is less than or equal to " + xmin->dump());

                    const Json* step = ref.keyword("multipleOf");
                    if (step && step->is_number() && !is_multiple(value, *step, tolerance))
                        throw ValidationError("multipleOf", Reason::NotMultiple,
                                              "value is not a multiple of " + step->dump());
                }};
    }

    if (is_numeric_type(type))
    {
        return {[assertion](const Json& value, const SchemaRef& ref)
                {
                    if (!assertion(value))
                        fail_type(ref);
                }};
    }
    return {};
}

} // namespace schemac::compiler::number
