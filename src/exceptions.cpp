#include "schemac/exceptions.hpp"

namespace schemac
{

const char* reason_string(Reason reason) noexcept
{
    switch (reason)
    {
    case Reason::WrongKeywordType:
        return "wrong keyword type";
    case Reason::NotPositiveInteger:
        return "not a positive integer";
    case Reason::InvalidDependency:
        return "invalid dependency";
    case Reason::InvalidPattern:
        return "invalid pattern";
    case Reason::DuplicateEntry:
        return "duplicate entry";
    case Reason::UnknownType:
        return "unknown type";
    case Reason::NotPositive:
        return "not positive";
    case Reason::Invalid:
        return "invalid";
    case Reason::TypeMismatch:
        return "type mismatch";
    case Reason::OutOfRange:
        return "out of range";
    case Reason::NotMultiple:
        return "not a multiple";
    case Reason::TooShort:
        return "too short";
    case Reason::TooLong:
        return "too long";
    case Reason::PatternMismatch:
        return "pattern mismatch";
    case Reason::FormatMismatch:
        return "format mismatch";
    case Reason::MissingProperty:
        return "missing property";
    case Reason::UnknownProperty:
        return "unknown property";
    case Reason::MissingDependency:
        return "missing dependency";
    case Reason::NotEnum:
        return "not in enum";
    case Reason::NotUnique:
        return "not unique";
    case Reason::NoneContained:
        return "none contained";
    }
    return "unknown";
}

} // namespace schemac
