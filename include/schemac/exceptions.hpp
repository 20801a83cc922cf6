#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace schemac
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Why a keyword failed, either while compiling a schema or while validating a value.
enum class Reason
{
    // Schema-definition reasons
    WrongKeywordType,   ///< keyword value has the wrong JSON type
    NotPositiveInteger, ///< count threshold is not a positive whole number
    InvalidDependency,  ///< dependency entry is neither a string list nor a schema
    InvalidPattern,     ///< regular expression does not compile
    DuplicateEntry,     ///< list keyword repeats an entry
    UnknownType,        ///< "type" names no known value type
    NotPositive,        ///< numeric keyword must be greater than zero

    // Validation reasons
    Invalid,         ///< value matched against a `false` schema
    TypeMismatch,    ///< value doesn't match the "type" keyword
    OutOfRange,      ///< number outside maximum/minimum bounds
    NotMultiple,     ///< number is not a multiple of "multipleOf"
    TooShort,        ///< count below a "min*" keyword
    TooLong,         ///< count above a "max*" keyword
    PatternMismatch, ///< string doesn't match "pattern"
    FormatMismatch,  ///< string doesn't match "format"
    MissingProperty, ///< object lacks a required property
    UnknownProperty, ///< object has a property "additionalProperties" forbids
    MissingDependency, ///< object has a key whose dependent keys are absent
    NotEnum,         ///< value matches no "enum"/"const" entry
    NotUnique,       ///< array items repeat
    NoneContained    ///< no array item matches "contains"
};

const char* reason_string(Reason reason) noexcept;

/// Error attributed to a single schema keyword. `what()` reads `#<keyword>: <message>`.
struct KeywordError : public Error
{
    KeywordError(std::string keyword, Reason reason, const std::string& message)
        : Error("#" + keyword + ": " + message), keyword_(std::move(keyword)), reason_(reason)
    {
    }

    const std::string& keyword() const noexcept
    {
        return keyword_;
    }

    Reason reason() const noexcept
    {
        return reason_;
    }

  private:
    std::string keyword_;
    Reason reason_;
};

/// Raised while compiling: a keyword's declared value is malformed.
struct SchemaError : public KeywordError
{
    using KeywordError::KeywordError;
};

/// Raised while validating: a value violates a keyword's constraint.
struct ValidationError : public KeywordError
{
    using KeywordError::KeywordError;
};

} // namespace schemac
