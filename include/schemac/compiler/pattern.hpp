#pragma once
#include <memory>
#include <string>

namespace re2
{
class RE2;
}

namespace schemac::compiler
{

/// A compiled regular expression for "pattern", "patternProperties" and "format".
///
/// Matching runs in time linear in the input and never recurses per character, so
/// arbitrarily long keys and strings are safe to test. Copies share the compiled
/// program.
class Pattern
{
  public:
    /// Throws SchemaError(keyword, Reason::InvalidPattern) if `source` does not compile.
    Pattern(const std::string& source, const char* keyword);

    const std::string& source() const
    {
        return source_;
    }

    /// True if the expression matches anywhere in `text`.
    bool search(const std::string& text) const;

    /// True if the expression matches all of `text`.
    bool match(const std::string& text) const;

  private:
    std::string source_;
    std::shared_ptr<const re2::RE2> re_;
};

} // namespace schemac::compiler
