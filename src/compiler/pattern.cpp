#include "schemac/compiler/pattern.hpp"
#include "schemac/exceptions.hpp"

#include <re2/re2.h>

#include <utility>

namespace schemac::compiler
{

Pattern::Pattern(const std::string& source, const char* keyword) : source_(source)
{
    re2::RE2::Options options;
    options.set_log_errors(false);
    auto re = std::make_shared<re2::RE2>(source, options);
    if (!re->ok())
        throw SchemaError(keyword, Reason::InvalidPattern,
                          "invalid regular expression '" + source + "': " + re->error());
    re_ = std::move(re);
}

bool Pattern::search(const std::string& text) const
{
    return re2::RE2::PartialMatch(text, *re_);
}

bool Pattern::match(const std::string& text) const
{
    return re2::RE2::FullMatch(text, *re_);
}

} // namespace schemac::compiler
