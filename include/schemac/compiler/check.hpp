#pragma once
#include "schemac/exceptions.hpp"
#include "schemac/types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace schemac
{

class CheckCache;

/// The keyword's value in an object schema node, or nullptr.
inline const Json* find_keyword(const Json& schema, const char* name)
{
    if (!schema.is_object())
        return nullptr;
    auto it = schema.find(name);
    return it == schema.end() ? nullptr : &*it;
}

/// The validation context handed to every compiled check: the live schema node,
/// plus the cache holding the compiled lists of its sub-schemas.
///
/// Checks read keyword values through the ref at call time rather than capturing
/// them while compiling, so an in-place change to a keyword's value is observed
/// without recompiling.
class SchemaRef
{
  public:
    SchemaRef(const Json& node, CheckCache& cache) : node_(&node), cache_(&cache) {}

    const Json& node() const
    {
        return *node_;
    }

    /// The keyword's value, or nullptr when the node is not an object or lacks it.
    const Json* keyword(const char* name) const
    {
        return find_keyword(*node_, name);
    }

    const Json* keyword(const std::string& name) const
    {
        return find_keyword(*node_, name.c_str());
    }

    /// True if the node's "type" keyword is exactly `type`.
    bool declares_type(const char* type) const
    {
        const Json* t = keyword("type");
        return t && t->is_string() && t->get_ref<const std::string&>() == type;
    }

    bool is_false() const
    {
        return node_->is_boolean() && !node_->get<bool>();
    }

    SchemaRef child(const Json& sub) const
    {
        return SchemaRef(sub, *cache_);
    }

    CheckCache& cache() const
    {
        return *cache_;
    }

  private:
    const Json* node_;
    CheckCache* cache_;
};

template <typename Input>
using Check = std::function<void(const Input&, const SchemaRef&)>;

template <typename Input>
using Checks = std::vector<Check<Input>>;

using CompiledCheck = Check<Json>;
using CheckList = Checks<Json>;

/// One own key of an object value, visited during the single per-key pass.
struct KeyEntry
{
    const Json& object;
    const std::string& key;
    const Json& value;
    /// Set by the pattern-property check when the key matched any pattern.
    mutable bool pattern_matched{false};
};

/// Counts gathered from a value and fed to whole-value checks.
struct Measurement
{
    std::size_t length{0};
    std::size_t required_count{0};
};

[[noreturn]] void fail_false_schema();

/// Runs `checks` in order against `input`. A `false` node rejects before any check
/// runs; otherwise the first failing check's error propagates and stops the rest.
template <typename Input>
void run_compiled(const Input& input, const SchemaRef& ref, const Checks<Input>& checks)
{
    if (ref.is_false())
        fail_false_schema();
    for (const auto& check : checks)
        check(input, ref);
}

/// Validates `value` against the sub-schema `node` using its cached check list,
/// compiling the sub-schema first if the cache has no entry for it.
void validate_subschema(const Json& value, const SchemaRef& ref, const Json& node);

enum class SizeMode
{
    Max,
    Min
};

/// Builds a count check for a "max*"/"min*" keyword. Throws SchemaError unless `size`
/// is a positive whole number. The returned check reads the threshold from
/// `ref[keyword]` when it runs, so one check serves any node using that keyword.
Check<Measurement> size_threshold(const Json& size, const std::string& keyword, SizeMode mode);

} // namespace schemac
