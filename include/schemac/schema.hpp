#pragma once
#include "schemac/check_cache.hpp"
#include "schemac/exceptions.hpp"
#include "schemac/settings.hpp"
#include "schemac/types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace schemac
{

/// Owns a schema tree and the compiled checks of every node in it.
///
/// Nodes are compiled at most once: the first validation (or an explicit compile())
/// walks the tree, compiles each node with the compilers its "type" selects, and
/// caches the result. Later validations only run the cached checks.
///
/// @note Not thread-safe. One writer per schema; mutating the tree while a
///       validation is running is undefined.
class Schema
{
  public:
    /// Fired once for every node compiled, with the node's JSON pointer.
    using CompileObserver = std::function<void(const Json& node, const std::string& pointer)>;

    explicit Schema(Json root, Settings settings = Settings{});

    Schema(const Schema&) = delete;
    Schema& operator=(const Schema&) = delete;

    const Json& root() const
    {
        return root_;
    }

    /// Writable access to the tree. Changing a keyword's value in place is picked up
    /// by the next validation; adding or removing keywords or sub-schemas requires
    /// recompile().
    Json& mutable_root()
    {
        return root_;
    }

    const Settings& settings() const
    {
        return settings_;
    }

    void set_compile_observer(CompileObserver observer)
    {
        observer_ = std::move(observer);
    }

    /// Compiles every node not yet in the cache.
    /// @throws SchemaError if any node is malformed; the cache is left empty.
    void compile();

    /// Drops all cached checks and compiles the tree again.
    void recompile();

    bool compiled() const
    {
        return compiled_;
    }

    std::size_t compiled_nodes() const
    {
        return cache_.size();
    }

    /// @throws ValidationError on the first violated keyword.
    /// @throws SchemaError if the schema has not been compiled and is malformed.
    void validate(const Json& value);

    /// Like validate(), but reports a violation as `false`. Schema errors still throw.
    bool is_valid(const Json& value);

  private:
    void compile_tree(const Json& node, const std::string& pointer);

    Json root_;
    Settings settings_;
    CheckCache cache_;
    CompileObserver observer_;
    bool compiled_{false};
};

/// Compiles one node with the compilers its "type" keyword selects, without caching.
/// A missing "type" runs every type compiler; boolean nodes yield no checks.
CheckList compile_node(const Json& node, const Settings& settings = Settings{});

} // namespace schemac
