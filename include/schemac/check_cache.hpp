#pragma once
#include "schemac/compiler/check.hpp"

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>

namespace schemac
{

/// Side table associating each schema node, by identity, with its compiled checks.
///
/// Entries live outside the node so they never show up when a node's keywords are
/// enumerated. Node addresses stay valid while the owning tree is not structurally
/// modified; callers that add or remove keywords must invalidate or clear.
class CheckCache
{
  public:
    using CompileFn = std::function<CheckList(const Json&)>;

    explicit CheckCache(CompileFn compile) : compile_(std::move(compile)) {}

    CheckCache(const CheckCache&) = delete;
    CheckCache& operator=(const CheckCache&) = delete;

    const CheckList* find(const Json& node) const;

    /// Returns the cached list for `node`, compiling and storing it on a miss.
    /// A failed compile stores nothing.
    const CheckList& get(const Json& node);

    const CheckList& store(const Json& node, CheckList checks);
    void invalidate(const Json& node);
    void clear();

    std::size_t size() const
    {
        return entries_.size();
    }

  private:
    CompileFn compile_;
    std::unordered_map<const Json*, CheckList> entries_;
};

} // namespace schemac
