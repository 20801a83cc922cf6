#include "schemac/check_cache.hpp"

namespace schemac
{

const CheckList* CheckCache::find(const Json& node) const
{
    auto it = entries_.find(&node);
    return it == entries_.end() ? nullptr : &it->second;
}

const CheckList& CheckCache::get(const Json& node)
{
    if (const CheckList* cached = find(node))
        return *cached;
    // compile_ may throw; nothing is stored in that case
    return store(node, compile_(node));
}

const CheckList& CheckCache::store(const Json& node, CheckList checks)
{
    auto& slot = entries_[&node];
    slot = std::move(checks);
    return slot;
}

void CheckCache::invalidate(const Json& node)
{
    entries_.erase(&node);
}

void CheckCache::clear()
{
    entries_.clear();
}

} // namespace schemac
