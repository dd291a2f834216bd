#pragma once

#include <functional>
#include <map>
#include <utility>

namespace adabench {

// ─── Lookup Cache ──────────────────────────────────────────────
// Lazily populated memo table for lookups that are pure functions of
// their key (compiler identity, checked-out revision). Entries are
// never invalidated.

template <typename Key, typename Value>
class LookupCache {
public:
    using Compute = std::function<Value(const Key&)>;

    explicit LookupCache(Compute compute) : compute_(std::move(compute)) {}

    const Value& get(const Key& key) {
        auto it = entries_.find(key);
        if (it != entries_.end()) return it->second;
        Value value = compute_(key);
        return entries_.emplace(key, std::move(value)).first->second;
    }

    bool contains(const Key& key) const { return entries_.count(key) > 0; }
    size_t size() const { return entries_.size(); }

private:
    Compute compute_;
    std::map<Key, Value> entries_;
};

} // namespace adabench
