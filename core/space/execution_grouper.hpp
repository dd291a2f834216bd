#pragma once

#include "space/benchmark_description.hpp"
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace adabench {

/// Expensive-setup key shared by a group of descriptions.
struct ExecutionKey {
    std::string compiler;
    std::vector<std::string> cmake_args;

    bool operator==(const ExecutionKey& other) const {
        return compiler == other.compiler && cmake_args == other.cmake_args;
    }
    bool operator!=(const ExecutionKey& other) const { return !(*this == other); }
};

struct ExecutionGroup {
    ExecutionKey key;
    std::vector<BenchmarkDescription> descriptions;
};

// ─── Execution Grouper ─────────────────────────────────────────
// Partitions descriptions so that toolchain resolution and the support
// build happen once per distinct key. Groups appear in first-seen order
// and keep the input order inside each group.

class ExecutionGrouper {
public:
    /// Key of a description: its "compiler" and "additional_cmake_args"
    /// dimensions (the latter defaults to an empty list).
    static ExecutionKey keyOf(const BenchmarkDescription& desc);

    static std::vector<ExecutionGroup> group(const std::vector<BenchmarkDescription>& descriptions);
};

/// Generic first-seen-order grouping. Key must be equality comparable.
template <typename T, typename KeyFn>
auto groupBy(const std::vector<T>& items, KeyFn key_fn)
    -> std::vector<std::pair<decltype(key_fn(items.front())), std::vector<T>>> {
    using Key = decltype(key_fn(items.front()));
    std::vector<std::pair<Key, std::vector<T>>> groups;
    for (const auto& item : items) {
        Key key = key_fn(item);
        auto it = groups.begin();
        for (; it != groups.end(); ++it) {
            if (it->first == key) break;
        }
        if (it == groups.end()) {
            groups.emplace_back(std::move(key), std::vector<T>{});
            it = groups.end() - 1;
        }
        it->second.push_back(item);
    }
    return groups;
}

} // namespace adabench
