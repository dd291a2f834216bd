#include "space/space_expander.hpp"
#include "common/log.hpp"

#include <iterator>
#include <map>

namespace adabench {

std::vector<BenchmarkDescription> SpaceExpander::expand(const BenchmarkTemplate& tmpl, size_t index) {
    // std::map gives the sorted key order directly.
    std::map<std::string, std::vector<DimensionValue>> candidates;
    for (const auto& [name, value] : tmpl.dimensions) {
        std::vector<DimensionValue> values;
        if (value.is_array()) {
            values.assign(value.begin(), value.end());
        } else {
            values.push_back(value);
        }
        candidates[name] = std::move(values);
    }

    std::vector<BenchmarkDescription> result;
    for (const auto& [name, values] : candidates) {
        if (values.empty()) {
            log::warning("benchmarks[{}]: dimension '{}' has no candidate values; the template expands to no benchmarks",
                         index, name);
            return result;
        }
    }

    std::vector<const std::vector<DimensionValue>*> lists;
    std::vector<const std::string*> names;
    for (const auto& [name, values] : candidates) {
        names.push_back(&name);
        lists.push_back(&values);
    }

    // Odometer over the value lists; the last index moves fastest.
    std::vector<size_t> position(lists.size(), 0);
    while (true) {
        BenchmarkDescription desc;
        for (size_t i = 0; i < lists.size(); i++) {
            desc.set(*names[i], (*lists[i])[position[i]]);
        }
        result.push_back(std::move(desc));

        size_t pos = lists.size();
        while (pos > 0) {
            pos--;
            if (++position[pos] < lists[pos]->size()) break;
            position[pos] = 0;
            if (pos == 0) return result;
        }
        if (lists.empty()) return result;
    }
}

std::vector<BenchmarkDescription> SpaceExpander::expandAll(const std::vector<BenchmarkTemplate>& templates) {
    std::vector<BenchmarkDescription> result;
    for (size_t i = 0; i < templates.size(); i++) {
        auto expanded = expand(templates[i], i);
        result.insert(result.end(),
                      std::make_move_iterator(expanded.begin()),
                      std::make_move_iterator(expanded.end()));
    }
    return result;
}

} // namespace adabench
