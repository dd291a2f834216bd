#include "space/execution_grouper.hpp"
#include "common/errors.hpp"

namespace adabench {

ExecutionKey ExecutionGrouper::keyOf(const BenchmarkDescription& desc) {
    if (!desc.has("compiler")) {
        throw ConfigurationError("Benchmark " + desc.toString() + " does not specify a compiler");
    }
    ExecutionKey key;
    key.compiler = desc.getString("compiler");
    if (desc.has("additional_cmake_args")) {
        key.cmake_args = desc.getStringList("additional_cmake_args");
    }
    return key;
}

std::vector<ExecutionGroup> ExecutionGrouper::group(const std::vector<BenchmarkDescription>& descriptions) {
    std::vector<ExecutionGroup> result;
    for (auto& [key, members] : groupBy(descriptions, &ExecutionGrouper::keyOf)) {
        result.push_back({std::move(key), std::move(members)});
    }
    return result;
}

} // namespace adabench
