#include "runner/benchmark_runner.hpp"
#include "common/log.hpp"
#include "process/scratch_dir.hpp"

#include <fmt/ranges.h>

#include <memory>
#include <set>

namespace adabench {

namespace {

std::string formatIntervals(const std::map<std::string, ConfidenceInterval>& intervals) {
    std::string out = "{";
    for (const auto& [metric, ci] : intervals) {
        if (out.size() > 1) out += ", ";
        out += fmt::format("'{}': ({}, {})", metric, ci.low, ci.high);
    }
    return out + "}";
}

} // namespace

BenchmarkRunner::BenchmarkRunner(const DriverRegistry& registry, const DriverContext& ctx,
                                 ResultRecorder& recorder, AdaptiveSampler sampler)
    : registry_(registry), ctx_(ctx), recorder_(recorder), sampler_(std::move(sampler)) {}

void BenchmarkRunner::prepareGroup(const ExecutionKey& key) {
    log::info("Preparing for benchmarks with the compiler {}, with additional CMake args [{}]",
              key.compiler, fmt::join(key.cmake_args, ", "));

    // Resolved here so that every driver's describe() hits the cache.
    ctx_.toolchains.resolve(key.compiler);

    if (ctx_.paths.fruit_sources_dir.empty()) return;

    ensureEmptyDir(ctx_.paths.support_build_dir);

    Command cmake;
    cmake.program = "cmake";
    cmake.args = {ctx_.paths.fruit_sources_dir.string(), "-DCMAKE_BUILD_TYPE=Release"};
    cmake.args.insert(cmake.args.end(), key.cmake_args.begin(), key.cmake_args.end());
    cmake.cwd = ctx_.paths.support_build_dir.string();
    cmake.env_overrides["CXX"] = key.compiler;
    ctx_.runner.run(cmake);

    Command make;
    make.program = "make";
    make.args = ctx_.make_args;
    make.cwd = ctx_.paths.support_build_dir.string();
    ctx_.runner.run(make);
}

RunSummary BenchmarkRunner::run(const std::vector<BenchmarkTemplate>& templates, bool resume) {
    std::vector<BenchmarkDescription> descriptions = SpaceExpander::expandAll(templates);

    // Configuration problems surface before anything is measured.
    for (const auto& desc : descriptions) {
        registry_.validate(desc, ctx_);
    }
    std::vector<ExecutionGroup> groups = ExecutionGrouper::group(descriptions);

    std::set<BenchmarkDescription> completed;
    if (resume) {
        completed = recorder_.completedDescriptions();
        log::info("Resuming: {} benchmark(s) already recorded in {}", completed.size(), recorder_.path().string());
    } else {
        recorder_.reset();
    }

    RunSummary summary;
    summary.total = static_cast<int>(descriptions.size());
    int index = 0;

    for (const auto& group : groups) {
        bool group_prepared = false;

        for (const auto& desc : group.descriptions) {
            index++;
            log::info("{}/{}: {}", index, summary.total, desc.toString());

            std::unique_ptr<BenchmarkDriver> driver = registry_.create(desc, ctx_);
            const BenchmarkDescription& described = driver->describe();
            if (completed.count(described) > 0) {
                log::info("Skipping benchmark that was already recorded: {}",
                          described.toString());
                summary.skipped++;
                continue;
            }

            if (!group_prepared) {
                prepareGroup(group.key);
                group_prepared = true;
            }

            SamplingOutcome outcome = sampler_.sample(*driver);
            BenchmarkResult result{described, outcome.intervals};
            recorder_.append(result);
            completed.insert(described);

            summary.measured++;
            if (!outcome.unconverged_metrics.empty()) summary.precision_warnings++;
            log::info("Benchmark finished. Result: {}", formatIntervals(outcome.intervals));
        }
    }
    return summary;
}

} // namespace adabench
