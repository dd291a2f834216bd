#pragma once

#include "drivers/driver_context.hpp"
#include "drivers/driver_registry.hpp"
#include "recording/result_recorder.hpp"
#include "sampling/adaptive_sampler.hpp"
#include "space/execution_grouper.hpp"
#include "space/space_expander.hpp"
#include <vector>

namespace adabench {

struct RunSummary {
    int total = 0;                  // descriptions after expansion
    int measured = 0;
    int skipped = 0;                // already recorded (resume) or duplicated
    int precision_warnings = 0;     // descriptions with an unconverged metric
};

// ─── Benchmark Runner ──────────────────────────────────────────
// The driver loop:
//   expand → validate → group → per group: support build →
//   per description: skip if recorded, else sample and append.
// Strictly sequential. Any exception aborts the whole batch; resuming
// with the same output file continues after the last recorded line.

class BenchmarkRunner {
public:
    BenchmarkRunner(const DriverRegistry& registry, const DriverContext& ctx,
                    ResultRecorder& recorder, AdaptiveSampler sampler);

    RunSummary run(const std::vector<BenchmarkTemplate>& templates, bool resume);

private:
    /// Resolves the toolchain and builds the subject library into the
    /// support build dir for this group's compiler and CMake args.
    void prepareGroup(const ExecutionKey& key);

    const DriverRegistry& registry_;
    const DriverContext& ctx_;
    ResultRecorder& recorder_;
    AdaptiveSampler sampler_;
};

} // namespace adabench
