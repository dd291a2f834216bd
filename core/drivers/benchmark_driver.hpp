#pragma once

#include "space/benchmark_description.hpp"
#include <map>
#include <string>

namespace adabench {

/// Metric name → value for a single execution.
using MetricSamples = std::map<std::string, double>;

// ─── Benchmark Driver ──────────────────────────────────────────
// One measurable unit.
//   prepare():  one-time setup for this description; recreates the
//               scratch directory before touching it.
//   run():      one measurement; repeatable after a single prepare().
//   describe(): the description plus derived dimensions, computed at
//               construction so repeated calls are free and identical.

class BenchmarkDriver {
public:
    virtual ~BenchmarkDriver() = default;

    virtual void prepare() = 0;

    virtual MetricSamples run() = 0;

    virtual const BenchmarkDescription& describe() const = 0;
};

} // namespace adabench
