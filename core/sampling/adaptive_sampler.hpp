#pragma once

#include "drivers/benchmark_driver.hpp"
#include "sampling/statistics.hpp"
#include <map>
#include <string>
#include <vector>

namespace adabench {

/// Sampling parameters.
struct SamplerConfig {
    int min_runs = 3;               // Runs made before convergence is first checked
    int max_runs = 10;              // Hard cap on run() calls per description
    double significance = 0.05;     // 0.05 → 95% confidence interval
    int significant_digits = 2;     // Digits kept when rounding interval bounds

    /// Throws ConfigurationError on out-of-range values.
    void validate() const;
};

/// Result of sampling one driver.
struct SamplingOutcome {
    std::map<std::string, ConfidenceInterval> intervals;  // rounded
    int runs = 0;
    std::vector<std::string> unconverged_metrics;         // precision warnings
};

// ─── Adaptive Sampler ──────────────────────────────────────────
// Calls prepare() once, then run() at least min_runs times and keeps
// going until every metric's rounded confidence interval has collapsed
// to a single value, or max_runs calls have been made. A metric whose
// samples are all bit-identical counts as converged.

class AdaptiveSampler {
public:
    explicit AdaptiveSampler(SamplerConfig config = {});

    SamplingOutcome sample(BenchmarkDriver& driver) const;

    const SamplerConfig& config() const { return config_; }

private:
    using Series = std::map<std::string, std::vector<double>>;

    void runOnce(BenchmarkDriver& driver, Series& series) const;

    /// Names of metrics whose rounded interval is still wider than the tolerance.
    std::vector<std::string> unconverged(const Series& series) const;

    SamplerConfig config_;
};

} // namespace adabench
