#pragma once

#include "sampling/adaptive_sampler.hpp"
#include "space/benchmark_description.hpp"
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace adabench {

/// The benchmark-definition document:
///   global:     { max_runs: N, [min_runs, significance, significant_digits] }
///   benchmarks: [ {dimension: value | [values...]}, ... ]
struct RunConfig {
    SamplerConfig sampler;
    std::vector<BenchmarkTemplate> benchmarks;
};

/// Command-line settings.
struct RunOptions {
    std::string benchmark_definition;
    std::string output_file;
    bool continue_benchmark = false;
    std::string fruit_sources_dir;
    std::string fruit_benchmark_sources_dir;
    std::string boost_di_sources_dir;
    std::string generator;      // defaults to <fruit-benchmark-sources-dir>/extras/benchmark/generate_benchmark.py
    std::string scratch_dir;    // defaults to the system temp directory
    bool verbose = false;

    /// Throws ConfigurationError if a required option is missing.
    void validate() const;
};

// ─── Config Loading ────────────────────────────────────────────
// yaml-cpp based. Scalars are typed on load (bool, integer, real,
// otherwise string). Missing required sections are ConfigurationErrors.

RunConfig loadRunConfig(const std::string& path);
RunConfig parseRunConfig(const std::string& yaml_text);

/// Value of a boolean flag given as `--flag`, `--flag=true` or
/// `--flag=false`. Anything else is a ConfigurationError.
bool parseFlagValue(const std::string& flag, const std::string& value);

/// Converts a YAML scalar/sequence to a dimension value.
DimensionValue toDimensionValue(const YAML::Node& node);

} // namespace adabench
