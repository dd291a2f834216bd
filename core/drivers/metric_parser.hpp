#pragma once

#include "drivers/benchmark_driver.hpp"
#include <string>

namespace adabench {

/// Parses benchmark program output of the form
///   Total for setup            = 123
///   Full injection time        = 23.45
/// into {"Total for setup": 123, "Full injection time": 23.45}.
/// Blank lines are ignored; any other line without '=' or with a
/// non-numeric value throws std::runtime_error.
MetricSamples parseMetricLines(const std::string& output);

} // namespace adabench
