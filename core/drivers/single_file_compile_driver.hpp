#pragma once

#include "drivers/benchmark_driver.hpp"
#include "drivers/driver_context.hpp"

namespace adabench {

/// Times the compilation of compile_time_benchmark.cpp against the
/// subject library. prepare() only clears the scratch directory; every
/// run() is one compile. num_bindings must be a positive multiple of 5.
class SingleFileCompileTimeDriver : public BenchmarkDriver {
public:
    SingleFileCompileTimeDriver(const BenchmarkDescription& desc, const DriverContext& ctx);

    static void checkDimensions(const BenchmarkDescription& desc);

    void prepare() override;
    MetricSamples run() override;
    const BenchmarkDescription& describe() const override { return description_; }

private:
    const DriverContext& ctx_;
    BenchmarkDescription description_;
};

} // namespace adabench
