#pragma once

#include "drivers/benchmark_driver.hpp"
#include "drivers/driver_context.hpp"

namespace adabench {

/// Fixed allocation micro-benchmark: new_delete_benchmark.cpp is
/// compiled once into the scratch directory and executed per run.
/// Dimensions: compiler, cxx_std, num_classes, loop_factor.
class NewDeleteRunTimeDriver : public BenchmarkDriver {
public:
    NewDeleteRunTimeDriver(const BenchmarkDescription& desc, const DriverContext& ctx);

    static void checkDimensions(const BenchmarkDescription& desc);

    void prepare() override;
    MetricSamples run() override;
    const BenchmarkDescription& describe() const override { return description_; }

private:
    const DriverContext& ctx_;
    BenchmarkDescription description_;
};

} // namespace adabench
