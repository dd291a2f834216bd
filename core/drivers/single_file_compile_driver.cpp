#include "drivers/single_file_compile_driver.hpp"
#include "common/errors.hpp"
#include "process/scratch_dir.hpp"

#include <chrono>

namespace adabench {

SingleFileCompileTimeDriver::SingleFileCompileTimeDriver(const BenchmarkDescription& desc, const DriverContext& ctx)
    : ctx_(ctx), description_(addDerivedDimensions(desc, ctx, ctx.paths.fruit_sources_dir)) {
    checkDimensions(description_);
}

void SingleFileCompileTimeDriver::checkDimensions(const BenchmarkDescription& desc) {
    desc.getString("compiler");
    desc.getString("cxx_std");
    int num_bindings = requirePositiveInt(desc, "num_bindings");
    if (num_bindings % 5 != 0) {
        throw ConfigurationError("num_bindings must be a multiple of 5, got " + std::to_string(num_bindings));
    }
}

void SingleFileCompileTimeDriver::prepare() {
    ensureEmptyDir(ctx_.paths.scratch_dir);
}

MetricSamples SingleFileCompileTimeDriver::run() {
    Command compile;
    compile.program = description_.getString("compiler");
    compile.args = ctx_.compile_flags;
    compile.args.insert(compile.args.end(), {
        "-std=" + description_.getString("cxx_std"),
        "-DMULTIPLIER=" + std::to_string(requirePositiveInt(description_, "num_bindings") / 5),
        "-I", (ctx_.paths.fruit_sources_dir / "include").string(),
        "-I", (ctx_.paths.support_build_dir / "include").string(),
        "-ftemplate-depth=1000",
        "-c",
        (ctx_.paths.fruit_benchmark_sources_dir / "extras/benchmark/compile_time_benchmark.cpp").string(),
        "-o",
        "/dev/null",
    });

    auto start = std::chrono::steady_clock::now();
    ctx_.runner.run(compile);
    auto end = std::chrono::steady_clock::now();
    return {{"compile_time", std::chrono::duration<double>(end - start).count()}};
}

} // namespace adabench
