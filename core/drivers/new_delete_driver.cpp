#include "drivers/new_delete_driver.hpp"
#include "drivers/metric_parser.hpp"
#include "process/scratch_dir.hpp"

namespace adabench {

NewDeleteRunTimeDriver::NewDeleteRunTimeDriver(const BenchmarkDescription& desc, const DriverContext& ctx)
    : ctx_(ctx), description_(addDerivedDimensions(desc, ctx, {})) {
    checkDimensions(description_);
}

void NewDeleteRunTimeDriver::checkDimensions(const BenchmarkDescription& desc) {
    desc.getString("compiler");
    desc.getString("cxx_std");
    requirePositiveInt(desc, "num_classes");
    requirePositiveNumber(desc, "loop_factor");
}

void NewDeleteRunTimeDriver::prepare() {
    ensureEmptyDir(ctx_.paths.scratch_dir);

    Command compile;
    compile.program = description_.getString("compiler");
    compile.args = ctx_.compile_flags;
    compile.args.push_back("-std=" + description_.getString("cxx_std"));
    compile.args.push_back("-DMULTIPLIER=" + std::to_string(requirePositiveInt(description_, "num_classes")));
    compile.args.push_back((ctx_.paths.fruit_benchmark_sources_dir / "extras/benchmark/new_delete_benchmark.cpp").string());
    compile.args.push_back("-o");
    compile.args.push_back((ctx_.paths.scratch_dir / "main").string());
    ctx_.runner.run(compile);
}

MetricSamples NewDeleteRunTimeDriver::run() {
    double loop_factor = requirePositiveNumber(description_, "loop_factor");

    Command bench;
    bench.program = (ctx_.paths.scratch_dir / "main").string();
    bench.args = {std::to_string(static_cast<long long>(5000000 * loop_factor))};
    return parseMetricLines(ctx_.runner.run(bench).stdout_text);
}

} // namespace adabench
