#include "drivers/generated_project_driver.hpp"
#include "drivers/metric_parser.hpp"
#include "process/scratch_dir.hpp"

#include <chrono>

namespace adabench {

namespace {

constexpr double kNoDepsFraction = 0.1;
constexpr int kDepsPerComponent = 10;

} // namespace

GeneratedProjectDriver::GeneratedProjectDriver(const BenchmarkDescription& desc, const DriverContext& ctx,
                                               SubjectLibrary subject, ProjectMeasurement measurement)
    : ctx_(ctx),
      subject_(std::move(subject)),
      measurement_(measurement),
      description_(addDerivedDimensions(desc, ctx, subject_.code_under_test)) {
    checkDimensions(description_, measurement_);
}

void GeneratedProjectDriver::checkDimensions(const BenchmarkDescription& desc, ProjectMeasurement measurement) {
    desc.getString("compiler");
    desc.getString("cxx_std");
    requirePositiveInt(desc, "num_classes");
    if (measurement == ProjectMeasurement::RunTime) {
        requirePositiveNumber(desc, "loop_factor");
    }
}

GenerationParams GeneratedProjectDriver::generationParams() const {
    int num_classes = requirePositiveInt(description_, "num_classes");
    int no_deps = static_cast<int>(num_classes * kNoDepsFraction);

    GenerationParams params;
    params.compiler = description_.getString("compiler");
    params.fruit_sources_dir = ctx_.paths.fruit_sources_dir.string();
    params.fruit_build_dir = ctx_.paths.support_build_dir.string();
    params.num_components_with_no_deps = no_deps;
    params.num_components_with_deps = num_classes - no_deps;
    params.num_deps = kDepsPerComponent;
    params.output_dir = ctx_.paths.scratch_dir.string();
    params.cxx_std = description_.getString("cxx_std");
    params.di_library = subject_.name;
    if (subject_.name == "boost_di") {
        params.boost_di_sources_dir = ctx_.paths.boost_di_sources_dir.string();
    }
    return params;
}

void GeneratedProjectDriver::prepare() {
    generateProject();
    if (measurement_ == ProjectMeasurement::CompileTime) return;
    buildProject();
    if (measurement_ == ProjectMeasurement::RunTime) return;
    stripExecutable();
}

MetricSamples GeneratedProjectDriver::run() {
    switch (measurement_) {
        case ProjectMeasurement::CompileTime:    return runCompileTime();
        case ProjectMeasurement::RunTime:        return runRunTime();
        case ProjectMeasurement::ExecutableSize: return runExecutableSize();
    }
    return {};
}

void GeneratedProjectDriver::generateProject() {
    ensureEmptyDir(ctx_.paths.scratch_dir);
    ctx_.generator.generate(generationParams());
}

void GeneratedProjectDriver::buildProject() {
    ctx_.runner.run(make({}));
}

void GeneratedProjectDriver::stripExecutable() {
    Command strip;
    strip.program = "strip";
    strip.args = {executable().string()};
    ctx_.runner.run(strip);
}

Command GeneratedProjectDriver::make(std::vector<std::string> extra_args) const {
    Command command;
    command.program = "make";
    command.args = ctx_.make_args;
    command.args.insert(command.args.end(), extra_args.begin(), extra_args.end());
    command.cwd = ctx_.paths.scratch_dir.string();
    return command;
}

MetricSamples GeneratedProjectDriver::runCompileTime() {
    ctx_.runner.run(make({"clean"}));
    auto start = std::chrono::steady_clock::now();
    ctx_.runner.run(make({}));
    auto end = std::chrono::steady_clock::now();
    return {{"compile_time", std::chrono::duration<double>(end - start).count()}};
}

MetricSamples GeneratedProjectDriver::runRunTime() {
    double num_classes = requirePositiveInt(description_, "num_classes");
    double loop_factor = requirePositiveNumber(description_, "loop_factor");

    // 10M loops with 100 classes, 1M with 1000.
    Command bench;
    bench.program = executable().string();
    bench.args = {std::to_string(static_cast<long long>(1000.0 * 1000.0 * 1000.0 * loop_factor / num_classes))};
    return parseMetricLines(ctx_.runner.run(bench).stdout_text);
}

MetricSamples GeneratedProjectDriver::runExecutableSize() {
    return {{"num_bytes", static_cast<double>(std::filesystem::file_size(executable()))}};
}

} // namespace adabench
