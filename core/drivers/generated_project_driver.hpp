#pragma once

#include "drivers/benchmark_driver.hpp"
#include "drivers/driver_context.hpp"
#include <string>

namespace adabench {

/// Which measurement follows the shared generate/build setup.
enum class ProjectMeasurement {
    CompileTime,      // prepare: generate.             run: make clean + timed make
    RunTime,          // prepare: generate + make.      run: execute main
    ExecutableSize,   // prepare: generate + make + strip. run: size of main
};

/// The library a generated project exercises.
struct SubjectLibrary {
    std::string name;                        // passed to the generator as --di-library
    std::filesystem::path code_under_test;   // source tree whose revision is recorded
};

// ─── Generated Project Driver ──────────────────────────────────
// Benchmarks a project produced by the SourceGenerator. num_classes
// components are generated; 10% of them (truncated) have no
// dependencies and the rest depend on 10 others.
// Dimensions: compiler, cxx_std, num_classes, and loop_factor for
// RunTime.

class GeneratedProjectDriver : public BenchmarkDriver {
public:
    GeneratedProjectDriver(const BenchmarkDescription& desc, const DriverContext& ctx,
                           SubjectLibrary subject, ProjectMeasurement measurement);

    static void checkDimensions(const BenchmarkDescription& desc, ProjectMeasurement measurement);

    void prepare() override;
    MetricSamples run() override;
    const BenchmarkDescription& describe() const override { return description_; }

    ProjectMeasurement measurement() const { return measurement_; }
    const SubjectLibrary& subject() const { return subject_; }

    /// Generator parameters derived from the description.
    GenerationParams generationParams() const;

private:
    void generateProject();
    void buildProject();
    void stripExecutable();

    MetricSamples runCompileTime();
    MetricSamples runRunTime();
    MetricSamples runExecutableSize();

    Command make(std::vector<std::string> extra_args) const;
    std::filesystem::path executable() const { return ctx_.paths.scratch_dir / "main"; }

    const DriverContext& ctx_;
    SubjectLibrary subject_;
    ProjectMeasurement measurement_;
    BenchmarkDescription description_;
};

} // namespace adabench
