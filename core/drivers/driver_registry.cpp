#include "drivers/driver_registry.hpp"
#include "common/errors.hpp"
#include "drivers/generated_project_driver.hpp"
#include "drivers/new_delete_driver.hpp"
#include "drivers/single_file_compile_driver.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace adabench {

namespace {

const char* flagFor(RequiredSources source) {
    switch (source) {
        case RequiredSources::FruitSources:          return "--fruit-sources-dir";
        case RequiredSources::FruitBenchmarkSources: return "--fruit-benchmark-sources-dir";
        case RequiredSources::BoostDiSources:        return "--boost-di-sources-dir";
    }
    return "";
}

const std::filesystem::path& pathFor(RequiredSources source, const DriverPaths& paths) {
    switch (source) {
        case RequiredSources::FruitSources:          return paths.fruit_sources_dir;
        case RequiredSources::FruitBenchmarkSources: return paths.fruit_benchmark_sources_dir;
        case RequiredSources::BoostDiSources:        return paths.boost_di_sources_dir;
    }
    return paths.fruit_sources_dir;
}

DimensionCheck generatedProjectCheck(ProjectMeasurement measurement) {
    return [measurement](const BenchmarkDescription& desc) {
        GeneratedProjectDriver::checkDimensions(desc, measurement);
    };
}

DriverFactory generatedProject(const std::string& library, ProjectMeasurement measurement) {
    return [library, measurement](const BenchmarkDescription& desc, const DriverContext& ctx) {
        SubjectLibrary subject;
        subject.name = library;
        subject.code_under_test = library == "boost_di" ? ctx.paths.boost_di_sources_dir
                                                        : ctx.paths.fruit_sources_dir;
        return std::make_unique<GeneratedProjectDriver>(desc, ctx, std::move(subject), measurement);
    };
}

} // namespace

void DriverRegistry::registerKind(const std::string& kind, DriverFactory factory,
                                  std::vector<RequiredSources> requirements,
                                  DimensionCheck check) {
    entries_[kind] = Entry{std::move(factory), std::move(requirements), std::move(check)};
}

std::vector<std::string> DriverRegistry::kinds() const {
    std::vector<std::string> result;
    for (const auto& [kind, entry] : entries_) {
        result.push_back(kind);
    }
    return result;
}

const DriverRegistry::Entry& DriverRegistry::lookup(const std::string& kind) const {
    auto it = entries_.find(kind);
    if (it == entries_.end()) {
        throw ConfigurationError(fmt::format("Unrecognized benchmark: {} (known benchmarks: {})",
                                             kind, fmt::join(kinds(), ", ")));
    }
    return it->second;
}

void DriverRegistry::validate(const BenchmarkDescription& desc, const DriverContext& ctx) const {
    const std::string kind = desc.kind();
    const Entry& entry = lookup(kind);
    for (RequiredSources source : entry.requirements) {
        if (pathFor(source, ctx.paths).empty()) {
            throw ConfigurationError(fmt::format("Error: you need to specify the {} flag in order to run {} benchmarks.",
                                                 flagFor(source), kind));
        }
    }
    if (entry.check) entry.check(desc);
}

std::unique_ptr<BenchmarkDriver> DriverRegistry::create(const BenchmarkDescription& desc,
                                                        const DriverContext& ctx) const {
    validate(desc, ctx);
    return lookup(desc.kind()).factory(desc, ctx);
}

DriverRegistry DriverRegistry::withDefaultDrivers() {
    using RS = RequiredSources;
    DriverRegistry registry;

    registry.registerKind("new_delete_run_time",
        [](const BenchmarkDescription& desc, const DriverContext& ctx) {
            return std::make_unique<NewDeleteRunTimeDriver>(desc, ctx);
        },
        {RS::FruitBenchmarkSources}, &NewDeleteRunTimeDriver::checkDimensions);

    registry.registerKind("fruit_single_file_compile_time",
        [](const BenchmarkDescription& desc, const DriverContext& ctx) {
            return std::make_unique<SingleFileCompileTimeDriver>(desc, ctx);
        },
        {RS::FruitSources, RS::FruitBenchmarkSources}, &SingleFileCompileTimeDriver::checkDimensions);

    registry.registerKind("fruit_compile_time",
        generatedProject("fruit", ProjectMeasurement::CompileTime), {RS::FruitSources},
        generatedProjectCheck(ProjectMeasurement::CompileTime));
    registry.registerKind("fruit_run_time",
        generatedProject("fruit", ProjectMeasurement::RunTime), {RS::FruitSources},
        generatedProjectCheck(ProjectMeasurement::RunTime));
    registry.registerKind("fruit_executable_size",
        generatedProject("fruit", ProjectMeasurement::ExecutableSize), {RS::FruitSources},
        generatedProjectCheck(ProjectMeasurement::ExecutableSize));

    registry.registerKind("boost_di_compile_time",
        generatedProject("boost_di", ProjectMeasurement::CompileTime), {RS::FruitSources, RS::BoostDiSources},
        generatedProjectCheck(ProjectMeasurement::CompileTime));
    registry.registerKind("boost_di_run_time",
        generatedProject("boost_di", ProjectMeasurement::RunTime), {RS::FruitSources, RS::BoostDiSources},
        generatedProjectCheck(ProjectMeasurement::RunTime));
    registry.registerKind("boost_di_executable_size",
        generatedProject("boost_di", ProjectMeasurement::ExecutableSize), {RS::FruitSources, RS::BoostDiSources},
        generatedProjectCheck(ProjectMeasurement::ExecutableSize));

    return registry;
}

} // namespace adabench
