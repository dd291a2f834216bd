#pragma once

#include "drivers/source_generator.hpp"
#include "space/benchmark_description.hpp"
#include "process/command_runner.hpp"
#include "toolchain/revision_inspector.hpp"
#include "toolchain/toolchain_resolver.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace adabench {

struct DriverPaths {
    std::filesystem::path fruit_sources_dir;             // subject library sources
    std::filesystem::path fruit_benchmark_sources_dir;   // fixed benchmark sources
    std::filesystem::path boost_di_sources_dir;          // second subject library, optional
    std::filesystem::path support_build_dir;             // per-group build of the subject library
    std::filesystem::path scratch_dir;                   // recreated before every prepare()
};

/// Everything a driver needs from the outside world. Collaborators are
/// borrowed; the context never outlives the objects it refers to.
struct DriverContext {
    CommandRunner& runner;
    ToolchainResolver& toolchains;
    RevisionInspector& revisions;
    SourceGenerator& generator;
    DriverPaths paths;
    std::vector<std::string> compile_flags = {"-O2", "-DNDEBUG"};
    std::vector<std::string> make_args;

    DriverContext(CommandRunner& runner_in, ToolchainResolver& toolchains_in,
                  RevisionInspector& revisions_in, SourceGenerator& generator_in,
                  DriverPaths paths_in);
};

/// ["-j", hardware threads + 1]
std::vector<std::string> defaultMakeArgs();

/// Throws ConfigurationError unless the dimension is an integer in [1, INT_MAX].
int requirePositiveInt(const BenchmarkDescription& desc, const std::string& name);

/// Throws ConfigurationError unless the dimension is a finite number > 0.
double requirePositiveNumber(const BenchmarkDescription& desc, const std::string& name);

/// Adds compiler_name and, if `code_under_test` is non-empty, the
/// subject library's commit hash and version name.
BenchmarkDescription addDerivedDimensions(const BenchmarkDescription& desc,
                                          const DriverContext& ctx,
                                          const std::filesystem::path& code_under_test);

} // namespace adabench
