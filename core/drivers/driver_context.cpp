#include "drivers/driver_context.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <limits>
#include <thread>

namespace adabench {

DriverContext::DriverContext(CommandRunner& runner_in, ToolchainResolver& toolchains_in,
                             RevisionInspector& revisions_in, SourceGenerator& generator_in,
                             DriverPaths paths_in)
    : runner(runner_in),
      toolchains(toolchains_in),
      revisions(revisions_in),
      generator(generator_in),
      paths(std::move(paths_in)),
      make_args(defaultMakeArgs()) {}

std::vector<std::string> defaultMakeArgs() {
    unsigned threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 1;
    return {"-j", std::to_string(threads + 1)};
}

int requirePositiveInt(const BenchmarkDescription& desc, const std::string& name) {
    int64_t value = desc.getInt(name);
    if (value < 1 || value > std::numeric_limits<int>::max()) {
        throw ConfigurationError("Dimension '" + name + "' must be a positive integer, got " +
                                 std::to_string(value) + " in " + desc.toString());
    }
    return static_cast<int>(value);
}

double requirePositiveNumber(const BenchmarkDescription& desc, const std::string& name) {
    double value = desc.getNumber(name);
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw ConfigurationError("Dimension '" + name + "' must be a positive number, got " +
                                 desc.at(name).dump() + " in " + desc.toString());
    }
    return value;
}

BenchmarkDescription addDerivedDimensions(const BenchmarkDescription& desc,
                                          const DriverContext& ctx,
                                          const std::filesystem::path& code_under_test) {
    BenchmarkDescription augmented = desc;
    augmented.set("compiler_name", ctx.toolchains.resolve(desc.getString("compiler")));
    if (!code_under_test.empty()) {
        RevisionInfo revision = ctx.revisions.inspect(code_under_test.string());
        augmented.set("di_library_git_commit_hash", revision.commit_hash);
        if (revision.version_name) {
            augmented.set("di_library_version_name", *revision.version_name);
        }
    }
    return augmented;
}

} // namespace adabench
