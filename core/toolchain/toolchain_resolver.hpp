#pragma once

#include "process/command_runner.hpp"
#include "toolchain/lookup_cache.hpp"
#include <filesystem>
#include <string>

namespace adabench {

/// Maps a compiler executable to a human-readable "<id> <version>".
class ToolchainResolver {
public:
    virtual ~ToolchainResolver() = default;

    virtual std::string resolve(const std::string& compiler) = 0;
};

// ─── CMake Toolchain Resolver ──────────────────────────────────
// Asks CMake which compiler `CXX=<compiler>` is. Results are memoized:
// the first lookup for a compiler costs one `cmake .` run, later ones
// are free.

class CMakeToolchainResolver : public ToolchainResolver {
public:
    CMakeToolchainResolver(CommandRunner& runner, std::filesystem::path work_dir);

    std::string resolve(const std::string& compiler) override;

    /// Extracts the name from CMake's output; "GNU" is reported as "GCC".
    /// Throws ConfigurationError if no marker line is present.
    static std::string parseCMakeOutput(const std::string& output);

private:
    std::string probe(const std::string& compiler);

    CommandRunner& runner_;
    std::filesystem::path work_dir_;
    LookupCache<std::string, std::string> cache_;
};

} // namespace adabench
