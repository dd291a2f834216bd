#pragma once

#include "process/command_runner.hpp"
#include <optional>
#include <string>

namespace adabench {

/// Shape of a generated benchmark project.
struct GenerationParams {
    std::string compiler;
    std::string fruit_sources_dir;
    std::string fruit_build_dir;
    int num_components_with_no_deps = 0;
    int num_components_with_deps = 0;
    int num_deps = 10;
    std::string output_dir;
    std::string cxx_std;
    std::string di_library;                            // "fruit" or "boost_di"
    std::optional<std::string> boost_di_sources_dir;
};

/// Materializes a buildable project (sources + Makefile producing `main`)
/// in params.output_dir.
class SourceGenerator {
public:
    virtual ~SourceGenerator() = default;

    virtual void generate(const GenerationParams& params) = 0;
};

// ─── Script Source Generator ───────────────────────────────────
// Delegates to an external generator program, passing every parameter
// as a --flag value pair.

class ScriptSourceGenerator : public SourceGenerator {
public:
    ScriptSourceGenerator(CommandRunner& runner, std::string program);

    void generate(const GenerationParams& params) override;

    /// The argument list handed to the generator program.
    static std::vector<std::string> arguments(const GenerationParams& params);

private:
    CommandRunner& runner_;
    std::string program_;
};

} // namespace adabench
