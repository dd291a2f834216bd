#include "drivers/source_generator.hpp"

namespace adabench {

ScriptSourceGenerator::ScriptSourceGenerator(CommandRunner& runner, std::string program)
    : runner_(runner), program_(std::move(program)) {}

std::vector<std::string> ScriptSourceGenerator::arguments(const GenerationParams& params) {
    std::vector<std::string> args = {
        "--compiler", params.compiler,
        "--fruit-sources-dir", params.fruit_sources_dir,
        "--fruit-build-dir", params.fruit_build_dir,
        "--num-components-with-no-deps", std::to_string(params.num_components_with_no_deps),
        "--num-components-with-deps", std::to_string(params.num_components_with_deps),
        "--num-deps", std::to_string(params.num_deps),
        "--output-dir", params.output_dir,
        "--cxx-std", params.cxx_std,
        "--di-library", params.di_library,
    };
    if (params.boost_di_sources_dir) {
        args.push_back("--boost-di-sources-dir");
        args.push_back(*params.boost_di_sources_dir);
    }
    return args;
}

void ScriptSourceGenerator::generate(const GenerationParams& params) {
    Command command;
    command.program = program_;
    command.args = arguments(params);
    runner_.run(command);
}

} // namespace adabench
