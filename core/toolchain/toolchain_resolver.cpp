#include "toolchain/toolchain_resolver.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "process/scratch_dir.hpp"

#include <fstream>
#include <regex>
#include <sstream>

namespace adabench {

CMakeToolchainResolver::CMakeToolchainResolver(CommandRunner& runner, std::filesystem::path work_dir)
    : runner_(runner),
      work_dir_(std::move(work_dir)),
      cache_([this](const std::string& compiler) { return probe(compiler); }) {}

std::string CMakeToolchainResolver::resolve(const std::string& compiler) {
    return cache_.get(compiler);
}

std::string CMakeToolchainResolver::probe(const std::string& compiler) {
    ensureEmptyDir(work_dir_);
    {
        std::ofstream cmake_lists(work_dir_ / "CMakeLists.txt");
        cmake_lists << "message(\"@@@${CMAKE_CXX_COMPILER_ID} ${CMAKE_CXX_COMPILER_VERSION}@@@\")\n";
    }

    Command command;
    command.program = "cmake";
    command.args = {"."};
    command.cwd = work_dir_.string();
    command.env_overrides["CXX"] = compiler;

    CommandOutput output = runner_.run(command);
    std::string name = parseCMakeOutput(output.stderr_text);
    log::debug("Compiler {} is {}", compiler, name);
    return name;
}

std::string CMakeToolchainResolver::parseCMakeOutput(const std::string& output) {
    static const std::regex marker("@@@(.*)@@@");
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        std::smatch match;
        if (std::regex_search(line, match, marker)) {
            std::string name = match[1].str();
            if (name.rfind("GNU ", 0) == 0) {
                name = "GCC " + name.substr(4);
            }
            return name;
        }
    }
    throw ConfigurationError("Unable to determine compiler. CMake output was:\n" + output);
}

} // namespace adabench
