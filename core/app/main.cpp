// adabench command-line front end.
//
//   adabench --benchmark-definition benchs.yml --output-file results.txt
//            --fruit-sources-dir ~/fruit --fruit-benchmark-sources-dir ~/fruit
//            [--boost-di-sources-dir ~/di] [--continue-benchmark[=true|false]]
//
// Exit status: 0 on success, 1 on a configuration error, 2 when an
// external command failed, 3 on any other error.

#include "common/errors.hpp"
#include "common/log.hpp"
#include "config/run_config.hpp"
#include "drivers/driver_registry.hpp"
#include "drivers/source_generator.hpp"
#include "process/command_runner.hpp"
#include "recording/result_recorder.hpp"
#include "runner/benchmark_runner.hpp"
#include "toolchain/revision_inspector.hpp"
#include "toolchain/toolchain_resolver.hpp"

#include <boost/program_options.hpp>

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;
namespace po = boost::program_options;

using namespace adabench;

namespace {

RunOptions parseOptions(int argc, char** argv, bool& help) {
    RunOptions options;
    std::string continue_benchmark;
    po::options_description desc("Runs a set of benchmarks defined in a YAML file");
    desc.add_options()
        ("help,h", "Show this help")
        ("benchmark-definition", po::value<std::string>(&options.benchmark_definition),
            "The YAML file that defines the benchmarks")
        ("output-file", po::value<std::string>(&options.output_file),
            "Where results are stored, one JSON record per line")
        ("continue-benchmark",
            po::value<std::string>(&continue_benchmark)->implicit_value("true")->default_value("false"),
            "If 'true', continue a previous run, skipping benchmarks already in --output-file")
        ("fruit-sources-dir", po::value<std::string>(&options.fruit_sources_dir),
            "Path to the subject library sources")
        ("fruit-benchmark-sources-dir", po::value<std::string>(&options.fruit_benchmark_sources_dir),
            "Path to the benchmark sources")
        ("boost-di-sources-dir", po::value<std::string>(&options.boost_di_sources_dir),
            "Path to the Boost.DI sources")
        ("generator", po::value<std::string>(&options.generator),
            "Program that generates benchmark projects")
        ("scratch-dir", po::value<std::string>(&options.scratch_dir),
            "Directory for temporary builds (default: system temp directory)")
        ("verbose,v", po::bool_switch(&options.verbose), "Log every external command");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigurationError(e.what());
    }

    options.continue_benchmark = parseFlagValue("continue-benchmark", continue_benchmark);
    help = vm.count("help") > 0;
    if (help) {
        std::cout << desc << "\n";
    }
    return options;
}

int runBenchmarks(const RunOptions& options) {
    options.validate();
    RunConfig config = loadRunConfig(options.benchmark_definition);

    fs::path scratch_root = options.scratch_dir.empty() ? fs::temp_directory_path() : fs::path(options.scratch_dir);

    DriverPaths paths;
    paths.fruit_sources_dir = options.fruit_sources_dir;
    paths.fruit_benchmark_sources_dir = options.fruit_benchmark_sources_dir;
    paths.boost_di_sources_dir = options.boost_di_sources_dir;
    paths.support_build_dir = scratch_root / "adabench-support-build-dir";
    paths.scratch_dir = scratch_root / "adabench-benchmark-dir";

    std::string generator_program = options.generator;
    if (generator_program.empty() && !options.fruit_benchmark_sources_dir.empty()) {
        generator_program = (fs::path(options.fruit_benchmark_sources_dir) / "extras/benchmark/generate_benchmark.py").string();
    }

    PosixCommandRunner runner;
    CMakeToolchainResolver toolchains(runner, scratch_root / "adabench-determine-compiler-version-dir");
    GitRevisionInspector revisions(runner);
    ScriptSourceGenerator generator(runner, generator_program);
    DriverContext ctx(runner, toolchains, revisions, generator, paths);

    DriverRegistry registry = DriverRegistry::withDefaultDrivers();
    ResultRecorder recorder(options.output_file);
    BenchmarkRunner bench_runner(registry, ctx, recorder, AdaptiveSampler(config.sampler));

    RunSummary summary = bench_runner.run(config.benchmarks, options.continue_benchmark);
    log::info("Done: {} measured, {} skipped, {} with imprecise results (of {})",
              summary.measured, summary.skipped, summary.precision_warnings, summary.total);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        bool help = false;
        RunOptions options = parseOptions(argc, argv, help);
        if (help) return 0;
        if (options.verbose) log::setLevel(log::Level::Debug);
        return runBenchmarks(options);
    } catch (const ConfigurationError& e) {
        log::error("{}", e.what());
        return 1;
    } catch (const CommandFailure& e) {
        log::error("{}", e.what());
        return 2;
    } catch (const std::exception& e) {
        log::error("{}", e.what());
        return 3;
    }
}
