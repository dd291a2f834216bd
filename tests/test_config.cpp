#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "config/run_config.hpp"
#include "space/space_expander.hpp"
#include "fakes.hpp"

#include <fstream>

using namespace adabench;
using namespace adabench::testing;
using nlohmann::json;

namespace {

const char* kDefinition = R"(
global:
  max_runs: 20
benchmarks:
  - name: fruit_compile_time
    compiler: [g++, clang++]
    cxx_std: c++11
    num_classes: [100, 1000]
    loop_factor: 1.0
    enabled: true
    label: "100"
    additional_cmake_args: [[], ['-DFRUIT_USES_BOOST=False']]
  - name: new_delete_run_time
    compiler: g++
)";

} // namespace

TEST(ConfigTest, ParsesGlobalAndBenchmarks) {
    RunConfig config = parseRunConfig(kDefinition);

    EXPECT_EQ(config.sampler.max_runs, 20);
    EXPECT_EQ(config.sampler.min_runs, 3);
    EXPECT_DOUBLE_EQ(config.sampler.significance, 0.05);
    EXPECT_EQ(config.sampler.significant_digits, 2);
    ASSERT_EQ(config.benchmarks.size(), 2u);
    EXPECT_EQ(SpaceExpander::expandAll(config.benchmarks).size(), 2u * 2u * 2u + 1u);
}

TEST(ConfigTest, ScalarsAreTyped) {
    RunConfig config = parseRunConfig(kDefinition);
    auto descriptions = SpaceExpander::expand(config.benchmarks[0]);
    const BenchmarkDescription& d = descriptions.front();

    EXPECT_EQ(d.at("num_classes"), json(100));
    EXPECT_TRUE(d.at("num_classes").is_number_integer());
    EXPECT_TRUE(d.at("loop_factor").is_number_float());
    EXPECT_EQ(d.at("enabled"), json(true));
    EXPECT_EQ(d.at("cxx_std"), json("c++11"));
    // Quoted scalars stay strings.
    EXPECT_EQ(d.at("label"), json("100"));
    EXPECT_EQ(d.at("additional_cmake_args"), json::array());
    EXPECT_EQ(descriptions.back().getStringList("additional_cmake_args"),
              std::vector<std::string>{"-DFRUIT_USES_BOOST=False"});
}

TEST(ConfigTest, NumericGrammarIsStrict) {
    RunConfig config = parseRunConfig(R"(
global: {max_runs: 3}
benchmarks:
  - exponent: 1e3
    hex: 0x10
    real_exponent: 1.5e3
    leading_dot: .5
    negative: -42
    version: 1.2.3
)");
    auto d = SpaceExpander::expand(config.benchmarks[0]).front();
    EXPECT_EQ(d.at("exponent"), json("1e3"));
    EXPECT_EQ(d.at("hex"), json("0x10"));
    EXPECT_EQ(d.at("real_exponent"), json(1500.0));
    EXPECT_EQ(d.at("leading_dot"), json(0.5));
    EXPECT_EQ(d.at("negative"), json(-42));
    EXPECT_TRUE(d.at("negative").is_number_integer());
    EXPECT_EQ(d.at("version"), json("1.2.3"));
}

TEST(ConfigTest, IntegerOverflowIsRejected) {
    EXPECT_THROW(parseRunConfig("global: {max_runs: 3}\nbenchmarks: [{num_classes: 99999999999999999999}]\n"),
                 ConfigurationError);
    EXPECT_THROW(parseRunConfig("global: {max_runs: 3}\nbenchmarks: [{loop_factor: 1.0e999}]\n"),
                 ConfigurationError);
}

TEST(ConfigTest, OptionalSamplerSettings) {
    RunConfig config = parseRunConfig(R"(
global:
  max_runs: 8
  min_runs: 4
  significance: 0.01
  significant_digits: 3
benchmarks: []
)");
    EXPECT_EQ(config.sampler.max_runs, 8);
    EXPECT_EQ(config.sampler.min_runs, 4);
    EXPECT_DOUBLE_EQ(config.sampler.significance, 0.01);
    EXPECT_EQ(config.sampler.significant_digits, 3);
    EXPECT_TRUE(config.benchmarks.empty());
}

TEST(ConfigTest, MissingRequiredFieldsAreRejected) {
    EXPECT_THROW(parseRunConfig("benchmarks: []\n"), ConfigurationError);
    EXPECT_THROW(parseRunConfig("global: {}\nbenchmarks: []\n"), ConfigurationError);
    EXPECT_THROW(parseRunConfig("global: {max_runs: 5}\n"), ConfigurationError);
    EXPECT_THROW(parseRunConfig("global: {max_runs: 5}\nbenchmarks: [3]\n"), ConfigurationError);
    EXPECT_THROW(parseRunConfig("global: {max_runs: lots}\nbenchmarks: []\n"), ConfigurationError);
    EXPECT_THROW(parseRunConfig("global: {max_runs: 0}\nbenchmarks: []\n"), ConfigurationError);
    EXPECT_THROW(parseRunConfig("- just\n- a list\n"), ConfigurationError);
}

TEST(ConfigTest, LoadsFromFile) {
    TempDir dir;
    auto path = dir.path() / "benchs.yml";
    {
        std::ofstream out(path);
        out << kDefinition;
    }
    EXPECT_EQ(loadRunConfig(path.string()).sampler.max_runs, 20);
    EXPECT_THROW(loadRunConfig((dir.path() / "missing.yml").string()), ConfigurationError);
    EXPECT_THROW(loadRunConfig(""), ConfigurationError);
}

TEST(ConfigTest, FlagValues) {
    EXPECT_TRUE(parseFlagValue("continue-benchmark", "true"));
    EXPECT_FALSE(parseFlagValue("continue-benchmark", "false"));
    EXPECT_THROW(parseFlagValue("continue-benchmark", "yes"), ConfigurationError);
    EXPECT_THROW(parseFlagValue("continue-benchmark", ""), ConfigurationError);
}

TEST(ConfigTest, RunOptionsRequireOutputAndDefinition) {
    RunOptions options;
    EXPECT_THROW(options.validate(), ConfigurationError);

    options.output_file = "results.txt";
    EXPECT_THROW(options.validate(), ConfigurationError);

    options.benchmark_definition = "benchs.yml";
    EXPECT_NO_THROW(options.validate());
}
