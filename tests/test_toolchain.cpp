#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "toolchain/lookup_cache.hpp"
#include "toolchain/revision_inspector.hpp"
#include "toolchain/toolchain_resolver.hpp"
#include "fakes.hpp"

using namespace adabench;
using namespace adabench::testing;

TEST(ToolchainTest, ParsesCompilerMarker) {
    EXPECT_EQ(CMakeToolchainResolver::parseCMakeOutput("-- Configuring\n@@@GNU 11.4.0@@@\n-- Done\n"),
              "GCC 11.4.0");
    EXPECT_EQ(CMakeToolchainResolver::parseCMakeOutput("@@@Clang 14.0.0@@@"), "Clang 14.0.0");
    EXPECT_THROW(CMakeToolchainResolver::parseCMakeOutput("-- Configuring done\n"), ConfigurationError);
}

TEST(ToolchainTest, ResolverProbesEachCompilerOnce) {
    TempDir dir;
    FakeCommandRunner runner;
    runner.errors["cmake"] = "@@@GNU 11.4.0@@@\n";
    CMakeToolchainResolver resolver(runner, dir.path() / "probe");

    EXPECT_EQ(resolver.resolve("g++"), "GCC 11.4.0");
    EXPECT_EQ(resolver.resolve("g++"), "GCC 11.4.0");
    EXPECT_EQ(runner.countProgram("cmake"), 1);

    const Command& probe = runner.commands.front();
    EXPECT_EQ(probe.args, std::vector<std::string>{"."});
    EXPECT_EQ(probe.cwd, (dir.path() / "probe").string());
    EXPECT_EQ(probe.env_overrides.at("CXX"), "g++");
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "probe" / "CMakeLists.txt"));

    resolver.resolve("clang++");
    EXPECT_EQ(runner.countProgram("cmake"), 2);
    EXPECT_EQ(runner.commands.back().env_overrides.at("CXX"), "clang++");
}

TEST(ToolchainTest, ResolverWithoutMarkerFails) {
    TempDir dir;
    FakeCommandRunner runner;
    CMakeToolchainResolver resolver(runner, dir.path() / "probe");
    EXPECT_THROW(resolver.resolve("g++"), ConfigurationError);
}

TEST(ToolchainTest, VersionFromTags) {
    EXPECT_EQ(GitRevisionInspector::versionFromTags("v3.4.0\n"), std::optional<std::string>("3.4.0"));
    EXPECT_EQ(GitRevisionInspector::versionFromTags("nightly\nv2.0.1\n"), std::optional<std::string>("2.0.1"));
    EXPECT_EQ(GitRevisionInspector::versionFromTags("nightly\nvfoo\n"), std::nullopt);
    EXPECT_EQ(GitRevisionInspector::versionFromTags(""), std::nullopt);
    EXPECT_THROW(GitRevisionInspector::versionFromTags("v1.0\nv1.0.1\n"), ConfigurationError);
}

TEST(ToolchainTest, GitInspectorQueriesEachPathOnce) {
    FakeCommandRunner runner;
    runner.outputs["git"] = "abc123\n";
    GitRevisionInspector inspector(runner);

    RevisionInfo info = inspector.inspect("/src/fruit");
    EXPECT_EQ(info.commit_hash, "abc123");
    EXPECT_FALSE(info.version_name.has_value());
    inspector.inspect("/src/fruit");

    ASSERT_EQ(runner.commands.size(), 2u);
    EXPECT_EQ(runner.commands[0].args, (std::vector<std::string>{"rev-parse", "HEAD"}));
    EXPECT_EQ(runner.commands[1].args, (std::vector<std::string>{"tag", "--points-at", "HEAD"}));
    EXPECT_EQ(runner.commands[0].cwd, "/src/fruit");
}

TEST(ToolchainTest, GitFailurePropagates) {
    FakeCommandRunner runner;
    runner.failures["git"] = 128;
    GitRevisionInspector inspector(runner);
    EXPECT_THROW(inspector.inspect("/not/a/repo"), CommandFailure);
}

TEST(LookupCacheTest, ComputesOncePerKey) {
    int computed = 0;
    LookupCache<int, int> cache([&](const int& k) {
        computed++;
        return k * k;
    });

    EXPECT_FALSE(cache.contains(3));
    EXPECT_EQ(cache.get(3), 9);
    EXPECT_EQ(cache.get(3), 9);
    EXPECT_EQ(cache.get(4), 16);
    EXPECT_EQ(computed, 2);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains(3));
}
