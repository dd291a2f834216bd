#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "process/command_runner.hpp"
#include "process/scratch_dir.hpp"
#include "fakes.hpp"

#include <fstream>

using namespace adabench;
using namespace adabench::testing;

namespace {

Command shell(const std::string& script) {
    Command c;
    c.program = "/bin/sh";
    c.args = {"-c", script};
    return c;
}

} // namespace

TEST(ProcessTest, CapturesStdoutAndStderr) {
    PosixCommandRunner runner;
    CommandOutput out = runner.run(shell("echo hello; echo oops >&2"));
    EXPECT_EQ(out.stdout_text, "hello\n");
    EXPECT_EQ(out.stderr_text, "oops\n");
}

TEST(ProcessTest, RunsInWorkingDirectory) {
    TempDir dir;
    PosixCommandRunner runner;
    Command c = shell("pwd -P");
    c.cwd = dir.path().string();
    CommandOutput out = runner.run(c);
    EXPECT_EQ(out.stdout_text, std::filesystem::canonical(dir.path()).string() + "\n");
}

TEST(ProcessTest, AppliesEnvironmentOverrides) {
    PosixCommandRunner runner;
    Command c = shell("echo \"$CXX\"");
    c.env_overrides["CXX"] = "clang++";
    EXPECT_EQ(runner.run(c).stdout_text, "clang++\n");
}

TEST(ProcessTest, NonZeroExitThrowsCommandFailure) {
    PosixCommandRunner runner;
    try {
        runner.run(shell("echo partial; echo broken >&2; exit 3"));
        FAIL() << "expected CommandFailure";
    } catch (const CommandFailure& e) {
        EXPECT_EQ(e.exitCode(), 3);
        EXPECT_EQ(e.stdoutText(), "partial\n");
        EXPECT_EQ(e.stderrText(), "broken\n");
        ASSERT_EQ(e.command().size(), 3u);
        EXPECT_EQ(e.command()[0], "/bin/sh");
        EXPECT_EQ(e.commandLine(), "/bin/sh -c echo partial; echo broken >&2; exit 3");
        std::string what = e.what();
        EXPECT_NE(what.find("Ran command: /bin/sh -c"), std::string::npos);
        EXPECT_NE(what.find("Exit code 3"), std::string::npos);
    }
}

TEST(ProcessTest, MissingProgramIsACommandFailure) {
    PosixCommandRunner runner;
    Command c;
    c.program = "adabench-no-such-program";
    EXPECT_THROW(runner.run(c), CommandFailure);
}

TEST(ProcessTest, EnsureEmptyDirClearsContents) {
    TempDir dir;
    auto target = dir.path() / "build";
    std::filesystem::create_directories(target / "nested");
    std::ofstream(target / "nested" / "stale.o") << "old";

    ensureEmptyDir(target);
    EXPECT_TRUE(std::filesystem::is_directory(target));
    EXPECT_TRUE(std::filesystem::is_empty(target));

    auto fresh = dir.path() / "a" / "b";
    ensureEmptyDir(fresh);
    EXPECT_TRUE(std::filesystem::is_directory(fresh));
}
