#pragma once

#include <map>
#include <string>
#include <vector>

namespace adabench {

/// One external program invocation.
struct Command {
    std::string program;
    std::vector<std::string> args;
    std::string cwd;                                    // empty = inherit
    std::map<std::string, std::string> env_overrides;   // applied on top of the current environment

    /// program followed by args.
    std::vector<std::string> argv() const;
};

struct CommandOutput {
    std::string stdout_text;
    std::string stderr_text;
};

// ─── Command Runner ────────────────────────────────────────────
// Executes a command synchronously. Implementations must throw
// CommandFailure when the program exits with a non-zero status.

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandOutput run(const Command& command) = 0;
};

/// fork/exec based runner. Output is captured through temporary files
/// so that large outputs never block on a full pipe. There is no timeout.
class PosixCommandRunner : public CommandRunner {
public:
    CommandOutput run(const Command& command) override;
};

} // namespace adabench
