#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace adabench {

// ─── Configuration Error ───────────────────────────────────────
// Required input missing or inconsistent. Raised before any
// measurement takes place.

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

// ─── Command Failure ───────────────────────────────────────────
// An external program exited with a non-zero status. Carries the full
// argv, both captured streams and the exit code.

class CommandFailure : public std::runtime_error {
public:
    CommandFailure(std::vector<std::string> command,
                   std::string stdout_text,
                   std::string stderr_text,
                   int exit_code);

    const std::vector<std::string>& command() const { return command_; }
    const std::string& stdoutText() const { return stdout_; }
    const std::string& stderrText() const { return stderr_; }
    int exitCode() const { return exit_code_; }

    /// The command as a single space-separated line.
    std::string commandLine() const;

private:
    std::vector<std::string> command_;
    std::string stdout_;
    std::string stderr_;
    int exit_code_;
};

} // namespace adabench
