#include "common/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace adabench {

namespace {

std::string joinCommand(const std::vector<std::string>& command) {
    return fmt::format("{}", fmt::join(command, " "));
}

std::string describeFailure(const std::vector<std::string>& command,
                            const std::string& stdout_text,
                            const std::string& stderr_text,
                            int exit_code) {
    return fmt::format("Ran command: {}\nExit code {}\nStdout:\n{}\n\nStderr:\n{}\n",
                       joinCommand(command), exit_code, stdout_text, stderr_text);
}

} // namespace

CommandFailure::CommandFailure(std::vector<std::string> command,
                               std::string stdout_text,
                               std::string stderr_text,
                               int exit_code)
    : std::runtime_error(describeFailure(command, stdout_text, stderr_text, exit_code)),
      command_(std::move(command)),
      stdout_(std::move(stdout_text)),
      stderr_(std::move(stderr_text)),
      exit_code_(exit_code) {}

std::string CommandFailure::commandLine() const {
    return joinCommand(command_);
}

} // namespace adabench
