#include "process/command_runner.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace adabench {

std::vector<std::string> Command::argv() const {
    std::vector<std::string> result;
    result.reserve(args.size() + 1);
    result.push_back(program);
    result.insert(result.end(), args.begin(), args.end());
    return result;
}

namespace {

// Unlinked on destruction.
class CaptureFile {
public:
    explicit CaptureFile(const char* tag) {
        std::string pattern = (fs::temp_directory_path() / (std::string("adabench-") + tag + "-XXXXXX")).string();
        fd_ = ::mkstemp(pattern.data());
        if (fd_ < 0) {
            throw std::runtime_error("failed to create capture file: " + std::string(std::strerror(errno)));
        }
        path_ = pattern;
    }

    ~CaptureFile() {
        if (fd_ >= 0) ::close(fd_);
        std::error_code ec;
        fs::remove(path_, ec);
    }

    CaptureFile(const CaptureFile&) = delete;
    CaptureFile& operator=(const CaptureFile&) = delete;

    int fd() const { return fd_; }

    std::string read() const {
        std::ifstream in(path_, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

private:
    int fd_ = -1;
    std::string path_;
};

} // namespace

CommandOutput PosixCommandRunner::run(const Command& command) {
    const std::vector<std::string> args = command.argv();
    log::debug("Running: {}", fmt::join(args, " "));

    CaptureFile out("stdout");
    CaptureFile err("stderr");

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error("fork failed while executing: " + args.front());
    }

    if (pid == 0) {
        if (::dup2(out.fd(), STDOUT_FILENO) < 0) _exit(127);
        if (::dup2(err.fd(), STDERR_FILENO) < 0) _exit(127);
        if (!command.cwd.empty() && ::chdir(command.cwd.c_str()) != 0) {
            std::fprintf(stderr, "cannot chdir to %s: %s\n", command.cwd.c_str(), std::strerror(errno));
            _exit(127);
        }
        for (const auto& [name, value] : command.env_overrides) {
            ::setenv(name.c_str(), value.c_str(), 1);
        }

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        ::execvp(argv[0], argv.data());
        std::fprintf(stderr, "cannot execute %s: %s\n", argv[0], std::strerror(errno));
        _exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error("waitpid failed while executing: " + args.front());
        }
    }

    int exit_code = 1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code = 128 + WTERMSIG(status);
    }

    CommandOutput output{out.read(), err.read()};
    if (exit_code != 0) {
        throw CommandFailure(args, std::move(output.stdout_text), std::move(output.stderr_text), exit_code);
    }
    return output;
}

} // namespace adabench
