#include <dv_alm/core/process.hpp>

#include <dv_alm/core/log.hpp>

#include <cerrno>
#include <cstring>
#include <sstream>

#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dv_alm {

namespace {

Error MakeProcessError(const ProcessSpec& spec, const std::string& message) {
    return Error{"RunProcess", spec.program, std::nullopt,
                 message + ": " + std::strerror(errno), std::nullopt,
                 ErrorCategory::Internal};
}

// Quote an argument for display only; nothing is ever passed to a shell.
std::string DisplayArg(const std::string& arg) {
    if (arg.find_first_of(" \t\"'") == std::string::npos && !arg.empty()) {
        return arg;
    }
    std::string quoted = "\"";
    for (char c : arg) {
        if (c == '"') quoted += '\\';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// Drain both pipes until the child closes them. Reading them one after the
// other can deadlock once the child fills the other pipe's buffer.
void DrainPipes(int out_fd, int err_fd, std::string& out, std::string& err) {
    pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;
    char buffer[4096];

    while (open_count > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            return;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            auto n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

} // anonymous namespace

std::string ProcessSpec::CommandLine() const {
    std::ostringstream oss;
    oss << DisplayArg(program);
    for (const auto& arg : args) {
        oss << ' ' << DisplayArg(arg);
    }
    return oss.str();
}

Result<ProcessResult, Error> PosixProcessRunner::Run(const ProcessSpec& spec) {
    LogInfo("process", "exec " + spec.CommandLine() +
            (spec.working_dir.empty() ? "" : " (in " + spec.working_dir + ")"));

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        return Result<ProcessResult, Error>::Err(
            MakeProcessError(spec, "pipe failed"));
    }
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return Result<ProcessResult, Error>::Err(
            MakeProcessError(spec, "pipe failed"));
    }

    // argv must be built before fork: only async-signal-safe calls are
    // allowed in the child.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(spec.program.c_str()));
    for (const auto& arg : spec.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return Result<ProcessResult, Error>::Err(
            MakeProcessError(spec, "fork failed"));
    }

    if (pid == 0) {
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        if (!spec.working_dir.empty() && chdir(spec.working_dir.c_str()) != 0) {
            _exit(126);
        }
        for (const auto& [key, value] : spec.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }
        execvp(spec.program.c_str(), argv.data());
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    ProcessResult result;
    DrainPipes(out_pipe[0], err_pipe[0], result.out, result.err);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Result<ProcessResult, Error>::Err(
                MakeProcessError(spec, "waitpid failed"));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }

    if (result.exit_code == 127) {
        LogWarn("process", spec.program + " exited with 127 (not found on PATH?)");
    }
    LogDebug("process", spec.program + " exited with " +
             std::to_string(result.exit_code));
    if (!result.err.empty()) {
        LogDebug("process", "stderr: " + result.err);
    }

    return Result<ProcessResult, Error>::Ok(std::move(result));
}

} // namespace dv_alm
