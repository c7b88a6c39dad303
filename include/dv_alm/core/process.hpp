#pragma once

#include <dv_alm/core/result.hpp>

#include <map>
#include <string>
#include <vector>

namespace dv_alm {

// ---------------------------------------------------------------------------
// ProcessSpec — one child-process invocation. `program` is resolved through
// PATH. `env` entries are added to (or override) the inherited environment.
// ---------------------------------------------------------------------------
struct ProcessSpec {
    std::string program;
    std::vector<std::string> args;
    std::string working_dir;
    std::map<std::string, std::string> env;

    // Rendered for log lines and error messages.
    [[nodiscard]] std::string CommandLine() const;
};

// ---------------------------------------------------------------------------
// ProcessResult — exit status plus captured output.
// ---------------------------------------------------------------------------
struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;

    [[nodiscard]] bool Succeeded() const noexcept { return exit_code == 0; }
};

// ---------------------------------------------------------------------------
// IProcessRunner — runs a child process to completion.
//
// Returns Err only when the process could not be started or waited for; a
// non-zero exit code is an Ok result the caller must inspect. The packager,
// git and hook adapters all go through this seam so they can be tested with
// MockProcessRunner.
// ---------------------------------------------------------------------------
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    [[nodiscard]] virtual Result<ProcessResult, Error> Run(const ProcessSpec& spec) = 0;
};

// POSIX implementation: fork + execvp, stdout/stderr captured through pipes.
class PosixProcessRunner : public IProcessRunner {
public:
    [[nodiscard]] Result<ProcessResult, Error> Run(const ProcessSpec& spec) override;
};

} // namespace dv_alm
