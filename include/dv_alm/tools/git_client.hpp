#pragma once

#include <dv_alm/core/process.hpp>
#include <dv_alm/core/result.hpp>

#include <string>
#include <utility>
#include <vector>

namespace dv_alm {

// ---------------------------------------------------------------------------
// IGitClient — the git operations the export workflow needs.
// ---------------------------------------------------------------------------
class IGitClient {
public:
    virtual ~IGitClient() = default;

    /// True when `pathspec` has staged, unstaged or untracked changes.
    [[nodiscard]] virtual Result<bool, Error> HasChanges(const std::string& pathspec) = 0;
    [[nodiscard]] virtual Result<void, Error> Add(const std::string& pathspec) = 0;
    [[nodiscard]] virtual Result<void, Error> Commit(const std::string& message) = 0;
    /// Push to `remote`; an empty `branch` pushes the current branch.
    [[nodiscard]] virtual Result<void, Error> Push(const std::string& remote,
                                                   const std::string& branch) = 0;
};

// ---------------------------------------------------------------------------
// GitClient — runs the git CLI through an IProcessRunner inside `work_tree`.
// ---------------------------------------------------------------------------
class GitClient : public IGitClient {
public:
    GitClient(IProcessRunner& runner, std::string work_tree, std::string program = "git")
        : runner_(runner), work_tree_(std::move(work_tree)), program_(std::move(program)) {}

    [[nodiscard]] Result<bool, Error> HasChanges(const std::string& pathspec) override;
    [[nodiscard]] Result<void, Error> Add(const std::string& pathspec) override;
    [[nodiscard]] Result<void, Error> Commit(const std::string& message) override;
    [[nodiscard]] Result<void, Error> Push(const std::string& remote,
                                           const std::string& branch) override;

private:
    Result<ProcessResult, Error> RunGit(const char* operation,
                                        std::vector<std::string> args);

    IProcessRunner& runner_;
    std::string work_tree_;
    std::string program_;
};

} // namespace dv_alm
