#include <dv_alm/tools/git_client.hpp>

#include <dv_alm/core/log.hpp>

namespace dv_alm {

Result<ProcessResult, Error> GitClient::RunGit(const char* operation,
                                               std::vector<std::string> args) {
    ProcessSpec spec;
    spec.program = program_;
    spec.args = std::move(args);
    spec.working_dir = work_tree_;

    LogInfo("git", spec.CommandLine());
    auto result = runner_.Run(spec);
    if (result.IsErr()) {
        return Result<ProcessResult, Error>::Err(
            std::move(result).Error().WithCategory(ErrorCategory::Git));
    }
    auto process = std::move(result).Value();
    if (!process.Succeeded()) {
        auto detail = process.err.empty() ? process.out : process.err;
        return Result<ProcessResult, Error>::Err(Error{
            operation, work_tree_, std::nullopt,
            "git exited with code " + std::to_string(process.exit_code) +
                (detail.empty() ? "" : ": " + detail),
            std::nullopt, ErrorCategory::Git});
    }
    return Result<ProcessResult, Error>::Ok(std::move(process));
}

Result<bool, Error> GitClient::HasChanges(const std::string& pathspec) {
    auto status = RunGit("GitStatus", {"status", "--porcelain", "--", pathspec});
    if (status.IsErr()) {
        return Result<bool, Error>::Err(std::move(status).Error());
    }
    return Result<bool, Error>::Ok(
        status.Value().out.find_first_not_of(" \t\r\n") != std::string::npos);
}

Result<void, Error> GitClient::Add(const std::string& pathspec) {
    auto added = RunGit("GitAdd", {"add", "--all", "--", pathspec});
    if (added.IsErr()) {
        return Result<void, Error>::Err(std::move(added).Error());
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> GitClient::Commit(const std::string& message) {
    auto committed = RunGit("GitCommit", {"commit", "-m", message});
    if (committed.IsErr()) {
        return Result<void, Error>::Err(std::move(committed).Error());
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> GitClient::Push(const std::string& remote,
                                    const std::string& branch) {
    std::vector<std::string> args = {"push", remote};
    if (!branch.empty()) {
        args.push_back("HEAD:" + branch);
    }
    auto pushed = RunGit("GitPush", std::move(args));
    if (pushed.IsErr()) {
        return Result<void, Error>::Err(std::move(pushed).Error());
    }
    return Result<void, Error>::Ok();
}

} // namespace dv_alm
