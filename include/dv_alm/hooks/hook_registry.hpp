#pragma once

#include <dv_alm/config/alm_config.hpp>
#include <dv_alm/core/process.hpp>
#include <dv_alm/core/result.hpp>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace dv_alm {

// ---------------------------------------------------------------------------
// Hook contexts — what each phase tells its scripts. Every field reaches the
// child process as a DV_ALM_* environment variable; lists are joined with
// commas.
// ---------------------------------------------------------------------------

// pre_export / post_export
struct ExportHookContext {
    std::string environment;
    std::string environment_url;
    std::string commit_message;
    std::vector<std::string> solutions;
    std::vector<std::string> changed_solutions;   // post_export only
};

// pre_build / post_build
struct BuildHookContext {
    std::string source_dir;
    std::string artifacts_dir;
    std::vector<std::string> solutions;
};

// pre_deploy / pre_upgrade / post_deploy
struct DeployHookContext {
    std::string environment;
    std::string environment_url;
    bool unmanaged = false;
    std::vector<std::string> solutions;
    std::vector<std::string> imported_solutions;  // empty for pre_deploy
    std::vector<std::string> holding_solutions;   // awaiting promotion at pre_upgrade
};

std::map<std::string, std::string> HookEnvironment(const ExportHookContext& context);
std::map<std::string, std::string> HookEnvironment(const BuildHookContext& context);
std::map<std::string, std::string> HookEnvironment(const DeployHookContext& context);

// ---------------------------------------------------------------------------
// HookRunner — runs the configured scripts of a phase, in order, through
// `sh -c`. The first script that fails to start or exits non-zero stops the
// phase with a Hook error. Passing a context of the wrong kind for a phase
// is an Internal error.
// ---------------------------------------------------------------------------
class HookRunner {
public:
    HookRunner(IProcessRunner& runner,
               std::map<HookPhase, std::vector<std::string>> hooks)
        : runner_(runner), hooks_(std::move(hooks)) {}

    [[nodiscard]] Result<void, Error> Run(HookPhase phase, const ExportHookContext& context);
    [[nodiscard]] Result<void, Error> Run(HookPhase phase, const BuildHookContext& context);
    [[nodiscard]] Result<void, Error> Run(HookPhase phase, const DeployHookContext& context);

    /// Number of scripts registered for `phase`.
    [[nodiscard]] size_t ScriptCount(HookPhase phase) const;

private:
    Result<void, Error> RunScripts(HookPhase phase,
                                   std::map<std::string, std::string> env);

    IProcessRunner& runner_;
    std::map<HookPhase, std::vector<std::string>> hooks_;
};

} // namespace dv_alm
