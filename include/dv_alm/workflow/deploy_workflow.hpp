#pragma once

#include <dv_alm/config/alm_config.hpp>
#include <dv_alm/core/result.hpp>
#include <dv_alm/dataverse/i_dataverse_session.hpp>
#include <dv_alm/hooks/hook_registry.hpp>
#include <dv_alm/solution/deploy_state.hpp>
#include <dv_alm/solution/import_strategy.hpp>
#include <dv_alm/workflow/build_workflow.hpp>
#include <dv_alm/workflow/workflow_result.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dv_alm {

struct DeployOptions {
    bool unmanaged = false;   // treat every solution as unmanaged
};

// ---------------------------------------------------------------------------
// DeployWorkflow — artifacts folder -> target environment.
//
//   read solutions.json                         (Config error if incomplete)
//   pre_deploy hooks
//   stage every solution in listed order        (fail fast, no rollback)
//   pre_upgrade hooks                           (old + new components coexist)
//   promote holding solutions in reverse order
//   resolve service identities, then reassign + activate processes
//   publish once if anything was imported
//   post_deploy hooks
//
// Each solution walks NotStaged -> Staged -> Upgraded -> ProcessesActivated
// -> Published; a skipped solution walks it without external calls.
// ---------------------------------------------------------------------------
class DeployWorkflow {
public:
    DeployWorkflow(IDataverseSession& session,
                   HookRunner& hooks,
                   const AlmConfig& config);

    DeployWorkflow(const DeployWorkflow&) = delete;
    DeployWorkflow& operator=(const DeployWorkflow&) = delete;

    [[nodiscard]] Result<RunResult, Error> Execute(const DeployOptions& options);

private:
    struct PlannedSolution {
        SolutionConfig config;
        std::string artifact_file;
        SolutionVersion artifact_version;
        std::optional<SolutionVersion> installed_version;
        ImportDecision decision;
        SolutionDeployment deployment;
        SolutionRunResult result;
    };

    Result<void, Error> StageAll(std::vector<PlannedSolution>& plan,
                                 const DeployOptions& options);
    Result<void, Error> UpgradeAll(std::vector<PlannedSolution>& plan);
    Result<void, Error> ActivateProcesses(std::vector<PlannedSolution>& plan);
    Result<void, Error> PublishAll(std::vector<PlannedSolution>& plan);

    DeployHookContext HookContext(const std::vector<PlannedSolution>& plan,
                                  const DeployOptions& options) const;

    IDataverseSession& session_;
    HookRunner& hooks_;
    const AlmConfig& config_;
};

// ---------------------------------------------------------------------------
// ImportWorkflow — build followed by an all-unmanaged deploy.
// ---------------------------------------------------------------------------
class ImportWorkflow {
public:
    ImportWorkflow(BuildWorkflow& build, DeployWorkflow& deploy)
        : build_(build), deploy_(deploy) {}

    [[nodiscard]] Result<RunResult, Error> Execute();

private:
    BuildWorkflow& build_;
    DeployWorkflow& deploy_;
};

} // namespace dv_alm
