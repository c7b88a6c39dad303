#pragma once

#include <dv_alm/config/alm_config.hpp>
#include <dv_alm/core/result.hpp>
#include <dv_alm/dataverse/i_dataverse_session.hpp>
#include <dv_alm/hooks/hook_registry.hpp>
#include <dv_alm/solution/component_comparer.hpp>
#include <dv_alm/tools/git_client.hpp>
#include <dv_alm/tools/solution_packager.hpp>
#include <dv_alm/workflow/workflow_result.hpp>

namespace dv_alm {

// ---------------------------------------------------------------------------
// ExportWorkflow — environment -> source control.
//
//   pre_export hooks
//   per solution: export both zips -> unpack -> classify -> replace source
//                 -> if changed: next version -> environment + Solution.xml
//                 -> git add
//   git commit (+ push)
//   post_export hooks
//
// Export, unpack, version and git failures abort the run (Err). A failed
// comparison fails only that solution; the run continues and the result
// reports success = false.
//
// Takes ownership of nothing; every collaborator must outlive this object.
// ---------------------------------------------------------------------------
class ExportWorkflow {
public:
    ExportWorkflow(IDataverseSession& session,
                   ISolutionPackager& packager,
                   const IComponentComparer& comparer,
                   IGitClient& git,
                   HookRunner& hooks,
                   const AlmConfig& config);

    ExportWorkflow(const ExportWorkflow&) = delete;
    ExportWorkflow& operator=(const ExportWorkflow&) = delete;

    [[nodiscard]] Result<RunResult, Error> Execute();

private:
    Result<SolutionRunResult, Error> ExportOne(const SolutionConfig& solution);
    ExportHookContext HookContext(const std::vector<std::string>& changed) const;

    IDataverseSession& session_;
    ISolutionPackager& packager_;
    const IComponentComparer& comparer_;
    IGitClient& git_;
    HookRunner& hooks_;
    const AlmConfig& config_;
};

} // namespace dv_alm
