#pragma once

#include <dv_alm/config/alm_config.hpp>
#include <dv_alm/core/result.hpp>
#include <dv_alm/hooks/hook_registry.hpp>
#include <dv_alm/tools/solution_packager.hpp>
#include <dv_alm/workflow/workflow_result.hpp>

namespace dv_alm {

// ---------------------------------------------------------------------------
// BuildWorkflow — source folders -> artifacts folder. No Dataverse calls.
//
//   pre_build hooks
//   per solution: read Solution.xml version -> pack --packagetype Both
//   write solutions.json
//   post_build hooks
//
// Any failure aborts the run.
// ---------------------------------------------------------------------------
class BuildWorkflow {
public:
    BuildWorkflow(ISolutionPackager& packager,
                  HookRunner& hooks,
                  const AlmConfig& config);

    BuildWorkflow(const BuildWorkflow&) = delete;
    BuildWorkflow& operator=(const BuildWorkflow&) = delete;

    [[nodiscard]] Result<RunResult, Error> Execute();

private:
    BuildHookContext HookContext() const;

    ISolutionPackager& packager_;
    HookRunner& hooks_;
    const AlmConfig& config_;
};

} // namespace dv_alm
