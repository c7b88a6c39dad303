#pragma once

#include <dv_alm/core/result.hpp>
#include <dv_alm/dataverse/i_dataverse_session.hpp>
#include <dv_alm/solution/import_strategy.hpp>
#include <dv_alm/solution/solution_version.hpp>

#include <optional>
#include <string>

namespace dv_alm {

// ---------------------------------------------------------------------------
// DeployedSolutionState — a solution as installed in an environment.
// ---------------------------------------------------------------------------
struct DeployedSolutionState {
    std::string unique_name;
    std::string solution_id;
    SolutionVersion installed_version;
    bool is_managed = false;
};

// ---------------------------------------------------------------------------
// Solutions — free functions over the Dataverse Web API.
//
// GET   solutions?$filter=uniquename eq '{name}'  — installed state
// PATCH solutions({id})                           — set version
// POST  ExportSolution                            — export zip (base64)
// POST  ImportSolution                            — import / stage holding
// POST  StageAndUpgrade                           — direct upgrade
// POST  DeleteAndPromote                          — apply a holding upgrade
// POST  PublishAllXml                             — publish customizations
// ---------------------------------------------------------------------------

/// Installed state, or nullopt when the solution is not in the environment.
[[nodiscard]] Result<std::optional<DeployedSolutionState>, Error> GetInstalledSolution(
    IDataverseSession& session,
    const std::string& unique_name);

[[nodiscard]] Result<void, Error> SetSolutionVersion(
    IDataverseSession& session,
    const std::string& unique_name,
    const SolutionVersion& version);

/// Raw zip bytes of the exported solution.
[[nodiscard]] Result<std::string, Error> ExportSolution(
    IDataverseSession& session,
    const std::string& unique_name,
    bool managed);

// Every import carries an ImportJobId. An empty `import_job_id` means a new
// one is generated. Unmanaged customization layers in the target are kept
// unless `overwrite_unmanaged_customizations` is set.
struct ImportOptions {
    bool holding_solution = false;
    bool overwrite_unmanaged_customizations = false;
    bool publish_workflows = true;
    std::string import_job_id;
};

[[nodiscard]] Result<void, Error> ImportSolution(
    IDataverseSession& session,
    const std::string& zip_bytes,
    const ImportOptions& options);

[[nodiscard]] Result<void, Error> StageAndUpgrade(
    IDataverseSession& session,
    const std::string& zip_bytes,
    const ImportOptions& options = {});

[[nodiscard]] Result<void, Error> DeleteAndPromote(
    IDataverseSession& session,
    const std::string& unique_name);

[[nodiscard]] Result<void, Error> PublishAllCustomizations(IDataverseSession& session);

/// Stage one artifact according to an import mode: Holding imports as a
/// holding solution, Direct runs StageAndUpgrade, every other importing
/// mode is a plain ImportSolution. Only UnmanagedOverwrite overwrites
/// unmanaged customizations. Err for ImportMode::None.
[[nodiscard]] Result<void, Error> StageSolution(
    IDataverseSession& session,
    const std::string& zip_bytes,
    ImportMode mode);

} // namespace dv_alm
