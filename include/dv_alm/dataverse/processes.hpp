#pragma once

#include <dv_alm/core/result.hpp>
#include <dv_alm/dataverse/i_dataverse_session.hpp>

#include <string>
#include <vector>

namespace dv_alm {

// ---------------------------------------------------------------------------
// ProcessInfo — a process definition (workflow, cloud flow, business rule,
// action) contained in a solution.
//
// statecode 0 = Draft, 1 = Activated.
// ---------------------------------------------------------------------------
struct ProcessInfo {
    std::string id;
    std::string name;
    std::string owner_id;
    int statecode = 0;
    int statuscode = 1;

    [[nodiscard]] bool IsActivated() const noexcept { return statecode == 1; }
};

enum class ProcessState {
    Draft,
    Activated,
};

// ---------------------------------------------------------------------------
// Processes — free functions over the Dataverse Web API.
//
// GET   solutioncomponents?$filter=_solutionid_value eq {id} and componenttype eq 29
// GET   workflows({id})
// GET   systemusers?$filter=domainname eq '{upn}'
// PATCH workflows({id})   — owner (ownerid@odata.bind) or state
// ---------------------------------------------------------------------------

/// Process definitions that belong to the solution with `solution_id`.
[[nodiscard]] Result<std::vector<ProcessInfo>, Error> ListSolutionProcesses(
    IDataverseSession& session,
    const std::string& solution_id);

/// systemuserid of the user whose domainname is `upn`. Err with category
/// Identity when no user or more than one user matches.
[[nodiscard]] Result<std::string, Error> FindSystemUser(
    IDataverseSession& session,
    const std::string& upn);

[[nodiscard]] Result<void, Error> AssignOwner(
    IDataverseSession& session,
    const std::string& process_id,
    const std::string& user_id);

[[nodiscard]] Result<void, Error> SetProcessState(
    IDataverseSession& session,
    const std::string& process_id,
    ProcessState state);

} // namespace dv_alm
