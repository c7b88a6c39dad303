#include <dv_alm/dataverse/processes.hpp>
#include "odata_utils.hpp"

#include <dv_alm/core/log.hpp>
#include <dv_alm/core/url.hpp>

#include <nlohmann/json.hpp>

namespace dv_alm {

namespace {

// solutioncomponent.componenttype for a process (workflow entity).
constexpr int kWorkflowComponentType = 29;
// workflow.type 1 = definition; 2 = activation copy, 3 = template.
constexpr int kWorkflowDefinition = 1;

std::string ApiPath(const std::string& relative) {
    return std::string(kWebApiRoot) + relative;
}

Result<void, Error> PatchWorkflow(IDataverseSession& session,
                                  const char* operation,
                                  const std::string& process_id,
                                  const nlohmann::json& body) {
    auto path = ApiPath("workflows(" + process_id + ")");
    auto response = session.Patch(path, body.dump());
    if (response.IsErr()) {
        return Result<void, Error>::Err(std::move(response).Error());
    }
    const auto& http = response.Value();
    if (!odata_utils::IsSuccess(http.status_code)) {
        return Result<void, Error>::Err(
            odata_utils::HttpFailure(operation, path, http, ErrorCategory::Process));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

Result<std::vector<ProcessInfo>, Error> ListSolutionProcesses(
    IDataverseSession& session,
    const std::string& solution_id) {
    using R = Result<std::vector<ProcessInfo>, Error>;

    auto filter = "_solutionid_value eq " + solution_id +
                  " and componenttype eq " + std::to_string(kWorkflowComponentType);
    auto path = ApiPath("solutioncomponents?$filter=" + UrlEncode(filter) +
                        "&$select=objectid");
    auto response = session.Get(path);
    if (response.IsErr()) {
        return R::Err(std::move(response).Error());
    }
    if (response.Value().status_code != 200) {
        return R::Err(odata_utils::HttpFailure("ListSolutionProcesses", path,
                                               response.Value(), ErrorCategory::Process));
    }
    auto components = odata_utils::ParseValueArray("ListSolutionProcesses", path,
                                                   response.Value().body);
    if (components.IsErr()) {
        return R::Err(std::move(components).Error().WithCategory(ErrorCategory::Process));
    }

    std::vector<ProcessInfo> processes;
    for (const auto& component : components.Value()) {
        auto object_id = odata_utils::StringField(component, "objectid");
        if (object_id.empty()) continue;

        auto workflow_path = ApiPath("workflows(" + object_id +
            ")?$select=name,statecode,statuscode,type,_ownerid_value");
        auto workflow = session.Get(workflow_path);
        if (workflow.IsErr()) {
            return R::Err(std::move(workflow).Error());
        }
        const auto& http = workflow.Value();
        if (http.status_code != 200) {
            return R::Err(odata_utils::HttpFailure("ListSolutionProcesses", workflow_path,
                                                   http, ErrorCategory::Process));
        }
        auto doc = nlohmann::json::parse(http.body, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            return R::Err(Error{"ListSolutionProcesses", workflow_path, http.status_code,
                                "Invalid workflow response", std::nullopt,
                                ErrorCategory::Process});
        }
        if (odata_utils::IntField(doc, "type", kWorkflowDefinition) != kWorkflowDefinition) {
            continue;
        }

        ProcessInfo info;
        info.id = object_id;
        info.name = odata_utils::StringField(doc, "name");
        info.owner_id = odata_utils::StringField(doc, "_ownerid_value");
        info.statecode = odata_utils::IntField(doc, "statecode", 0);
        info.statuscode = odata_utils::IntField(doc, "statuscode", 1);
        processes.push_back(std::move(info));
    }

    LogDebug("processes", std::to_string(processes.size()) +
             " processes in solution " + solution_id);
    return R::Ok(std::move(processes));
}

Result<std::string, Error> FindSystemUser(IDataverseSession& session,
                                          const std::string& upn) {
    using R = Result<std::string, Error>;

    auto filter = "domainname eq " + ODataStringLiteral(upn);
    auto path = ApiPath("systemusers?$filter=" + UrlEncode(filter) +
                        "&$select=systemuserid,domainname");
    auto response = session.Get(path);
    if (response.IsErr()) {
        return R::Err(std::move(response).Error());
    }
    if (response.Value().status_code != 200) {
        return R::Err(odata_utils::HttpFailure("FindSystemUser", path,
                                               response.Value(), ErrorCategory::Identity));
    }
    auto rows = odata_utils::ParseValueArray("FindSystemUser", path, response.Value().body);
    if (rows.IsErr()) {
        return R::Err(std::move(rows).Error().WithCategory(ErrorCategory::Identity));
    }

    const auto& users = rows.Value();
    if (users.empty()) {
        return R::Err(Error{"FindSystemUser", upn, std::nullopt,
                            "No system user with this domain name", std::nullopt,
                            ErrorCategory::Identity});
    }
    if (users.size() > 1) {
        return R::Err(Error{"FindSystemUser", upn, std::nullopt,
                            std::to_string(users.size()) +
                                " system users share this domain name",
                            std::nullopt, ErrorCategory::Identity});
    }
    auto id = odata_utils::StringField(users.front(), "systemuserid");
    if (id.empty()) {
        return R::Err(Error{"FindSystemUser", upn, std::nullopt,
                            "System user row has no systemuserid", std::nullopt,
                            ErrorCategory::Identity});
    }
    return R::Ok(std::move(id));
}

Result<void, Error> AssignOwner(IDataverseSession& session,
                                const std::string& process_id,
                                const std::string& user_id) {
    nlohmann::json body = {{"ownerid@odata.bind", "/systemusers(" + user_id + ")"}};
    return PatchWorkflow(session, "AssignOwner", process_id, body);
}

Result<void, Error> SetProcessState(IDataverseSession& session,
                                    const std::string& process_id,
                                    ProcessState state) {
    nlohmann::json body = state == ProcessState::Activated
        ? nlohmann::json{{"statecode", 1}, {"statuscode", 2}}
        : nlohmann::json{{"statecode", 0}, {"statuscode", 1}};
    return PatchWorkflow(session, "SetProcessState", process_id, body);
}

} // namespace dv_alm
