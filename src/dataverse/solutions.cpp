#include <dv_alm/dataverse/solutions.hpp>
#include "odata_utils.hpp"

#include <dv_alm/core/base64.hpp>
#include <dv_alm/core/log.hpp>
#include <dv_alm/core/url.hpp>
#include <dv_alm/core/uuid.hpp>

#include <nlohmann/json.hpp>

namespace dv_alm {

namespace {

std::string ApiPath(const std::string& relative) {
    return std::string(kWebApiRoot) + relative;
}

Result<void, Error> PostAction(IDataverseSession& session,
                               const char* operation,
                               const std::string& target,
                               const std::string& action,
                               const nlohmann::json& body,
                               ErrorCategory category) {
    auto path = ApiPath(action);
    auto response = session.Post(path, body.dump());
    if (response.IsErr()) {
        return Result<void, Error>::Err(std::move(response).Error());
    }
    const auto& http = response.Value();
    if (!odata_utils::IsSuccess(http.status_code)) {
        auto err = odata_utils::HttpFailure(operation, path, http, category);
        err.target = target;
        return Result<void, Error>::Err(std::move(err));
    }
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> ImportBody(const char* operation,
                                        const std::string& zip_bytes,
                                        const ImportOptions& options) {
    auto job_id = options.import_job_id;
    if (job_id.empty()) {
        auto generated = NewUuid();
        if (generated.IsErr()) {
            auto err = std::move(generated).Error();
            err.operation = operation;
            return Result<nlohmann::json, Error>::Err(std::move(err));
        }
        job_id = std::move(generated).Value();
    }
    LogInfo("solutions", std::string(operation) + " import job " + job_id);
    return Result<nlohmann::json, Error>::Ok(nlohmann::json{
        {"CustomizationFile", Base64Encode(zip_bytes)},
        {"OverwriteUnmanagedCustomizations", options.overwrite_unmanaged_customizations},
        {"PublishWorkflows", options.publish_workflows},
        {"ImportJobId", job_id},
    });
}

} // anonymous namespace

Result<std::optional<DeployedSolutionState>, Error> GetInstalledSolution(
    IDataverseSession& session,
    const std::string& unique_name) {
    using R = Result<std::optional<DeployedSolutionState>, Error>;

    auto filter = "uniquename eq " + ODataStringLiteral(unique_name);
    auto path = ApiPath("solutions?$filter=" + UrlEncode(filter) +
                        "&$select=solutionid,uniquename,version,ismanaged");
    auto response = session.Get(path);
    if (response.IsErr()) {
        return R::Err(std::move(response).Error());
    }
    const auto& http = response.Value();
    if (http.status_code != 200) {
        return R::Err(odata_utils::HttpFailure("GetInstalledSolution", path, http,
                                               ErrorCategory::Connection));
    }

    auto rows = odata_utils::ParseValueArray("GetInstalledSolution", path, http.body);
    if (rows.IsErr()) {
        return R::Err(std::move(rows).Error());
    }
    if (rows.Value().empty()) {
        return R::Ok(std::nullopt);
    }

    const auto& row = rows.Value().front();
    auto version = SolutionVersion::Parse(odata_utils::StringField(row, "version"));
    if (version.IsErr()) {
        auto err = std::move(version).Error();
        err.target = unique_name;
        return R::Err(std::move(err));
    }

    DeployedSolutionState state;
    state.unique_name = odata_utils::StringField(row, "uniquename", unique_name);
    state.solution_id = odata_utils::StringField(row, "solutionid");
    state.installed_version = version.Value();
    state.is_managed = odata_utils::BoolField(row, "ismanaged", false);
    return R::Ok(std::move(state));
}

Result<void, Error> SetSolutionVersion(IDataverseSession& session,
                                       const std::string& unique_name,
                                       const SolutionVersion& version) {
    auto installed = GetInstalledSolution(session, unique_name);
    if (installed.IsErr()) {
        return Result<void, Error>::Err(std::move(installed).Error());
    }
    if (!installed.Value().has_value()) {
        return Result<void, Error>::Err(Error{
            "SetSolutionVersion", unique_name, std::nullopt,
            "Solution is not installed in the environment", std::nullopt,
            ErrorCategory::NotFound});
    }

    auto path = ApiPath("solutions(" + installed.Value()->solution_id + ")");
    nlohmann::json body = {{"version", version.ToString()}};
    auto response = session.Patch(path, body.dump());
    if (response.IsErr()) {
        return Result<void, Error>::Err(std::move(response).Error());
    }
    const auto& http = response.Value();
    if (!odata_utils::IsSuccess(http.status_code)) {
        return Result<void, Error>::Err(odata_utils::HttpFailure(
            "SetSolutionVersion", path, http, ErrorCategory::Export));
    }
    LogInfo("solutions", unique_name + " version set to " + version.ToString());
    return Result<void, Error>::Ok();
}

Result<std::string, Error> ExportSolution(IDataverseSession& session,
                                          const std::string& unique_name,
                                          bool managed) {
    auto path = ApiPath("ExportSolution");
    nlohmann::json body = {{"SolutionName", unique_name}, {"Managed", managed}};
    auto response = session.Post(path, body.dump());
    if (response.IsErr()) {
        return Result<std::string, Error>::Err(std::move(response).Error());
    }
    const auto& http = response.Value();
    if (http.status_code != 200) {
        auto err = odata_utils::HttpFailure("ExportSolution", path, http,
                                            ErrorCategory::Export);
        err.target = unique_name;
        return Result<std::string, Error>::Err(std::move(err));
    }

    auto doc = nlohmann::json::parse(http.body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() ||
        !doc.contains("ExportSolutionFile") || !doc["ExportSolutionFile"].is_string()) {
        return Result<std::string, Error>::Err(Error{
            "ExportSolution", unique_name, http.status_code,
            "Response has no ExportSolutionFile", std::nullopt,
            ErrorCategory::Export});
    }

    auto zip = Base64Decode(doc["ExportSolutionFile"].get<std::string>());
    if (zip.IsErr()) {
        return Result<std::string, Error>::Err(Error{
            "ExportSolution", unique_name, http.status_code,
            "Invalid ExportSolutionFile: " + zip.Error(), std::nullopt,
            ErrorCategory::Export});
    }
    LogInfo("solutions", "exported " + unique_name + (managed ? " (managed)" : " (unmanaged)"));
    return Result<std::string, Error>::Ok(std::move(zip).Value());
}

Result<void, Error> ImportSolution(IDataverseSession& session,
                                   const std::string& zip_bytes,
                                   const ImportOptions& options) {
    auto body = ImportBody("ImportSolution", zip_bytes, options);
    if (body.IsErr()) {
        return Result<void, Error>::Err(std::move(body).Error());
    }
    auto json = std::move(body).Value();
    json["HoldingSolution"] = options.holding_solution;
    return PostAction(session, "ImportSolution", "", "ImportSolution", json,
                      ErrorCategory::Import);
}

Result<void, Error> StageAndUpgrade(IDataverseSession& session,
                                    const std::string& zip_bytes,
                                    const ImportOptions& options) {
    auto body = ImportBody("StageAndUpgrade", zip_bytes, options);
    if (body.IsErr()) {
        return Result<void, Error>::Err(std::move(body).Error());
    }
    return PostAction(session, "StageAndUpgrade", "", "StageAndUpgrade", body.Value(),
                      ErrorCategory::Import);
}

Result<void, Error> DeleteAndPromote(IDataverseSession& session,
                                     const std::string& unique_name) {
    nlohmann::json body = {{"UniqueName", unique_name}};
    return PostAction(session, "DeleteAndPromote", unique_name, "DeleteAndPromote",
                      body, ErrorCategory::Import);
}

Result<void, Error> PublishAllCustomizations(IDataverseSession& session) {
    return PostAction(session, "PublishAllXml", "", "PublishAllXml",
                      nlohmann::json::object(), ErrorCategory::Import);
}

Result<void, Error> StageSolution(IDataverseSession& session,
                                  const std::string& zip_bytes,
                                  ImportMode mode) {
    switch (mode) {
        case ImportMode::None:
            return Result<void, Error>::Err(Error{
                "StageSolution", "", std::nullopt,
                "Nothing to stage for a skipped solution", std::nullopt,
                ErrorCategory::Internal});
        case ImportMode::Direct:
            return StageAndUpgrade(session, zip_bytes);
        case ImportMode::Holding: {
            ImportOptions options;
            options.holding_solution = true;
            return ImportSolution(session, zip_bytes, options);
        }
        case ImportMode::UnmanagedOverwrite: {
            ImportOptions options;
            options.overwrite_unmanaged_customizations = true;
            return ImportSolution(session, zip_bytes, options);
        }
        case ImportMode::Fresh:
        case ImportMode::InPlace:
            return ImportSolution(session, zip_bytes, ImportOptions{});
    }
    return Result<void, Error>::Err(Error{
        "StageSolution", "", std::nullopt, "Unknown import mode", std::nullopt,
        ErrorCategory::Internal});
}

} // namespace dv_alm
