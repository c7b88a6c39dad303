#pragma once

#include <dv_alm/dataverse/i_dataverse_session.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace dv_alm {

// ---------------------------------------------------------------------------
// DataverseSessionOptions — transport settings.
//
// Solution import and export run synchronously on the server and can take
// many minutes, so the read timeout is long.
// ---------------------------------------------------------------------------
struct DataverseSessionOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{600};
};

// ---------------------------------------------------------------------------
// DataverseSession — IDataverseSession on cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header. Every request carries
// the bearer token and the OData headers (OData-Version 4.0, JSON accept).
// The Authorization header is redacted in debug logs.
// ---------------------------------------------------------------------------
class DataverseSession : public IDataverseSession {
public:
    /// `base_url` is the environment URL, e.g. https://org.crm.dynamics.com.
    DataverseSession(const std::string& base_url,
                     const std::string& bearer_token,
                     const DataverseSessionOptions& options = {});

    ~DataverseSession() override;

    DataverseSession(const DataverseSession&) = delete;
    DataverseSession& operator=(const DataverseSession&) = delete;
    DataverseSession(DataverseSession&&) = delete;
    DataverseSession& operator=(DataverseSession&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Patch(
        std::string_view path,
        std::string_view body,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Delete(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dv_alm
