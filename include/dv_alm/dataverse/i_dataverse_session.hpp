#pragma once

#include <dv_alm/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace dv_alm {

// ---------------------------------------------------------------------------
// HttpHeaders — header name to value. Callers normalise case as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse — the result of an HTTP request.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

/// Root of the Dataverse Web API. Operation modules build paths under it.
inline constexpr const char* kWebApiRoot = "/api/data/v9.2/";

// ---------------------------------------------------------------------------
// IDataverseSession — abstract HTTP session against one environment's Web API.
//
// The solution and process operation modules depend on this interface
// rather than a concrete HTTP client, so they can be tested offline with
// MockDataverseSession. Bodies are JSON. A non-2xx status is an Ok result
// the caller inspects; Err means the request never got a response.
// ---------------------------------------------------------------------------
class IDataverseSession {
public:
    virtual ~IDataverseSession() = default;

    IDataverseSession(const IDataverseSession&) = delete;
    IDataverseSession& operator=(const IDataverseSession&) = delete;
    IDataverseSession(IDataverseSession&&) = delete;
    IDataverseSession& operator=(IDataverseSession&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Patch(
        std::string_view path,
        std::string_view body,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Delete(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

protected:
    IDataverseSession() = default;
};

} // namespace dv_alm
