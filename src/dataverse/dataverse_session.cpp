#include <dv_alm/dataverse/dataverse_session.hpp>
#include <dv_alm/core/log.hpp>
#include <dv_alm/core/url.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace dv_alm {

namespace {

constexpr const char* kJsonContentType = "application/json; charset=utf-8";

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

bool IsSensitiveHeader(std::string key) {
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key == "authorization" || key == "cookie" || key == "set-cookie";
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("http", "  > " + k + ": <redacted>");
        } else {
            LogDebug("http", "  > " + k + ": " + v);
        }
    }
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — pimpl body holding the httplib::Client and the token.
// ---------------------------------------------------------------------------
struct DataverseSession::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string bearer_token;

    Impl(const std::string& base_url, const std::string& token,
         const DataverseSessionOptions& opts)
        : client(std::make_unique<httplib::Client>(TrimTrailingSlash(base_url))),
          bearer_token(token) {
        client->set_connection_timeout(opts.connect_timeout);
        client->set_read_timeout(opts.read_timeout);
        client->set_write_timeout(opts.read_timeout);
    }

    httplib::Headers BuildHeaders(const HttpHeaders& extra) const {
        httplib::Headers hdrs;
        hdrs.emplace("Authorization", "Bearer " + bearer_token);
        hdrs.emplace("Accept", "application/json");
        hdrs.emplace("OData-Version", "4.0");
        hdrs.emplace("OData-MaxVersion", "4.0");
        for (const auto& [key, value] : extra) {
            hdrs.emplace(key, value);
        }
        return hdrs;
    }

    // Log, send, and convert one request. `send` performs the httplib call.
    template <typename Send>
    Result<HttpResponse, Error> Execute(const char* verb, std::string_view path,
                                        const HttpHeaders& extra, Send&& send) {
        auto hdrs = BuildHeaders(extra);
        LogInfo("http", std::string(verb) + " " + std::string(path));
        LogRequestHeaders(hdrs);
        auto res = send(std::string(path), hdrs);
        if (!res) {
            const auto http_error = res.error();
            return Result<HttpResponse, Error>::Err(Error{
                verb, std::string(path), std::nullopt,
                "HTTP request failed: " + httplib::to_string(http_error),
                std::nullopt, CategoryFromHttpTransportError(http_error)});
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }
};

DataverseSession::DataverseSession(const std::string& base_url,
                                   const std::string& bearer_token,
                                   const DataverseSessionOptions& options)
    : impl_(std::make_unique<Impl>(base_url, bearer_token, options)) {}

DataverseSession::~DataverseSession() = default;

Result<HttpResponse, Error> DataverseSession::Get(std::string_view path,
                                                  const HttpHeaders& headers) {
    return impl_->Execute("Get", path, headers,
        [this](const std::string& p, const httplib::Headers& h) {
            return impl_->client->Get(p, h);
        });
}

Result<HttpResponse, Error> DataverseSession::Post(std::string_view path,
                                                   std::string_view body,
                                                   const HttpHeaders& headers) {
    return impl_->Execute("Post", path, headers,
        [this, body](const std::string& p, const httplib::Headers& h) {
            return impl_->client->Post(p, h, std::string(body), kJsonContentType);
        });
}

Result<HttpResponse, Error> DataverseSession::Patch(std::string_view path,
                                                    std::string_view body,
                                                    const HttpHeaders& headers) {
    return impl_->Execute("Patch", path, headers,
        [this, body](const std::string& p, const httplib::Headers& h) {
            return impl_->client->Patch(p, h, std::string(body), kJsonContentType);
        });
}

Result<HttpResponse, Error> DataverseSession::Delete(std::string_view path,
                                                     const HttpHeaders& headers) {
    return impl_->Execute("Delete", path, headers,
        [this](const std::string& p, const httplib::Headers& h) {
            return impl_->client->Delete(p, h);
        });
}

} // namespace dv_alm
