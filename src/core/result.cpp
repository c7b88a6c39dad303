#include <dv_alm/core/result.hpp>

#include <nlohmann/json.hpp>

namespace dv_alm {

namespace {

// Dataverse reports failures as an OData error document:
//   {"error":{"code":"0x80040217","message":"..."}}
// Some gateway failures return plain text or HTML instead, which yields
// no platform error.
std::optional<std::string> ExtractODataError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    auto it = doc.find("error");
    if (it == doc.end() || !it->is_object()) return std::nullopt;

    auto msg = it->find("message");
    if (msg == it->end() || !msg->is_string()) return std::nullopt;

    auto text = msg->get<std::string>();
    if (text.empty()) return std::nullopt;
    return text;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& target,
                            int status_code,
                            const std::string& response_body) {
    auto platform_error = ExtractODataError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Internal;
            message = platform_error.has_value()
                ? "Bad request: " + *platform_error
                : "Bad request";
            break;
        case 401:
            category = ErrorCategory::Authentication;
            message = "Authentication failed - check the bearer token in token_env";
            break;
        case 403:
            category = ErrorCategory::Authentication;
            message = platform_error.has_value()
                ? "Forbidden: " + *platform_error
                : "Forbidden - the caller lacks privileges in this environment";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 412:
            category = ErrorCategory::Internal;
            message = "Precondition failed - record changed concurrently";
            break;
        case 429:
            category = ErrorCategory::Timeout;
            message = "Service protection limit reached - retry later";
            break;
        case 500:
            category = ErrorCategory::Internal;
            message = platform_error.has_value()
                ? "Dataverse server error: " + *platform_error
                : "Dataverse server internal error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "Dataverse environment unavailable";
            break;
        default:
            category = ErrorCategory::Internal;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, target, status_code, message, platform_error, category};
}

std::string Error::ToJson() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!target.empty()) {
        body["target"] = target;
    }
    if (http_status.has_value()) {
        body["http_status"] = *http_status;
    }
    body["message"] = message;
    if (platform_error.has_value() && !platform_error->empty()) {
        body["platform_error"] = *platform_error;
    }
    body["exit_code"] = ExitCode();
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace dv_alm
