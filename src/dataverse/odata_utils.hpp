#pragma once

#include <dv_alm/core/result.hpp>
#include <dv_alm/dataverse/i_dataverse_session.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace dv_alm::odata_utils {

inline bool IsSuccess(int status_code) {
    return status_code >= 200 && status_code < 300;
}

// Error for a non-2xx response. Transport-level categories (authentication,
// timeout, unavailable) are kept; everything else is attributed to the
// calling operation's category.
inline Error HttpFailure(const std::string& operation, const std::string& path,
                         const HttpResponse& http, ErrorCategory category) {
    auto err = Error::FromHttpStatus(operation, path, http.status_code, http.body);
    if (err.category == ErrorCategory::Internal ||
        err.category == ErrorCategory::NotFound) {
        err.category = category;
    }
    return err;
}

// Typed field readers. A missing, null or differently typed field yields
// the fallback.
inline std::string StringField(const nlohmann::json& row, const char* key,
                               const std::string& fallback = "") {
    auto it = row.find(key);
    return it != row.end() && it->is_string() ? it->get<std::string>() : fallback;
}

inline int IntField(const nlohmann::json& row, const char* key, int fallback) {
    auto it = row.find(key);
    return it != row.end() && it->is_number_integer() ? it->get<int>() : fallback;
}

inline bool BoolField(const nlohmann::json& row, const char* key, bool fallback) {
    auto it = row.find(key);
    return it != row.end() && it->is_boolean() ? it->get<bool>() : fallback;
}

// The "value" array of an OData collection response.
inline Result<std::vector<nlohmann::json>, Error> ParseValueArray(
    const std::string& operation, const std::string& path, const std::string& body) {
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() ||
        !doc.contains("value") || !doc["value"].is_array()) {
        return Result<std::vector<nlohmann::json>, Error>::Err(Error{
            operation, path, std::nullopt,
            "Response is not an OData collection", std::nullopt,
            ErrorCategory::Internal});
    }
    std::vector<nlohmann::json> rows;
    for (const auto& row : doc["value"]) {
        if (row.is_object()) {
            rows.push_back(row);
        }
    }
    return Result<std::vector<nlohmann::json>, Error>::Ok(std::move(rows));
}

} // namespace dv_alm::odata_utils
