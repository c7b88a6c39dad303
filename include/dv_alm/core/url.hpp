#pragma once

#include <string>

namespace dv_alm {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// OData string literal: wrapped in single quotes, embedded quotes doubled.
// The result is not yet percent-encoded.
std::string ODataStringLiteral(const std::string& value);

// Strip a trailing '/' so "https://org.crm.dynamics.com/" and
// "https://org.crm.dynamics.com" name the same host.
std::string TrimTrailingSlash(std::string url);

} // namespace dv_alm
