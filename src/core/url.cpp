#include <dv_alm/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace dv_alm {

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string ODataStringLiteral(const std::string& value) {
    std::string literal = "'";
    for (char c : value) {
        if (c == '\'') {
            literal += "''";
        } else {
            literal += c;
        }
    }
    literal += '\'';
    return literal;
}

std::string TrimTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace dv_alm
