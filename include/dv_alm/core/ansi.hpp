#pragma once

#include <string>
#include <string_view>

namespace dv_alm {
namespace ansi {

// SGR sequences shared by the console log sink and the CLI formatter.
constexpr const char* kReset  = "\033[0m";
constexpr const char* kBold   = "\033[1m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kGreen  = "\033[1;32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

// `text` wrapped in `code` ... kReset, or unchanged when color is off.
inline std::string Paint(std::string_view text, const char* code, bool enabled) {
    if (!enabled) {
        return std::string(text);
    }
    std::string painted(code);
    painted.append(text);
    painted.append(kReset);
    return painted;
}

} // namespace ansi
} // namespace dv_alm
