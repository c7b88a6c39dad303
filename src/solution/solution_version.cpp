#include <dv_alm/solution/solution_version.hpp>

#include <array>
#include <limits>

namespace dv_alm {

namespace {

Error MakeVersionError(std::string_view text, const std::string& message) {
    return Error{"ParseVersion", std::string(text), std::nullopt, message,
                 std::nullopt, ErrorCategory::Version};
}

} // anonymous namespace

Result<SolutionVersion, Error> SolutionVersion::Parse(std::string_view text) {
    if (text.empty()) {
        return Result<SolutionVersion, Error>::Err(
            MakeVersionError(text, "Version must not be empty"));
    }

    std::array<int32_t, 4> parts{};
    size_t part = 0;
    int64_t value = 0;
    size_t digits = 0;

    for (size_t i = 0; i <= text.size(); ++i) {
        if (i == text.size() || text[i] == '.') {
            if (digits == 0) {
                return Result<SolutionVersion, Error>::Err(MakeVersionError(
                    text, "Version component " + std::to_string(part + 1) +
                          " is empty"));
            }
            if (part >= parts.size()) {
                return Result<SolutionVersion, Error>::Err(MakeVersionError(
                    text, "Version must have exactly 4 components"));
            }
            parts[part++] = static_cast<int32_t>(value);
            value = 0;
            digits = 0;
            continue;
        }

        char c = text[i];
        if (c < '0' || c > '9') {
            return Result<SolutionVersion, Error>::Err(MakeVersionError(
                text, std::string("Invalid character '") + c +
                      "' in version (expected digits and '.')"));
        }
        value = value * 10 + (c - '0');
        ++digits;
        if (value > std::numeric_limits<int32_t>::max()) {
            return Result<SolutionVersion, Error>::Err(MakeVersionError(
                text, "Version component " + std::to_string(part + 1) +
                      " exceeds 2147483647"));
        }
    }

    if (part != parts.size()) {
        return Result<SolutionVersion, Error>::Err(MakeVersionError(
            text, "Version must have exactly 4 components, got " +
                  std::to_string(part)));
    }

    return Result<SolutionVersion, Error>::Ok(
        SolutionVersion(parts[0], parts[1], parts[2], parts[3]));
}

std::string SolutionVersion::ToString() const {
    return std::to_string(major_) + "." + std::to_string(minor_) + "." +
           std::to_string(build_) + "." + std::to_string(revision_);
}

} // namespace dv_alm
