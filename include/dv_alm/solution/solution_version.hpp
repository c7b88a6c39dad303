#pragma once

#include <dv_alm/core/result.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>

namespace dv_alm {

// ---------------------------------------------------------------------------
// SolutionVersion — Major.Minor.Build.Revision, compared lexicographically.
//
// Parse rules:
//   - exactly four dot-separated components
//   - each component is one or more ASCII digits (no sign, no whitespace)
//   - each component fits in a signed 32-bit integer
// ---------------------------------------------------------------------------
class SolutionVersion {
public:
    SolutionVersion() = default;
    SolutionVersion(int32_t major, int32_t minor, int32_t build, int32_t revision)
        : major_(major), minor_(minor), build_(build), revision_(revision) {}

    static Result<SolutionVersion, Error> Parse(std::string_view text);

    [[nodiscard]] int32_t Major() const noexcept { return major_; }
    [[nodiscard]] int32_t Minor() const noexcept { return minor_; }
    [[nodiscard]] int32_t Build() const noexcept { return build_; }
    [[nodiscard]] int32_t Revision() const noexcept { return revision_; }

    [[nodiscard]] std::string ToString() const;

    /// True when major and minor match; build/revision may differ.
    [[nodiscard]] bool SameMajorMinor(const SolutionVersion& other) const noexcept {
        return major_ == other.major_ && minor_ == other.minor_;
    }

    bool operator==(const SolutionVersion& other) const { return Tie() == other.Tie(); }
    bool operator!=(const SolutionVersion& other) const { return Tie() != other.Tie(); }
    bool operator<(const SolutionVersion& other) const { return Tie() < other.Tie(); }
    bool operator>(const SolutionVersion& other) const { return other < *this; }
    bool operator<=(const SolutionVersion& other) const { return !(other < *this); }
    bool operator>=(const SolutionVersion& other) const { return !(*this < other); }

    friend std::ostream& operator<<(std::ostream& os, const SolutionVersion& v) {
        return os << v.ToString();
    }

private:
    [[nodiscard]] std::tuple<int32_t, int32_t, int32_t, int32_t> Tie() const {
        return std::make_tuple(major_, minor_, build_, revision_);
    }

    int32_t major_ = 0;
    int32_t minor_ = 0;
    int32_t build_ = 0;
    int32_t revision_ = 0;
};

} // namespace dv_alm
