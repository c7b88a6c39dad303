#include <dv_alm/solution/version_bumper.hpp>

#include <algorithm>
#include <limits>

namespace dv_alm {

std::string ClassificationName(ChangeClassification classification) {
    switch (classification) {
        case ChangeClassification::Additive: return "additive";
        case ChangeClassification::Breaking: return "breaking";
    }
    return "breaking";
}

Result<ChangeClassification, Error> ClassifyChange(
    const IComponentComparer& comparer,
    const std::optional<SolutionSnapshot>& old_snapshot,
    const std::optional<SolutionSnapshot>& new_snapshot) {
    if (!old_snapshot.has_value()) {
        return Result<ChangeClassification, Error>::Ok(ChangeClassification::Additive);
    }
    if (!new_snapshot.has_value()) {
        return Result<ChangeClassification, Error>::Ok(ChangeClassification::Breaking);
    }

    auto additive = comparer.IsAdditiveSuperset(*old_snapshot, *new_snapshot);
    if (additive.IsErr()) {
        return Result<ChangeClassification, Error>::Err(
            std::move(additive).Error().WithCategory(ErrorCategory::Compare));
    }

    return Result<ChangeClassification, Error>::Ok(
        additive.Value() ? ChangeClassification::Additive
                         : ChangeClassification::Breaking);
}

Result<SolutionVersion, Error> NextVersion(const SolutionVersion& current,
                                           ChangeClassification classification) {
    constexpr int32_t kMax = std::numeric_limits<int32_t>::max();
    const bool additive = classification == ChangeClassification::Additive;
    const int32_t bumped = additive ? current.Revision() : current.Minor();
    if (bumped >= kMax) {
        return Result<SolutionVersion, Error>::Err(Error{
            "NextVersion", current.ToString(), std::nullopt,
            std::string(additive ? "Revision" : "Minor") +
                " is at its maximum and cannot be bumped",
            std::nullopt, ErrorCategory::Version});
    }
    if (additive) {
        return Result<SolutionVersion, Error>::Ok(SolutionVersion(
            current.Major(), current.Minor(), std::max(0, current.Build()),
            std::max(0, current.Revision()) + 1));
    }
    return Result<SolutionVersion, Error>::Ok(
        SolutionVersion(current.Major(), std::max(0, current.Minor()) + 1, 0, 0));
}

} // namespace dv_alm
