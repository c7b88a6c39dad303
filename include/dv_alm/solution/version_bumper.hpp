#pragma once

#include <dv_alm/core/result.hpp>
#include <dv_alm/solution/component_comparer.hpp>
#include <dv_alm/solution/solution_version.hpp>

#include <optional>
#include <string>

namespace dv_alm {

// ---------------------------------------------------------------------------
// ChangeClassification — how a detected solution change affects consumers.
//
//   Additive — nothing removed or retyped; bump the revision.
//   Breaking — something removed or retyped; bump the minor, reset the rest.
// ---------------------------------------------------------------------------
enum class ChangeClassification {
    Additive,
    Breaking,
};

std::string ClassificationName(ChangeClassification classification);

// ---------------------------------------------------------------------------
// ClassifyChange — compare the previous and the freshly exported snapshot.
//
// No old snapshot means a first export: Additive. An old snapshot with no
// new one means every component disappeared: Breaking. Otherwise the
// comparer decides. Comparer failures are returned with category Compare so
// the caller can isolate them to the one solution.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ChangeClassification, Error> ClassifyChange(
    const IComponentComparer& comparer,
    const std::optional<SolutionSnapshot>& old_snapshot,
    const std::optional<SolutionSnapshot>& new_snapshot);

// ---------------------------------------------------------------------------
// NextVersion
//   Additive: {Major, Minor, max(0,Build), max(0,Revision)+1}
//   Breaking: {Major, max(0,Minor)+1, 0, 0}
//
// Err(Version) when the component to bump is already INT32_MAX.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<SolutionVersion, Error> NextVersion(
    const SolutionVersion& current, ChangeClassification classification);

} // namespace dv_alm
