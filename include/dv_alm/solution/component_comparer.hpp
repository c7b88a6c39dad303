#pragma once

#include <dv_alm/core/result.hpp>

#include <filesystem>
#include <map>
#include <set>
#include <string>

namespace dv_alm {

// ---------------------------------------------------------------------------
// SolutionSnapshot — an unpacked solution folder (pac solution unpack
// output). Holds Other/Solution.xml and Other/Customizations.xml.
// ---------------------------------------------------------------------------
struct SolutionSnapshot {
    std::filesystem::path folder;
};

// ---------------------------------------------------------------------------
// ComponentSet — the comparable content of one snapshot.
//
// `keys` identifies every component ("root:1:account", "attribute:account.name",
// "form:{guid}", "optionset:new_color", "option:new_color=100000000",
// "process:{guid}"). `attribute_types` maps "entity.attribute" to the
// attribute's Type so retyping can be detected.
// ---------------------------------------------------------------------------
struct ComponentSet {
    std::set<std::string> keys;
    std::map<std::string, std::string> attribute_types;
};

// ---------------------------------------------------------------------------
// IComponentComparer — the "is old a compatible subset of new" oracle.
// ---------------------------------------------------------------------------
class IComponentComparer {
public:
    virtual ~IComponentComparer() = default;

    /// True when every component of `old_snapshot` is still present in
    /// `new_snapshot` with a compatible definition.
    [[nodiscard]] virtual Result<bool, Error> IsAdditiveSuperset(
        const SolutionSnapshot& old_snapshot,
        const SolutionSnapshot& new_snapshot) const = 0;
};

// ---------------------------------------------------------------------------
// XmlComponentComparer — reads both snapshots with tinyxml2.
//
// Breaking when a component key of the old snapshot is missing from the new
// one, or when an attribute kept its name but changed Type.
// ---------------------------------------------------------------------------
class XmlComponentComparer : public IComponentComparer {
public:
    [[nodiscard]] Result<bool, Error> IsAdditiveSuperset(
        const SolutionSnapshot& old_snapshot,
        const SolutionSnapshot& new_snapshot) const override;

    /// Collect the component set of one snapshot. Err when Solution.xml is
    /// missing or any present XML file fails to parse.
    [[nodiscard]] static Result<ComponentSet, Error> LoadComponents(
        const SolutionSnapshot& snapshot);
};

} // namespace dv_alm
