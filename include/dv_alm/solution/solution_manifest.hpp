#pragma once

#include <dv_alm/core/result.hpp>
#include <dv_alm/solution/solution_version.hpp>

#include <filesystem>
#include <string>

namespace dv_alm {

// ---------------------------------------------------------------------------
// SolutionManifest — the <SolutionManifest> of an unpacked solution's
// Other/Solution.xml.
//
// `managed` is the raw <Managed> value: 0 unmanaged, 1 managed, 2 both
// (folders unpacked with --packagetype Both).
// ---------------------------------------------------------------------------
struct SolutionManifest {
    std::string unique_name;
    SolutionVersion version;
    int managed = 0;
};

/// Path of the manifest inside an unpacked solution folder.
std::filesystem::path SolutionManifestPath(const std::filesystem::path& folder);

[[nodiscard]] Result<SolutionManifest, Error> ReadSolutionManifest(
    const std::filesystem::path& folder);

/// Rewrite the <Version> element in place. The rest of the file is left
/// byte-for-byte untouched so source-control diffs stay one line.
[[nodiscard]] Result<void, Error> WriteSolutionVersion(
    const std::filesystem::path& folder,
    const SolutionVersion& version);

} // namespace dv_alm
