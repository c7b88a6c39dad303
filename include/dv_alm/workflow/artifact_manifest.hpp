#pragma once

#include <dv_alm/core/result.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dv_alm {

// ---------------------------------------------------------------------------
// ArtifactEntry — one packed solution in the artifacts folder.
// File names are relative to the folder holding solutions.json.
// ---------------------------------------------------------------------------
struct ArtifactEntry {
    std::string name;
    std::string version;
    std::string managed_file;
    std::string unmanaged_file;
};

inline constexpr const char* kArtifactManifestFile = "solutions.json";

[[nodiscard]] Result<void, Error> WriteArtifactManifest(
    const std::filesystem::path& artifacts_dir,
    const std::vector<ArtifactEntry>& entries);

[[nodiscard]] Result<std::vector<ArtifactEntry>, Error> ReadArtifactManifest(
    const std::filesystem::path& artifacts_dir);

std::optional<ArtifactEntry> FindArtifact(const std::vector<ArtifactEntry>& entries,
                                          const std::string& name);

} // namespace dv_alm
