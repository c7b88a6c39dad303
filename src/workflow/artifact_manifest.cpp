#include <dv_alm/workflow/artifact_manifest.hpp>

#include <nlohmann/json.hpp>

#include <fstream>

namespace dv_alm {

namespace {

Error ManifestError(const std::filesystem::path& path, const std::string& message) {
    return Error{"ArtifactManifest", path.string(), std::nullopt, message,
                 std::nullopt, ErrorCategory::Config};
}

std::string StringField(const nlohmann::json& item, const char* key) {
    auto it = item.find(key);
    return it != item.end() && it->is_string() ? it->get<std::string>() : "";
}

} // anonymous namespace

Result<void, Error> WriteArtifactManifest(const std::filesystem::path& artifacts_dir,
                                          const std::vector<ArtifactEntry>& entries) {
    auto path = artifacts_dir / kArtifactManifestFile;

    nlohmann::json doc = nlohmann::json::array();
    for (const auto& entry : entries) {
        doc.push_back({
            {"name", entry.name},
            {"version", entry.version},
            {"managed_file", entry.managed_file},
            {"unmanaged_file", entry.unmanaged_file},
        });
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Result<void, Error>::Err(ManifestError(path, "Cannot open file for writing"));
    }
    out << doc.dump(2) << "\n";
    if (!out) {
        return Result<void, Error>::Err(ManifestError(path, "Write failed"));
    }
    return Result<void, Error>::Ok();
}

Result<std::vector<ArtifactEntry>, Error> ReadArtifactManifest(
    const std::filesystem::path& artifacts_dir) {
    using R = Result<std::vector<ArtifactEntry>, Error>;
    auto path = artifacts_dir / kArtifactManifestFile;

    std::ifstream in(path);
    if (!in) {
        return R::Err(ManifestError(path, "Cannot read artifact manifest; run build first"));
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        return R::Err(ManifestError(path, std::string("Invalid JSON: ") + e.what()));
    }
    if (!doc.is_array()) {
        return R::Err(ManifestError(path, "Expected a JSON array"));
    }

    std::vector<ArtifactEntry> entries;
    for (const auto& item : doc) {
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) {
            return R::Err(ManifestError(path, "Entry without a name"));
        }
        ArtifactEntry entry;
        entry.name = item["name"].get<std::string>();
        entry.version = StringField(item, "version");
        entry.managed_file = StringField(item, "managed_file");
        entry.unmanaged_file = StringField(item, "unmanaged_file");
        entries.push_back(std::move(entry));
    }
    return R::Ok(std::move(entries));
}

std::optional<ArtifactEntry> FindArtifact(const std::vector<ArtifactEntry>& entries,
                                          const std::string& name) {
    for (const auto& entry : entries) {
        if (entry.name == name) {
            return entry;
        }
    }
    return std::nullopt;
}

} // namespace dv_alm
