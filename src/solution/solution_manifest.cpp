#include <dv_alm/solution/solution_manifest.hpp>
#include "xml_utils.hpp"

#include <fstream>
#include <string_view>

namespace dv_alm {

namespace {

constexpr const char* kReadOp = "ReadSolutionManifest";
constexpr const char* kWriteOp = "WriteSolutionVersion";

Error ManifestError(const char* operation, const std::filesystem::path& path,
                    const std::string& message) {
    return Error{operation, path.string(), std::nullopt, message,
                 std::nullopt, ErrorCategory::Config};
}

const tinyxml2::XMLElement* FindManifestElement(const tinyxml2::XMLDocument& doc) {
    const auto* root = doc.FirstChildElement("ImportExportXml");
    if (!root) return nullptr;
    return root->FirstChildElement("SolutionManifest");
}

} // anonymous namespace

std::filesystem::path SolutionManifestPath(const std::filesystem::path& folder) {
    return folder / "Other" / "Solution.xml";
}

Result<SolutionManifest, Error> ReadSolutionManifest(
    const std::filesystem::path& folder) {
    auto path = SolutionManifestPath(folder);

    tinyxml2::XMLDocument doc;
    auto loaded = xml_utils::LoadXmlFile(doc, path, kReadOp, ErrorCategory::Config);
    if (loaded.IsErr()) {
        return Result<SolutionManifest, Error>::Err(std::move(loaded).Error());
    }

    const auto* manifest = FindManifestElement(doc);
    if (!manifest) {
        return Result<SolutionManifest, Error>::Err(ManifestError(
            kReadOp, path, "Missing ImportExportXml/SolutionManifest element"));
    }

    SolutionManifest result;
    result.unique_name = xml_utils::ChildText(manifest, "UniqueName");
    if (result.unique_name.empty()) {
        return Result<SolutionManifest, Error>::Err(
            ManifestError(kReadOp, path, "Missing <UniqueName>"));
    }

    auto version_text = xml_utils::ChildText(manifest, "Version");
    auto version = SolutionVersion::Parse(version_text);
    if (version.IsErr()) {
        auto err = std::move(version).Error();
        err.target = path.string();
        return Result<SolutionManifest, Error>::Err(std::move(err));
    }
    result.version = version.Value();

    auto managed_text = xml_utils::ChildText(manifest, "Managed");
    if (managed_text == "1") {
        result.managed = 1;
    } else if (managed_text == "2") {
        result.managed = 2;
    }

    return Result<SolutionManifest, Error>::Ok(std::move(result));
}

Result<void, Error> WriteSolutionVersion(const std::filesystem::path& folder,
                                         const SolutionVersion& version) {
    auto path = SolutionManifestPath(folder);

    // Parse first so a malformed manifest is reported, not patched.
    auto current = ReadSolutionManifest(folder);
    if (current.IsErr()) {
        return Result<void, Error>::Err(std::move(current).Error());
    }

    auto content = xml_utils::ReadFile(path);
    if (!content.has_value()) {
        return Result<void, Error>::Err(
            ManifestError(kWriteOp, path, "Cannot read file"));
    }

    constexpr std::string_view kOpen = "<Version>";
    constexpr std::string_view kClose = "</Version>";
    auto manifest_pos = content->find("<SolutionManifest");
    auto open = manifest_pos == std::string::npos
        ? std::string::npos
        : content->find(kOpen, manifest_pos);
    auto close = open == std::string::npos
        ? std::string::npos
        : content->find(kClose, open);
    if (close == std::string::npos) {
        return Result<void, Error>::Err(ManifestError(
            kWriteOp, path, "Cannot locate <Version> in SolutionManifest"));
    }
    auto value_start = open + kOpen.size();
    content->replace(value_start, close - value_start, version.ToString());

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void, Error>::Err(
            ManifestError(kWriteOp, path, "Cannot open file for writing"));
    }
    out << *content;
    if (!out) {
        return Result<void, Error>::Err(
            ManifestError(kWriteOp, path, "Write failed"));
    }
    return Result<void, Error>::Ok();
}

} // namespace dv_alm
