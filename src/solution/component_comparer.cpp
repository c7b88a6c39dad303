#include <dv_alm/solution/component_comparer.hpp>
#include <dv_alm/solution/solution_manifest.hpp>
#include "xml_utils.hpp"

#include <dv_alm/core/log.hpp>

#include <string_view>
#include <system_error>
#include <vector>

namespace dv_alm {

namespace {

constexpr const char* kOperation = "CompareComponents";

using xml_utils::Attr;
using xml_utils::ChildText;
using xml_utils::Lower;

// Root components carry either a schemaName (entities, option sets, web
// resources) or an id (forms, processes, roles).
void CollectRootComponents(const tinyxml2::XMLElement* manifest, ComponentSet& set) {
    const auto* roots = manifest ? manifest->FirstChildElement("RootComponents") : nullptr;
    if (!roots) return;
    for (const auto* rc = roots->FirstChildElement("RootComponent"); rc;
         rc = rc->NextSiblingElement("RootComponent")) {
        auto type = Attr(rc, "type");
        auto name = Attr(rc, "schemaName");
        if (name.empty()) name = Attr(rc, "id");
        if (type.empty() || name.empty()) continue;
        set.keys.insert("root:" + type + ":" + Lower(name));
    }
}

void CollectEntity(const tinyxml2::XMLElement* entity, ComponentSet& set) {
    auto entity_name = Lower(Attr(entity, "Name"));
    if (entity_name.empty()) return;
    const auto* attributes = entity->FirstChildElement("attributes");
    if (!attributes) return;
    for (const auto* attr = attributes->FirstChildElement("attribute"); attr;
         attr = attr->NextSiblingElement("attribute")) {
        auto physical = Lower(Attr(attr, "PhysicalName"));
        if (physical.empty()) continue;
        auto key = entity_name + "." + physical;
        set.keys.insert("attribute:" + key);
        set.attribute_types[key] = Lower(ChildText(attr, "Type"));
    }
}

void CollectOptionSet(const tinyxml2::XMLElement* optionset, ComponentSet& set) {
    auto name = Lower(Attr(optionset, "Name"));
    if (name.empty()) return;
    set.keys.insert("optionset:" + name);
    const auto* options = optionset->FirstChildElement("options");
    if (!options) return;
    for (const auto* opt = options->FirstChildElement("option"); opt;
         opt = opt->NextSiblingElement("option")) {
        auto value = Attr(opt, "value");
        if (!value.empty()) {
            set.keys.insert("option:" + name + "=" + value);
        }
    }
}

// Walk every element once. The same component kinds appear in both the
// single-file Customizations.xml layout and the split layout produced by
// pac solution unpack (Entities/*/Entity.xml, FormXml, OptionSets, Workflows).
void CollectElement(const tinyxml2::XMLElement* element, ComponentSet& set) {
    for (const auto* e = element; e; e = e->NextSiblingElement()) {
        std::string_view tag = e->Name();
        if (tag == "entity") {
            CollectEntity(e, set);
        } else if (tag == "optionset") {
            CollectOptionSet(e, set);
        } else if (tag == "systemform") {
            auto id = Lower(ChildText(e, "formid"));
            if (!id.empty()) set.keys.insert("form:" + id);
        } else if (tag == "Workflow") {
            auto id = Lower(Attr(e, "WorkflowId"));
            if (!id.empty()) set.keys.insert("process:" + id);
        }
        if (const auto* child = e->FirstChildElement()) {
            CollectElement(child, set);
        }
    }
}

bool IsXmlFile(const std::filesystem::path& path) {
    return Lower(path.extension().string()) == ".xml";
}

} // anonymous namespace

Result<ComponentSet, Error> XmlComponentComparer::LoadComponents(
    const SolutionSnapshot& snapshot) {
    ComponentSet set;
    auto manifest_path = SolutionManifestPath(snapshot.folder);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(manifest_path, ec)) {
        return Result<ComponentSet, Error>::Err(Error{
            kOperation, manifest_path.string(), std::nullopt,
            "Snapshot has no Other/Solution.xml", std::nullopt,
            ErrorCategory::Compare});
    }

    std::vector<std::filesystem::path> files;
    for (auto it = std::filesystem::recursive_directory_iterator(snapshot.folder, ec);
         !ec && it != std::filesystem::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->is_regular_file(ec) && IsXmlFile(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return Result<ComponentSet, Error>::Err(Error{
            kOperation, snapshot.folder.string(), std::nullopt,
            "Cannot scan snapshot folder: " + ec.message(), std::nullopt,
            ErrorCategory::Compare});
    }

    for (const auto& file : files) {
        tinyxml2::XMLDocument doc;
        auto loaded = xml_utils::LoadXmlFile(doc, file, kOperation,
                                             ErrorCategory::Compare);
        if (loaded.IsErr()) {
            return Result<ComponentSet, Error>::Err(std::move(loaded).Error());
        }
        if (file == manifest_path) {
            const auto* root = doc.FirstChildElement("ImportExportXml");
            CollectRootComponents(
                root ? root->FirstChildElement("SolutionManifest") : nullptr, set);
            continue;
        }
        CollectElement(doc.FirstChildElement(), set);
    }

    LogDebug("compare", snapshot.folder.string() + ": " +
             std::to_string(set.keys.size()) + " components");
    return Result<ComponentSet, Error>::Ok(std::move(set));
}

Result<bool, Error> XmlComponentComparer::IsAdditiveSuperset(
    const SolutionSnapshot& old_snapshot,
    const SolutionSnapshot& new_snapshot) const {
    auto old_set = LoadComponents(old_snapshot);
    if (old_set.IsErr()) {
        return Result<bool, Error>::Err(std::move(old_set).Error());
    }
    auto new_set = LoadComponents(new_snapshot);
    if (new_set.IsErr()) {
        return Result<bool, Error>::Err(std::move(new_set).Error());
    }

    const auto& before = old_set.Value();
    const auto& after = new_set.Value();

    for (const auto& key : before.keys) {
        if (after.keys.count(key) == 0) {
            LogInfo("compare", "breaking: removed " + key);
            return Result<bool, Error>::Ok(false);
        }
    }

    for (const auto& [attribute, type] : before.attribute_types) {
        auto it = after.attribute_types.find(attribute);
        if (it != after.attribute_types.end() && it->second != type) {
            LogInfo("compare", "breaking: " + attribute + " changed type " +
                    type + " -> " + it->second);
            return Result<bool, Error>::Ok(false);
        }
    }

    return Result<bool, Error>::Ok(true);
}

} // namespace dv_alm
