#include <dv_alm/solution/import_strategy.hpp>

namespace dv_alm {

ImportDecision SelectImportStrategy(const ImportStrategyInput& input) {
    if (!input.installed_version.has_value()) {
        return {ImportAction::Install, ImportMode::Fresh};
    }
    if (input.unmanaged_target) {
        return {ImportAction::Update, ImportMode::UnmanagedOverwrite};
    }

    const auto& installed = *input.installed_version;
    if (input.artifact_version == installed) {
        return {ImportAction::Skip, ImportMode::None};
    }
    if (input.artifact_version.SameMajorMinor(installed)) {
        return {ImportAction::Update, ImportMode::InPlace};
    }
    if (input.total_solutions_in_batch > 1) {
        return {ImportAction::Upgrade, ImportMode::Holding};
    }
    return {ImportAction::Upgrade, ImportMode::Direct};
}

std::string ImportActionName(ImportAction action) {
    switch (action) {
        case ImportAction::Skip:    return "skip";
        case ImportAction::Install: return "install";
        case ImportAction::Update:  return "update";
        case ImportAction::Upgrade: return "upgrade";
    }
    return "skip";
}

std::string ImportModeName(ImportMode mode) {
    switch (mode) {
        case ImportMode::None:               return "none";
        case ImportMode::Fresh:              return "fresh";
        case ImportMode::UnmanagedOverwrite: return "unmanaged-overwrite";
        case ImportMode::InPlace:            return "in-place";
        case ImportMode::Holding:            return "holding";
        case ImportMode::Direct:             return "direct";
    }
    return "none";
}

} // namespace dv_alm
