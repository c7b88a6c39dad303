#include <dv_alm/config/alm_config.hpp>

namespace dv_alm {

DependencySpec DependencySpec::FromString(const std::string& text) {
    if (text.empty() || text == "latest") {
        return DependencySpec{Kind::Latest, ""};
    }
    if (text == "prerelease") {
        return DependencySpec{Kind::Prerelease, ""};
    }
    return DependencySpec{Kind::Exact, text};
}

std::string DependencySpec::ToString() const {
    switch (kind) {
        case Kind::Exact:      return version;
        case Kind::Latest:     return "latest";
        case Kind::Prerelease: return "prerelease";
    }
    return "latest";
}

std::string HookPhaseKey(HookPhase phase) {
    switch (phase) {
        case HookPhase::PreExport:  return "pre_export";
        case HookPhase::PostExport: return "post_export";
        case HookPhase::PreBuild:   return "pre_build";
        case HookPhase::PostBuild:  return "post_build";
        case HookPhase::PreDeploy:  return "pre_deploy";
        case HookPhase::PreUpgrade: return "pre_upgrade";
        case HookPhase::PostDeploy: return "post_deploy";
    }
    return "";
}

const std::vector<HookPhase>& AllHookPhases() {
    static const std::vector<HookPhase> kPhases = {
        HookPhase::PreExport, HookPhase::PostExport,
        HookPhase::PreBuild,  HookPhase::PostBuild,
        HookPhase::PreDeploy, HookPhase::PreUpgrade,
        HookPhase::PostDeploy,
    };
    return kPhases;
}

std::optional<HookPhase> HookPhaseFromKey(const std::string& key) {
    for (auto phase : AllHookPhases()) {
        if (HookPhaseKey(phase) == key) {
            return phase;
        }
    }
    return std::nullopt;
}

const EnvironmentConfig* AlmConfig::FindEnvironment(const std::string& name) const {
    auto it = environments.find(name);
    return it == environments.end() ? nullptr : &it->second;
}

} // namespace dv_alm
