#include <dv_alm/solution/deploy_state.hpp>

namespace dv_alm {

std::string DeployStateName(DeployState state) {
    switch (state) {
        case DeployState::NotStaged:          return "not-staged";
        case DeployState::Staged:             return "staged";
        case DeployState::Upgraded:           return "upgraded";
        case DeployState::ProcessesActivated: return "processes-activated";
        case DeployState::Published:          return "published";
    }
    return "not-staged";
}

Result<void, Error> SolutionDeployment::Advance(DeployState next) {
    if (static_cast<int>(next) != static_cast<int>(state_) + 1) {
        return Result<void, Error>::Err(Error{
            "DeployTransition", solution_name_, std::nullopt,
            "Illegal transition " + DeployStateName(state_) + " -> " +
                DeployStateName(next),
            std::nullopt, ErrorCategory::Internal});
    }
    state_ = next;
    return Result<void, Error>::Ok();
}

} // namespace dv_alm
