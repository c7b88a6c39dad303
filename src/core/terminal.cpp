#include <dv_alm/core/terminal.hpp>

#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace dv_alm {

bool IsStderrTty() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

bool IsStdoutTty() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ResolveUseColor(bool force_color, bool force_no_color, bool is_tty) {
    if (force_no_color || NoColorEnvSet()) {
        return false;
    }
    return force_color || is_tty;
}

bool RunningInPipeline() {
    return std::getenv("TF_BUILD") != nullptr || std::getenv("CI") != nullptr;
}

PipelineKind DetectPipeline() {
    if (std::getenv("TF_BUILD") != nullptr) {
        return PipelineKind::AzurePipelines;
    }
    if (std::getenv("GITHUB_ACTIONS") != nullptr) {
        return PipelineKind::GitHubActions;
    }
    return PipelineKind::None;
}

} // namespace dv_alm
