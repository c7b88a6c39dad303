#pragma once

namespace dv_alm {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (for colored summary tables).
bool IsStdoutTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether to emit ANSI colors. --no-color and NO_COLOR win over
/// --color; without either flag, color follows whether the stream is a tty.
bool ResolveUseColor(bool force_color, bool force_no_color, bool is_tty);

/// CI agents (Azure Pipelines sets TF_BUILD, GitHub Actions sets CI) render
/// ANSI escapes even though the output is not a tty.
bool RunningInPipeline();

enum class PipelineKind {
    None,
    AzurePipelines,   // TF_BUILD
    GitHubActions,    // GITHUB_ACTIONS
};

/// Which CI agent, if any, is running us. Decides the log command syntax
/// used to surface warnings and errors in the run summary.
PipelineKind DetectPipeline();

} // namespace dv_alm
