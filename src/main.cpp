#include <dv_alm/cli/output_formatter.hpp>
#include <dv_alm/config/config_loader.hpp>
#include <dv_alm/core/log.hpp>
#include <dv_alm/core/process.hpp>
#include <dv_alm/core/terminal.hpp>
#include <dv_alm/core/version.hpp>
#include <dv_alm/dataverse/dataverse_session.hpp>
#include <dv_alm/hooks/hook_registry.hpp>
#include <dv_alm/solution/component_comparer.hpp>
#include <dv_alm/tools/git_client.hpp>
#include <dv_alm/tools/solution_packager.hpp>
#include <dv_alm/workflow/build_workflow.hpp>
#include <dv_alm/workflow/deploy_workflow.hpp>
#include <dv_alm/workflow/export_workflow.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage   = 2;

void PrintUsage(std::ostream& out) {
    out << "dv-alm " << dv_alm::kVersion << " - Dataverse solution lifecycle\n\n"
        << "Usage:\n"
        << "  dv-alm export -m <message> [-e <environment>] [--push]\n"
        << "  dv-alm build\n"
        << "  dv-alm deploy -e <environment> [--unmanaged]\n"
        << "  dv-alm import -e <environment>\n\n"
        << "Common options:\n"
        << "  -c, --config <file>   YAML config layer (repeatable, default "
        << dv_alm::kDefaultConfigFile << ")\n"
        << "  -v, -vv               Verbose / debug logging\n"
        << "  -q, --quiet           Only print errors\n"
        << "  --json                JSON output\n"
        << "  --no-color            Disable ANSI colors (also NO_COLOR)\n"
        << "  --log-file <file>     Append JSON log lines to a file\n"
        << "  --timeout <seconds>   HTTP timeout\n"
        << "  --version             Print version\n";
}

std::optional<dv_alm::Subcommand> ParseSubcommand(std::string_view arg) {
    if (arg == "export") return dv_alm::Subcommand::Export;
    if (arg == "build") return dv_alm::Subcommand::Build;
    if (arg == "deploy") return dv_alm::Subcommand::Deploy;
    if (arg == "import") return dv_alm::Subcommand::Import;
    return std::nullopt;
}

// argv without the subcommand token, so LoadFromCli sees plain flags.
std::vector<const char*> StripSubcommand(int argc, const char* const* argv) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 2; i < argc; ++i) {
        stripped.push_back(argv[i]);
    }
    return stripped;
}

void InitLogging(const dv_alm::AlmConfig& config, bool use_color) {
    using namespace dv_alm;
    auto level = LogLevelFromFlags(config.verbosity, config.quiet);
    std::unique_ptr<ILogSink> sink;
    if (RunningInPipeline()) {
        sink = std::make_unique<PipelineSink>(DetectPipeline());
    } else {
        sink = std::make_unique<ColorConsoleSink>(use_color);
    }
    if (config.log_file.has_value()) {
        auto file_sink = std::make_unique<JsonFileSink>(*config.log_file);
        if (file_sink->IsOpen()) {
            sink = std::make_unique<TeeSink>(std::move(sink), std::move(file_sink));
        } else {
            std::cerr << "Warning: cannot open log file " << *config.log_file << "\n";
        }
    }
    InitGlobalLogger(std::move(sink), level);
}

dv_alm::Result<std::unique_ptr<dv_alm::DataverseSession>, dv_alm::Error> OpenSession(
    const dv_alm::AlmConfig& config, const std::string& environment) {
    using namespace dv_alm;
    using R = Result<std::unique_ptr<DataverseSession>, Error>;

    const auto* env = config.FindEnvironment(environment);
    if (!env) {
        return R::Err(Error{"OpenSession", environment, std::nullopt,
                            "Unknown environment", std::nullopt, ErrorCategory::Config});
    }
    auto token = ResolveToken(*env);
    if (token.IsErr()) {
        return R::Err(std::move(token).Error());
    }
    DataverseSessionOptions options;
    options.read_timeout = std::chrono::seconds(config.timeout_seconds);
    LogInfo("main", "connecting to " + env->name + " (" + env->url + ")");
    return R::Ok(std::make_unique<DataverseSession>(env->url, token.Value(), options));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace dv_alm;

    if (argc < 2) {
        PrintUsage(std::cout);
        return kExitSuccess;
    }
    std::string_view first{argv[1]};
    if (first == "--version") {
        std::cout << "dv-alm " << kVersion << "\n";
        return kExitSuccess;
    }
    if (first == "--help" || first == "-h" || first == "help") {
        PrintUsage(std::cout);
        return kExitSuccess;
    }

    auto subcommand = ParseSubcommand(first);
    if (!subcommand.has_value()) {
        std::cerr << "Unknown command '" << first << "'\n\n";
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    // Step 1: CLI layer.
    auto stripped = StripSubcommand(argc, argv);
    auto cli = LoadFromCli(*subcommand, static_cast<int>(stripped.size()), stripped.data());
    if (cli.IsErr()) {
        OutputFormatter(false).PrintError(cli.Error());
        return cli.Error().ExitCode();
    }
    auto options = std::move(cli).Value();
    const bool json_cli = options.layer.json_output.value_or(false);

    // Step 2: YAML layers, then the CLI layer on top.
    std::vector<ConfigLayer> layers;
    auto files = options.config_files;
    if (files.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(kDefaultConfigFile, ec)) {
            files.push_back(kDefaultConfigFile);
        }
    }
    for (const auto& file : files) {
        auto layer = LoadLayerFromYaml(file);
        if (layer.IsErr()) {
            OutputFormatter(json_cli).PrintError(layer.Error());
            return layer.Error().ExitCode();
        }
        layers.push_back(std::move(layer).Value());
    }
    layers.push_back(options.layer);
    const auto config = MergeConfigLayers(layers);

    // Step 3: Validate before any side effect.
    auto valid = ValidateConfig(config, *subcommand);
    if (valid.IsErr()) {
        OutputFormatter(config.json_output).PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    // Step 4: Logging and output.
    const bool force_no_color = config.no_color || NoColorEnvSet() || RunningInPipeline();
    InitLogging(config, ResolveUseColor(false, force_no_color, IsStderrTty()));
    OutputFormatter formatter(config.json_output,
                              ResolveUseColor(false, force_no_color, IsStdoutTty()),
                              config.quiet);

    // Step 5: Collaborators.
    PosixProcessRunner runner;
    HookRunner hooks(runner, config.hooks);
    PacPackager packager(runner, config.packager_program);

    Result<RunResult, Error> result = Result<RunResult, Error>::Err(Error{
        "main", "", std::nullopt, "No command executed", std::nullopt,
        ErrorCategory::Internal});

    switch (*subcommand) {
        case Subcommand::Export: {
            auto session = OpenSession(config, config.export_environment);
            if (session.IsErr()) {
                formatter.PrintError(session.Error());
                return session.Error().ExitCode();
            }
            XmlComponentComparer comparer;
            GitClient git(runner, ".", config.git_program);
            ExportWorkflow workflow(*session.Value(), packager, comparer, git, hooks, config);
            result = workflow.Execute();
            break;
        }
        case Subcommand::Build: {
            BuildWorkflow workflow(packager, hooks, config);
            result = workflow.Execute();
            break;
        }
        case Subcommand::Deploy:
        case Subcommand::Import: {
            auto session = OpenSession(config, config.target_environment);
            if (session.IsErr()) {
                formatter.PrintError(session.Error());
                return session.Error().ExitCode();
            }
            DeployWorkflow deploy(*session.Value(), hooks, config);
            if (*subcommand == Subcommand::Deploy) {
                result = deploy.Execute(DeployOptions{config.unmanaged});
            } else {
                BuildWorkflow build(packager, hooks, config);
                ImportWorkflow workflow(build, deploy);
                result = workflow.Execute();
            }
            break;
        }
    }

    // Step 6: Report.
    if (result.IsErr()) {
        formatter.PrintError(result.Error());
        return result.Error().ExitCode();
    }
    const auto& run = result.Value();
    formatter.PrintRunResult(run);
    for (const auto& solution : run.solutions) {
        if (solution.error.has_value()) {
            formatter.PrintError(*solution.error);
        }
    }
    return run.ExitCode();
}
