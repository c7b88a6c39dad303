#include <dv_alm/config/config_loader.hpp>

#include <dv_alm/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>

namespace dv_alm {

namespace {

Error MakeConfigError(const std::string& target, const std::string& message) {
    return Error{"ConfigLoader", target, std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

Result<SolutionConfig, Error> ParseYamlSolution(const YAML::Node& node,
                                                const std::string& origin) {
    SolutionConfig solution;
    if (node.IsScalar()) {
        solution.name = node.as<std::string>();
        return Result<SolutionConfig, Error>::Ok(std::move(solution));
    }
    if (!node["name"]) {
        return Result<SolutionConfig, Error>::Err(
            MakeConfigError(origin, "Solution entry missing 'name' field"));
    }
    solution.name = node["name"].as<std::string>();
    if (node["deploy_unmanaged"]) {
        solution.deploy_unmanaged = node["deploy_unmanaged"].as<bool>();
    }
    if (node["service_account_key"]) {
        solution.service_account_key = node["service_account_key"].as<std::string>();
    }
    return Result<SolutionConfig, Error>::Ok(std::move(solution));
}

EnvironmentConfig ParseYamlEnvironment(const std::string& name, const YAML::Node& node) {
    EnvironmentConfig env;
    env.name = name;
    if (node["url"]) {
        env.url = node["url"].as<std::string>();
    }
    if (node["token_env"]) {
        env.token_env = node["token_env"].as<std::string>();
    }
    if (node["variables"]) {
        for (const auto& kv : node["variables"]) {
            env.variables[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    return env;
}

Result<ConfigLayer, Error> ParseLayer(const YAML::Node& root, const std::string& origin) {
    ConfigLayer layer;
    layer.origin = origin;

    // -- Solutions --
    if (root["solutions"]) {
        std::vector<SolutionConfig> solutions;
        for (const auto& node : root["solutions"]) {
            auto solution = ParseYamlSolution(node, origin);
            if (solution.IsErr()) {
                return Result<ConfigLayer, Error>::Err(std::move(solution).Error());
            }
            solutions.push_back(std::move(solution).Value());
        }
        layer.solutions = std::move(solutions);
    }

    // -- Dependencies --
    if (root["dependencies"]) {
        for (const auto& kv : root["dependencies"]) {
            auto text = kv.second.IsNull() ? std::string() : kv.second.as<std::string>();
            layer.dependencies[kv.first.as<std::string>()] = DependencySpec::FromString(text);
        }
    }

    // -- Hooks --
    if (root["hooks"]) {
        for (const auto& kv : root["hooks"]) {
            auto key = kv.first.as<std::string>();
            auto phase = HookPhaseFromKey(key);
            if (!phase.has_value()) {
                return Result<ConfigLayer, Error>::Err(
                    MakeConfigError(origin, "Unknown hook phase '" + key + "'"));
            }
            auto& scripts = layer.hooks[*phase];
            for (const auto& script : kv.second) {
                scripts.push_back(script.as<std::string>());
            }
        }
    }

    // -- Environments --
    if (root["environments"]) {
        for (const auto& kv : root["environments"]) {
            auto name = kv.first.as<std::string>();
            layer.environments[name] = ParseYamlEnvironment(name, kv.second);
        }
    }
    if (root["export_environment"]) {
        layer.export_environment = root["export_environment"].as<std::string>();
    }
    if (root["target_environment"]) {
        layer.target_environment = root["target_environment"].as<std::string>();
    }

    // -- Paths --
    if (const auto paths = root["paths"]) {
        if (paths["source"]) layer.source_path = paths["source"].as<std::string>();
        if (paths["artifacts"]) layer.artifacts_path = paths["artifacts"].as<std::string>();
        if (paths["staging"]) layer.staging_path = paths["staging"].as<std::string>();
    }

    // -- Git --
    if (const auto git = root["git"]) {
        if (git["push"]) layer.git_push = git["push"].as<bool>();
        if (git["remote"]) layer.git_remote = git["remote"].as<std::string>();
        if (git["branch"]) layer.git_branch = git["branch"].as<std::string>();
        if (git["program"]) layer.git_program = git["program"].as<std::string>();
    }
    if (root["packager"]) {
        layer.packager_program = root["packager"].as<std::string>();
    }

    // -- Options --
    if (root["log_file"]) {
        layer.log_file = root["log_file"].as<std::string>();
    }
    if (root["json_output"]) {
        layer.json_output = root["json_output"].as<bool>();
    }
    if (root["verbose"]) {
        layer.verbosity = root["verbose"].as<bool>() ? 1 : 0;
    }
    if (root["quiet"]) {
        layer.quiet = root["quiet"].as<bool>();
    }
    if (root["timeout"]) {
        layer.timeout_seconds = root["timeout"].as<int>();
    }

    return Result<ConfigLayer, Error>::Ok(std::move(layer));
}

template <typename T>
void Override(T& target, const std::optional<T>& value) {
    if (value.has_value()) {
        target = *value;
    }
}

} // anonymous namespace

std::string SubcommandName(Subcommand cmd) {
    switch (cmd) {
        case Subcommand::Export: return "export";
        case Subcommand::Build:  return "build";
        case Subcommand::Deploy: return "deploy";
        case Subcommand::Import: return "import";
    }
    return "build";
}

// ---------------------------------------------------------------------------
// LoadLayerFromYaml
// ---------------------------------------------------------------------------
Result<ConfigLayer, Error> LoadLayerFromYaml(std::string_view file_path) {
    const std::string path(file_path);
    try {
        return ParseLayer(YAML::LoadFile(path), path);
    } catch (const YAML::Exception& e) {
        return Result<ConfigLayer, Error>::Err(
            MakeConfigError(path, "Failed to parse YAML file: " + std::string(e.what())));
    }
}

Result<ConfigLayer, Error> LoadLayerFromYamlString(const std::string& yaml,
                                                   const std::string& origin) {
    try {
        return ParseLayer(YAML::Load(yaml), origin);
    } catch (const YAML::Exception& e) {
        return Result<ConfigLayer, Error>::Err(
            MakeConfigError(origin, "Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(Subcommand subcommand, int argc,
                                      const char* const* argv) {
    argparse::ArgumentParser program("dv-alm " + SubcommandName(subcommand), kVersion);

    int verbosity = 0;
    program.add_argument("-c", "--config")
        .help("YAML config file (repeatable, later files win)")
        .append();
    program.add_argument("-v", "--verbose")
        .help("Verbose output (-vv for debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("-q", "--quiet")
        .help("Only print errors")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable ANSI colors")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Write JSON log lines to this file");
    program.add_argument("--timeout")
        .help("HTTP timeout in seconds")
        .scan<'i', int>();

    if (subcommand == Subcommand::Export) {
        program.add_argument("-m", "--message")
            .help("Commit message")
            .required();
        program.add_argument("-e", "--environment")
            .help("Environment to export from");
        program.add_argument("--push")
            .help("Push the commit")
            .default_value(false)
            .implicit_value(true);
    }
    if (subcommand == Subcommand::Deploy || subcommand == Subcommand::Import) {
        program.add_argument("-e", "--environment")
            .help("Target environment")
            .required();
    }
    if (subcommand == Subcommand::Deploy) {
        program.add_argument("--unmanaged")
            .help("Deploy every solution unmanaged")
            .default_value(false)
            .implicit_value(true);
    }

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("cli", "CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;
    options.subcommand = subcommand;
    options.layer.origin = "cli";

    if (auto files = program.present<std::vector<std::string>>("--config")) {
        options.config_files = *files;
    }
    if (verbosity > 0) {
        options.layer.verbosity = verbosity;
    }
    if (program.get<bool>("--quiet")) {
        options.layer.quiet = true;
    }
    if (program.get<bool>("--json")) {
        options.layer.json_output = true;
    }
    if (program.get<bool>("--no-color")) {
        options.layer.no_color = true;
    }
    if (auto val = program.present("--log-file")) {
        options.layer.log_file = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        options.layer.timeout_seconds = *val;
    }

    switch (subcommand) {
        case Subcommand::Export:
            options.layer.commit_message = program.get<std::string>("--message");
            if (auto val = program.present("--environment")) {
                options.layer.export_environment = *val;
            }
            if (program.get<bool>("--push")) {
                options.layer.git_push = true;
            }
            break;
        case Subcommand::Deploy:
            options.layer.target_environment = program.get<std::string>("--environment");
            if (program.get<bool>("--unmanaged")) {
                options.layer.unmanaged = true;
            }
            break;
        case Subcommand::Import:
            options.layer.target_environment = program.get<std::string>("--environment");
            options.layer.unmanaged = true;
            break;
        case Subcommand::Build:
            break;
    }

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// MergeConfigLayers
// ---------------------------------------------------------------------------
AlmConfig MergeConfigLayers(const std::vector<ConfigLayer>& layers) {
    AlmConfig config;

    for (const auto& layer : layers) {
        if (layer.solutions.has_value()) {
            config.solutions = *layer.solutions;
        }
        for (const auto& [name, spec] : layer.dependencies) {
            config.dependencies[name] = spec;
        }
        for (const auto& [phase, scripts] : layer.hooks) {
            auto& merged = config.hooks[phase];
            merged.insert(merged.end(), scripts.begin(), scripts.end());
        }
        for (const auto& [name, env] : layer.environments) {
            auto& merged = config.environments[name];
            merged.name = name;
            if (!env.url.empty()) merged.url = env.url;
            if (!env.token_env.empty()) merged.token_env = env.token_env;
            for (const auto& [key, value] : env.variables) {
                merged.variables[key] = value;
            }
        }

        Override(config.export_environment, layer.export_environment);
        Override(config.target_environment, layer.target_environment);
        Override(config.commit_message, layer.commit_message);
        Override(config.unmanaged, layer.unmanaged);

        Override(config.paths.source, layer.source_path);
        Override(config.paths.artifacts, layer.artifacts_path);
        Override(config.paths.staging, layer.staging_path);

        Override(config.git.push, layer.git_push);
        Override(config.git.remote, layer.git_remote);
        Override(config.git.branch, layer.git_branch);

        Override(config.packager_program, layer.packager_program);
        Override(config.git_program, layer.git_program);

        if (layer.log_file.has_value()) {
            config.log_file = layer.log_file;
        }
        Override(config.json_output, layer.json_output);
        Override(config.verbosity, layer.verbosity);
        Override(config.quiet, layer.quiet);
        Override(config.no_color, layer.no_color);
        Override(config.timeout_seconds, layer.timeout_seconds);
    }

    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AlmConfig& config, Subcommand command) {
    if (config.solutions.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("", "At least one solution must be configured"));
    }

    std::set<std::string> names;
    for (const auto& solution : config.solutions) {
        if (solution.name.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("", "Solution entry with empty name"));
        }
        if (!names.insert(solution.name).second) {
            return Result<void, Error>::Err(
                MakeConfigError(solution.name, "Duplicate solution name"));
        }
    }

    if (command != Subcommand::Deploy &&
        config.dependencies.count(config.packager_program) == 0) {
        return Result<void, Error>::Err(MakeConfigError(
            config.packager_program,
            "Missing dependency declaration for packager '" +
                config.packager_program + "'"));
    }

    auto require_environment = [&](const std::string& name,
                                   const char* role) -> Result<void, Error> {
        if (name.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("", std::string("Missing ") + role + " environment"));
        }
        const auto* env = config.FindEnvironment(name);
        if (!env) {
            return Result<void, Error>::Err(
                MakeConfigError(name, std::string("Unknown ") + role + " environment"));
        }
        if (env->url.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError(name, "Environment has no url"));
        }
        if (env->token_env.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError(name, "Environment has no token_env"));
        }
        return Result<void, Error>::Ok();
    };

    if (command == Subcommand::Export) {
        if (config.commit_message.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("", "Export requires a commit message (-m)"));
        }
        auto env = require_environment(config.export_environment, "export");
        if (env.IsErr()) return env;
    }
    if (command == Subcommand::Deploy || command == Subcommand::Import) {
        auto env = require_environment(config.target_environment, "target");
        if (env.IsErr()) return env;
    }

    if (config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("", "Timeout must be positive, got " +
                                std::to_string(config.timeout_seconds)));
    }
    if (config.verbosity > 0 && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("", "Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveToken / ResolveVariable
// ---------------------------------------------------------------------------
Result<std::string, Error> ResolveToken(const EnvironmentConfig& environment) {
    const char* value = std::getenv(environment.token_env.c_str());
    if (value == nullptr || *value == '\0') {
        return Result<std::string, Error>::Err(Error{
            "ResolveToken", environment.name, std::nullopt,
            "Environment variable '" + environment.token_env +
                "' not set (specified by token_env)",
            std::nullopt, ErrorCategory::Authentication});
    }
    return Result<std::string, Error>::Ok(std::string(value));
}

std::optional<std::string> ResolveVariable(const EnvironmentConfig& environment,
                                           const std::string& key) {
    auto it = environment.variables.find(key);
    if (it != environment.variables.end()) {
        return it->second;
    }
    const char* value = std::getenv(key.c_str());
    if (value != nullptr && *value != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace dv_alm
