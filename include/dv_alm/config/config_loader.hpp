#pragma once

#include <dv_alm/config/alm_config.hpp>
#include <dv_alm/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace dv_alm {

enum class Subcommand {
    Export,
    Build,
    Deploy,
    Import,
};

std::string SubcommandName(Subcommand cmd);

// ---------------------------------------------------------------------------
// CliOptions — what the command line contributes: the config files to load
// and the highest-precedence layer.
// ---------------------------------------------------------------------------
struct CliOptions {
    Subcommand subcommand = Subcommand::Build;
    std::vector<std::string> config_files;
    ConfigLayer layer;
};

/// Name of the config file used when no -c/--config is given.
inline constexpr const char* kDefaultConfigFile = "dv-alm.yaml";

// Parse one YAML file into a layer.
Result<ConfigLayer, Error> LoadLayerFromYaml(std::string_view file_path);

// Parse YAML text into a layer; `origin` names it in error messages.
Result<ConfigLayer, Error> LoadLayerFromYamlString(const std::string& yaml,
                                                   const std::string& origin);

// Parse the arguments that follow the subcommand token. argv[0] is the
// program name.
Result<CliOptions, Error> LoadFromCli(Subcommand subcommand, int argc,
                                      const char* const* argv);

// Merge layers in order (later wins). Hook lists concatenate, maps merge
// with override, scalars override, a later solution list replaces the
// earlier one.
AlmConfig MergeConfigLayers(const std::vector<ConfigLayer>& layers);

// Validate the merged configuration for the given command.
Result<void, Error> ValidateConfig(const AlmConfig& config, Subcommand command);

// Bearer token of an environment, read from the variable named by token_env.
Result<std::string, Error> ResolveToken(const EnvironmentConfig& environment);

// Value of a named variable: environment variables map first, then the
// process environment.
std::optional<std::string> ResolveVariable(const EnvironmentConfig& environment,
                                           const std::string& key);

} // namespace dv_alm
