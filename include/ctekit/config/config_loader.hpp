#pragma once

#include <ctekit/cli/command_router.hpp>
#include <ctekit/config/app_config.hpp>
#include <ctekit/core/result.hpp>

#include <string>
#include <string_view>

namespace ctekit {

// Name of the settings file picked up from the working directory.
inline constexpr const char* kDefaultConfigFile = ".ctekit.yaml";

// Parse a YAML settings file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Read the global flags of a parsed command line into an AppConfig.
Result<AppConfig, Error> LoadFromArgs(const CommandArgs& args);

// Merge two configs: fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Path of the settings file to read: the --config value, else
// kDefaultConfigFile when it exists in the working directory, else "".
std::string FindConfigFile(const CommandArgs& args);

// Settings file (--config, else .ctekit.yaml when present) merged with the
// command line flags, then validated.
Result<AppConfig, Error> ResolveConfig(const CommandArgs& args);

} // namespace ctekit
