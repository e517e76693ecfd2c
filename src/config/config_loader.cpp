#include <ctekit/config/config_loader.hpp>

#include <ctekit/core/log.hpp>

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace ctekit {

namespace {

constexpr int kMaxIndentWidth = 16;

Error MakeConfigError(const std::string& subject, const std::string& message) {
    return Error{"ConfigLoader", subject, message, ErrorCategory::Config, {}};
}

Result<int, Error> ParseIndent(const std::string& value) {
    try {
        size_t consumed = 0;
        int indent = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return Result<int, Error>::Ok(indent);
    } catch (const std::exception&) {
        return Result<int, Error>::Err(
            MakeConfigError("indent", "Invalid --indent value: '" + value + "'"));
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    std::error_code ec;
    if (!std::filesystem::exists(std::string(file_path), ec)) {
        return Result<AppConfig, Error>::Err(
            Error{"ConfigLoader", std::string(file_path), "Config file not found",
                  ErrorCategory::NotFound, {}});
    }

    AppConfig config;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));
        if (root["workspace"]) {
            config.workspace_path = root["workspace"].as<std::string>();
        }
        if (root["indent"]) {
            config.indent_width = root["indent"].as<int>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (const auto verbose = root["verbose"]) {
            // Either a level (0, 1, 2) or a boolean.
            int level = 0;
            if (YAML::convert<int>::decode(verbose, level)) {
                config.verbose = level;
            } else {
                config.verbose = verbose.as<bool>() ? 1 : 0;
            }
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
        if (root["color"]) {
            config.color = root["color"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            Error{"ConfigLoader", std::string(file_path),
                  "Failed to parse YAML file: " + std::string(e.what()),
                  ErrorCategory::Parse, {}});
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromArgs
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromArgs(const CommandArgs& args) {
    AppConfig config;
    const auto& flags = args.flags;

    if (auto it = flags.find("workspace"); it != flags.end()) {
        config.workspace_path = it->second;
    }
    if (auto it = flags.find("indent"); it != flags.end()) {
        auto indent = ParseIndent(it->second);
        if (indent.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(indent).Error());
        }
        config.indent_width = indent.Value();
    }
    if (auto it = flags.find("log-file"); it != flags.end()) {
        config.log_file = it->second;
    }
    if (flags.count("json") > 0) {
        config.json_output = true;
    }
    if (auto it = flags.find("verbose"); it != flags.end()) {
        config.verbose = (it->second == "2") ? 2 : 1;
    }
    if (flags.count("quiet") > 0) {
        config.quiet = true;
    }
    if (flags.count("color") > 0) {
        config.color = true;
    }
    if (flags.count("no-color") > 0) {
        config.color = false;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    if (!cli_overrides.workspace_path.empty()) {
        merged.workspace_path = cli_overrides.workspace_path;
    }
    if (cli_overrides.indent_width.has_value()) {
        merged.indent_width = cli_overrides.indent_width;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose > 0) {
        merged.verbose = cli_overrides.verbose;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.color.has_value()) {
        merged.color = cli_overrides.color;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.workspace_path.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "workspace",
            "Missing required setting: workspace (use --workspace or a config file)"));
    }
    if (config.indent_width.has_value() &&
        (*config.indent_width < 0 || *config.indent_width > kMaxIndentWidth)) {
        return Result<void, Error>::Err(MakeConfigError(
            "indent", "Indent must be between 0 and " +
                          std::to_string(kMaxIndentWidth) + ", got " +
                          std::to_string(*config.indent_width)));
    }
    if (config.verbose > 0 && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("verbose", "Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// FindConfigFile
// ---------------------------------------------------------------------------
std::string FindConfigFile(const CommandArgs& args) {
    if (auto it = args.flags.find("config"); it != args.flags.end()) {
        return it->second;
    }
    std::error_code ec;
    if (std::filesystem::exists(kDefaultConfigFile, ec)) {
        return kDefaultConfigFile;
    }
    return {};
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(const CommandArgs& args) {
    auto cli_result = LoadFromArgs(args);
    if (cli_result.IsErr()) {
        return cli_result;
    }
    auto config = std::move(cli_result).Value();

    const auto config_path = FindConfigFile(args);
    if (!config_path.empty()) {
        auto yaml_result = LoadFromYaml(config_path);
        if (yaml_result.IsErr()) {
            return yaml_result;
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
        LogDebug("config", "loaded settings from " + config_path);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(valid).Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // namespace ctekit
