#include <catch2/catch_test_macros.hpp>

#include <ctekit/config/config_loader.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <system_error>

using namespace ctekit;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the source tree from __FILE__.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

CommandArgs ArgsWithFlags(std::map<std::string, std::string> flags) {
    CommandArgs args;
    args.group = "graph";
    args.action = "order";
    args.flags = std::move(flags);
    return args;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("config_full.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.workspace_path == "./analytics.yaml");
    REQUIRE(config.indent_width.has_value());
    CHECK(*config.indent_width == 2);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/ctekit.log");
    CHECK(config.json_output);
    CHECK(config.verbose == 2);
    CHECK_FALSE(config.quiet);
    REQUIRE(config.color.has_value());
    CHECK_FALSE(*config.color);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("config_minimal.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.workspace_path == "./ctes");
    CHECK_FALSE(config.indent_width.has_value());
    CHECK_FALSE(config.log_file.has_value());
    CHECK_FALSE(config.json_output);
    CHECK(config.verbose == 0);
    CHECK_FALSE(config.color.has_value());
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/.ctekit.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::NotFound);
    CHECK(result.Error().operation == "ConfigLoader");
}

TEST_CASE("LoadFromYaml: malformed file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("config_malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Parse);
}

// ===========================================================================
// LoadFromArgs
// ===========================================================================

TEST_CASE("LoadFromArgs: no flags gives defaults", "[config][cli]") {
    auto result = LoadFromArgs(ArgsWithFlags({}));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.workspace_path.empty());
    CHECK_FALSE(config.indent_width.has_value());
    CHECK_FALSE(config.json_output);
    CHECK(config.verbose == 0);
    CHECK_FALSE(config.quiet);
    CHECK_FALSE(config.color.has_value());
}

TEST_CASE("LoadFromArgs: workspace, indent and log file", "[config][cli]") {
    auto result = LoadFromArgs(ArgsWithFlags({
        {"workspace", "ctes/"},
        {"indent", "2"},
        {"log-file", "run.log"},
    }));
    REQUIRE(result.IsOk());
    CHECK(result.Value().workspace_path == "ctes/");
    CHECK(result.Value().indent_width.value_or(0) == 2);
    REQUIRE(result.Value().log_file.has_value());
    CHECK(*result.Value().log_file == "run.log");
}

TEST_CASE("LoadFromArgs: verbosity, json and color flags", "[config][cli]") {
    auto verbose = LoadFromArgs(ArgsWithFlags({{"verbose", "true"}, {"json", "true"}}));
    REQUIRE(verbose.IsOk());
    CHECK(verbose.Value().verbose == 1);
    CHECK(verbose.Value().json_output);

    auto debug = LoadFromArgs(ArgsWithFlags({{"verbose", "2"}, {"no-color", "true"}}));
    REQUIRE(debug.IsOk());
    CHECK(debug.Value().verbose == 2);
    REQUIRE(debug.Value().color.has_value());
    CHECK_FALSE(*debug.Value().color);

    auto color = LoadFromArgs(ArgsWithFlags({{"color", "true"}, {"quiet", "true"}}));
    REQUIRE(color.IsOk());
    CHECK(*color.Value().color);
    CHECK(color.Value().quiet);
}

TEST_CASE("LoadFromArgs: invalid indent value", "[config][cli]") {
    for (const auto* value : {"two", "2x", ""}) {
        auto result = LoadFromArgs(ArgsWithFlags({{"indent", value}}));
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
        CHECK(result.Error().subject == "indent");
    }
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML values", "[config][merge]") {
    AppConfig yaml;
    yaml.workspace_path = "from_yaml.yaml";
    yaml.indent_width = 2;
    yaml.color = true;

    AppConfig cli;
    cli.workspace_path = "from_cli/";
    cli.indent_width = 8;
    cli.verbose = 2;
    cli.color = false;

    auto merged = MergeConfigs(yaml, cli);
    CHECK(merged.workspace_path == "from_cli/");
    CHECK(merged.indent_width.value_or(0) == 8);
    CHECK(merged.verbose == 2);
    REQUIRE(merged.color.has_value());
    CHECK_FALSE(*merged.color);
}

TEST_CASE("MergeConfigs: YAML values preserved when CLI not set", "[config][merge]") {
    AppConfig yaml;
    yaml.workspace_path = "from_yaml.yaml";
    yaml.indent_width = 2;
    yaml.log_file = "ctekit.log";
    yaml.json_output = true;
    yaml.verbose = 1;

    auto merged = MergeConfigs(yaml, AppConfig{});
    CHECK(merged.workspace_path == "from_yaml.yaml");
    CHECK(merged.indent_width.value_or(0) == 2);
    REQUIRE(merged.log_file.has_value());
    CHECK(*merged.log_file == "ctekit.log");
    CHECK(merged.json_output);
    CHECK(merged.verbose == 1);
    CHECK_FALSE(merged.color.has_value());
}

TEST_CASE("MergeConfigs: explicit default indent still overrides YAML", "[config][merge]") {
    AppConfig yaml;
    yaml.indent_width = 2;

    AppConfig cli;
    cli.indent_width = kDefaultIndentWidth;

    auto merged = MergeConfigs(yaml, cli);
    REQUIRE(merged.indent_width.has_value());
    CHECK(*merged.indent_width == 4);

    CHECK_FALSE(MergeConfigs(AppConfig{}, AppConfig{}).indent_width.has_value());
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: valid config passes", "[config][validate]") {
    AppConfig config;
    config.workspace_path = "ctes/";
    CHECK(ValidateConfig(config).IsOk());

    config.indent_width = 0;
    CHECK(ValidateConfig(config).IsOk());
    config.indent_width = 16;
    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("ValidateConfig: missing workspace", "[config][validate]") {
    auto result = ValidateConfig(AppConfig{});
    REQUIRE(result.IsErr());
    CHECK(result.Error().subject == "workspace");
    CHECK(result.Error().ExitCode() == 7);
}

TEST_CASE("ValidateConfig: indent out of range", "[config][validate]") {
    AppConfig config;
    config.workspace_path = "ctes/";
    config.indent_width = 17;
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().subject == "indent");

    config.indent_width = -1;
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: verbose and quiet conflict", "[config][validate]") {
    AppConfig config;
    config.workspace_path = "ctes/";
    config.verbose = 1;
    config.quiet = true;

    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("--quiet") != std::string::npos);
}

// ===========================================================================
// ResolveConfig
// ===========================================================================

TEST_CASE("ResolveConfig: settings file merged with flags", "[config][resolve]") {
    auto result = ResolveConfig(ArgsWithFlags({
        {"config", TestDataPath("config_full.yaml")},
        {"indent", "6"},
    }));
    REQUIRE(result.IsOk());
    CHECK(result.Value().workspace_path == "./analytics.yaml");
    CHECK(result.Value().indent_width.value_or(0) == 6);
    CHECK(result.Value().verbose == 2);
}

TEST_CASE("ResolveConfig: --indent 4 wins over the settings file", "[config][resolve]") {
    auto result = ResolveConfig(ArgsWithFlags({
        {"config", TestDataPath("config_full.yaml")},
        {"indent", "4"},
    }));
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().indent_width.has_value());
    CHECK(*result.Value().indent_width == 4);

    auto from_file = ResolveConfig(ArgsWithFlags({{"config", TestDataPath("config_full.yaml")}}));
    REQUIRE(from_file.IsOk());
    CHECK(from_file.Value().indent_width.value_or(0) == 2);
}

TEST_CASE("ResolveConfig: explicit settings file must exist", "[config][resolve]") {
    auto result = ResolveConfig(ArgsWithFlags({
        {"config", TestDataPath("no_such_config.yaml")},
        {"workspace", "ctes/"},
    }));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::NotFound);
}

TEST_CASE("ResolveConfig: flags alone are validated", "[config][resolve]") {
    auto ok = ResolveConfig(ArgsWithFlags({{"workspace", "ctes/"}}));
    REQUIRE(ok.IsOk());
    CHECK(ok.Value().workspace_path == "ctes/");

    auto bad = ResolveConfig(ArgsWithFlags({{"workspace", "ctes/"}, {"indent", "99"}}));
    REQUIRE(bad.IsErr());
    CHECK(bad.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// FindConfigFile
// ===========================================================================

TEST_CASE("FindConfigFile: --config flag is returned as given", "[config][resolve]") {
    auto path = TestDataPath("no_such_config.yaml");
    CHECK(FindConfigFile(ArgsWithFlags({{"config", path}})) == path);
}

TEST_CASE("FindConfigFile: default file only when present", "[config][resolve]") {
    std::error_code ec;
    const bool present = std::filesystem::exists(kDefaultConfigFile, ec);
    CHECK(FindConfigFile(ArgsWithFlags({})) == (present ? kDefaultConfigFile : ""));
}
