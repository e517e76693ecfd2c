#include <ctekit/cli/command_executor.hpp>
#include <ctekit/cli/command_router.hpp>
#include <ctekit/config/config_loader.hpp>
#include <ctekit/core/log.hpp>
#include <ctekit/core/terminal.hpp>
#include <ctekit/core/version.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;

bool ResolveColorForHelp(int argc, const char* const* argv) {
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--color") force_color = true;
        if (arg == "--no-color") force_no_color = true;
    }
    if (ctekit::NoColorEnvSet()) force_no_color = true;
    return !force_no_color && (force_color || ctekit::IsStdoutTty());
}

// Check for --version before the first positional (group) argument.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "ctekit " << ctekit::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

// Logging settings come from the same flags and settings file as the
// command configuration. A broken settings file is reported by the command
// itself, so here it only means "no file settings".
ctekit::AppConfig LoggingConfig(const ctekit::CommandArgs& args) {
    using namespace ctekit;

    auto cli = LoadFromArgs(args);
    AppConfig config = cli.IsOk() ? cli.Value() : AppConfig{};

    const auto config_path = FindConfigFile(args);
    if (!config_path.empty()) {
        auto yaml = LoadFromYaml(config_path);
        if (yaml.IsOk()) {
            config = MergeConfigs(yaml.Value(), config);
        }
    }
    return config;
}

void InitLogging(const ctekit::AppConfig& config) {
    using namespace ctekit;

    auto level = LogLevel::Warn;
    if (config.quiet) {
        level = LogLevel::Error;
    } else if (config.verbose >= 2) {
        level = LogLevel::Debug;
    } else if (config.verbose == 1) {
        level = LogLevel::Info;
    }

    if (config.log_file.has_value()) {
        auto sink = std::make_unique<FileSink>(*config.log_file);
        if (sink->IsOpen()) {
            InitGlobalLogger(std::move(sink), level);
            return;
        }
        std::cerr << "Warning: cannot open log file '" << *config.log_file
                  << "', logging to stderr\n";
    }

    if (config.json_output) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
        return;
    }

    bool use_color = config.color.value_or(!NoColorEnvSet() && IsStderrTty());
    InitGlobalLogger(std::make_unique<StreamSink>(use_color), level);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace ctekit;

    CommandRouter router;
    RegisterAllCommands(router);

    // No arguments: print top-level help.
    if (argc == 1) {
        PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto parsed = CommandRouter::Parse(argc, argv);
    if (parsed.IsErr()) {
        // Only flags: --help prints the overview, anything else is a usage error.
        for (int i = 1; i < argc; ++i) {
            auto arg = std::string_view{argv[i]};
            if (arg == "--help" || arg == "-h") {
                PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
                return kExitSuccess;
            }
        }
        return router.Dispatch(argc, argv);
    }

    InitLogging(LoggingConfig(parsed.Value()));
    LogDebug("cli", "ctekit " + std::string(kVersion));

    return router.Dispatch(argc, argv);
}
