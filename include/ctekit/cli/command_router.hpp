#pragma once

#include <ctekit/core/result.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ctekit {

// ---------------------------------------------------------------------------
// CommandArgs: parsed command-line arguments for a specific command.
// ---------------------------------------------------------------------------
struct CommandArgs {
    std::string group;                   // e.g. "graph", "sql", "workspace"
    std::string action;                  // e.g. "order", "resolve", "list"
    std::vector<std::string> positional; // remaining positional arguments
    std::map<std::string, std::string> flags; // --key=value pairs
};

// Returns 0 on success, otherwise the process exit code.
using CommandHandler = std::function<int(const CommandArgs& args)>;

struct FlagHelp {
    std::string name;        // e.g. "out"
    std::string placeholder; // e.g. "<path>"
    std::string description;
    bool required = false;
};

struct CommandHelp {
    std::string usage;            // e.g. "ctekit sql resolve <target> [flags]"
    std::string args_description; // e.g. "<target>    CTE to resolve"
    std::string long_description;
    std::vector<FlagHelp> flags;
    std::vector<std::string> examples;
};

struct CommandInfo {
    std::string group;
    std::string action;
    std::string description;
    CommandHandler handler;
    std::optional<CommandHelp> help;
};

// ---------------------------------------------------------------------------
// CommandRouter: two-level dispatch for CLI commands.
//
// Commands are registered as group/action pairs. The router parses argv,
// extracts the group and action, and dispatches to the registered handler.
// Flags may appear before the group, between group and action, or after
// the action. `-v`, `-vv` and `-q` are stored as `verbose=1`, `verbose=2`
// and `quiet=true`.
//
// Usage:
//   CommandRouter router;
//   router.Register("graph", "order", "Print definition order", handler);
//   return router.Dispatch(argc, argv);
// ---------------------------------------------------------------------------
class CommandRouter {
public:
    CommandRouter() = default;

    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler);

    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler,
                  CommandHelp help);

    void SetGroupDescription(const std::string& group,
                             const std::string& description);

    void SetGroupExamples(const std::string& group,
                          std::vector<std::string> examples);

    // Parse argv and dispatch to the matching handler.
    // Returns the exit code from the handler, or 1 on routing error.
    // Intercepts --help at group and command levels.
    int Dispatch(int argc, const char* const* argv) const;

    // Parse argv into CommandArgs without dispatching.
    static Result<CommandArgs, std::string> Parse(int argc, const char* const* argv);

    // True if `arg` is a flag that does not consume the next token.
    static bool IsBooleanFlag(std::string_view arg);

    [[nodiscard]] std::vector<std::string> Groups() const;
    [[nodiscard]] bool HasGroup(const std::string& group) const;
    [[nodiscard]] std::vector<CommandInfo> CommandsForGroup(const std::string& group) const;
    [[nodiscard]] std::string GroupDescription(const std::string& group) const;
    [[nodiscard]] std::vector<std::string> GroupExamples(const std::string& group) const;

    void PrintHelp(std::ostream& out) const;
    void PrintGroupHelp(const std::string& group, std::ostream& out) const;
    void PrintCommandHelp(const std::string& group,
                          const std::string& action,
                          std::ostream& out) const;

private:
    // Key: "group:action"
    std::map<std::string, CommandInfo> commands_;
    std::map<std::string, std::string> group_descriptions_;
    std::map<std::string, std::vector<std::string>> group_examples_;
};

} // namespace ctekit
