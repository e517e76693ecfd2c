#include <ctekit/cli/command_executor.hpp>
#include <ctekit/cli/output_formatter.hpp>
#include <ctekit/compose/sql_composer.hpp>
#include <ctekit/config/config_loader.hpp>
#include <ctekit/core/ansi.hpp>
#include <ctekit/core/log.hpp>
#include <ctekit/core/terminal.hpp>
#include <ctekit/graph/dependency_graph.hpp>
#include <ctekit/workspace/workspace_loader.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace ctekit {

namespace {

namespace fs = std::filesystem;

constexpr const char* kComponent = "cli";

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::string GetFlag(const CommandArgs& args, const std::string& key,
                    const std::string& default_val = "") {
    auto it = args.flags.find(key);
    return (it != args.flags.end()) ? it->second : default_val;
}

bool HasFlag(const CommandArgs& args, const std::string& key) {
    return args.flags.count(key) > 0;
}

bool ColorMode(const AppConfig& config) {
    if (config.json_output) return false;
    if (config.color.has_value()) return *config.color;
    if (NoColorEnvSet()) return false;
    return IsStdoutTty();
}

std::string Join(const NameList& names, const std::string& sep = ", ") {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += sep;
        out += name;
    }
    return out;
}

Error MakeUsageError(const CommandArgs& args, const std::string& message) {
    return Error{"ctekit " + args.group + " " + args.action, "", message,
                 ErrorCategory::Config, {}};
}

// Resolved settings, the loaded workspace and a formatter bound to the
// caller's streams.
struct CommandContext {
    AppConfig config;
    Workspace workspace;
    OutputFormatter fmt;
};

// Resolve config and load the workspace. On failure the error is printed
// and its exit code is returned through `exit_code`.
std::optional<CommandContext> Prepare(const CommandArgs& args, std::ostream& out,
                                      std::ostream& err, int& exit_code) {
    auto config = ResolveConfig(args);
    if (config.IsErr()) {
        OutputFormatter(HasFlag(args, "json"), false, out, err).PrintError(config.Error());
        exit_code = config.Error().ExitCode();
        return std::nullopt;
    }

    OutputFormatter fmt(config.Value().json_output, ColorMode(config.Value()), out, err);
    auto workspace = LoadWorkspace(config.Value().workspace_path);
    if (workspace.IsErr()) {
        fmt.PrintError(workspace.Error());
        exit_code = workspace.Error().ExitCode();
        return std::nullopt;
    }

    LogDebug(kComponent, "workspace '" + workspace.Value().name + "' with " +
                             std::to_string(workspace.Value().ctes.Size()) + " CTE(s)");
    return CommandContext{std::move(config).Value(), std::move(workspace).Value(), fmt};
}

int Fail(const OutputFormatter& fmt, const Error& error) {
    fmt.PrintError(error);
    return error.ExitCode();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// graph validate
// ---------------------------------------------------------------------------
int HandleGraphValidate(const CommandArgs& args, std::ostream& out, std::ostream& err) {
    int exit_code = 0;
    auto ctx = Prepare(args, out, err, exit_code);
    if (!ctx) return exit_code;
    const auto& ctes = ctx->workspace.ctes;

    auto check = CheckNoCycles(ctes);
    if (check.IsErr()) {
        return Fail(ctx->fmt, check.Error());
    }

    auto externals = FindExternalReferences(ctes);
    if (ctx->fmt.IsJsonMode()) {
        nlohmann::json j;
        j["valid"] = true;
        j["cte_count"] = ctes.Size();
        j["external_references"] = nlohmann::json::array();
        for (const auto& ext : externals) {
            j["external_references"].push_back(
                {{"name", ext.name}, {"references", ext.references}});
        }
        ctx->fmt.PrintJson(j);
        return 0;
    }

    for (const auto& ext : externals) {
        ctx->fmt.PrintWarning("'" + ext.name + "' references " + Join(ext.references) +
                              " (not a CTE of this workspace, treated as a table)");
    }
    ctx->fmt.PrintSuccess("No circular dependencies among " +
                          std::to_string(ctes.Size()) + " CTE(s)");
    return 0;
}

// ---------------------------------------------------------------------------
// graph order [target]
// ---------------------------------------------------------------------------
int HandleGraphOrder(const CommandArgs& args, std::ostream& out, std::ostream& err) {
    int exit_code = 0;
    auto ctx = Prepare(args, out, err, exit_code);
    if (!ctx) return exit_code;

    auto order = args.positional.empty()
                     ? OrderForAll(ctx->workspace.ctes)
                     : OrderForTarget(args.positional[0], ctx->workspace.ctes);
    if (order.IsErr()) {
        return Fail(ctx->fmt, order.Error());
    }
    ctx->fmt.PrintList(order.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// graph dependents <name>
// ---------------------------------------------------------------------------
int HandleGraphDependents(const CommandArgs& args, std::ostream& out, std::ostream& err) {
    if (args.positional.empty()) {
        OutputFormatter fmt(HasFlag(args, "json"), false, out, err);
        return Fail(fmt, MakeUsageError(
            args, "Missing CTE name. Usage: ctekit graph dependents <name>"));
    }

    int exit_code = 0;
    auto ctx = Prepare(args, out, err, exit_code);
    if (!ctx) return exit_code;

    ctx->fmt.PrintList(FindDependents(args.positional[0], ctx->workspace.ctes));
    return 0;
}

// ---------------------------------------------------------------------------
// graph adjacency
// ---------------------------------------------------------------------------
int HandleGraphAdjacency(const CommandArgs& args, std::ostream& out, std::ostream& err) {
    int exit_code = 0;
    auto ctx = Prepare(args, out, err, exit_code);
    if (!ctx) return exit_code;

    auto adjacency = AsAdjacency(ctx->workspace.ctes);
    if (ctx->fmt.IsJsonMode()) {
        auto j = nlohmann::json::array();
        for (const auto& [name, deps] : adjacency) {
            j.push_back(nlohmann::json{{"name", name}, {"dependencies", deps}});
        }
        ctx->fmt.PrintJson(j);
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& [name, deps] : adjacency) {
        rows.push_back({name, deps.empty() ? "-" : Join(deps)});
    }
    ctx->fmt.PrintTable({"CTE", "Dependencies"}, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// sql resolve <target>
// ---------------------------------------------------------------------------
int HandleSqlResolve(const CommandArgs& args, std::ostream& out, std::ostream& err) {
    if (args.positional.empty()) {
        OutputFormatter fmt(HasFlag(args, "json"), false, out, err);
        return Fail(fmt, MakeUsageError(
            args, "Missing target CTE. Usage: ctekit sql resolve <target>"));
    }

    int exit_code = 0;
    auto ctx = Prepare(args, out, err, exit_code);
    if (!ctx) return exit_code;

    const auto& target = args.positional[0];
    ComposeOptions options;
    options.indent_width = ctx->config.indent_width.value_or(kDefaultIndentWidth);

    auto sql = Resolve(target, ctx->workspace.ctes, options);
    if (sql.IsErr()) {
        return Fail(ctx->fmt, sql.Error());
    }

    if (ctx->fmt.IsJsonMode()) {
        // Resolve succeeded, so the order cannot fail.
        auto order = OrderForTarget(target, ctx->workspace.ctes);
        nlohmann::json j;
        j["target"] = target;
        j["order"] = order.IsOk() ? order.Value() : NameList{};
        j["sql"] = sql.Value();
        ctx->fmt.PrintJson(j);
        return 0;
    }
    ctx->fmt.PrintText(sql.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// sql compose
// ---------------------------------------------------------------------------
int HandleSqlCompose(const CommandArgs& args, std::ostream& out, std::ostream& err) {
    int exit_code = 0;
    auto ctx = Prepare(args, out, err, exit_code);
    if (!ctx) return exit_code;
    const auto& ws = ctx->workspace;

    if (!ws.HasMainQuery()) {
        return Fail(ctx->fmt, Error{"ctekit sql compose", ws.name,
                                    "Workspace has no main query",
                                    ErrorCategory::Config, {}});
    }

    ComposeOptions options;
    options.indent_width = ctx->config.indent_width.value_or(kDefaultIndentWidth);
    auto sql = ComposeQuery(ws.main_query, ws.main_dependencies, ws.ctes, options);
    if (sql.IsErr()) {
        return Fail(ctx->fmt, sql.Error());
    }

    if (ctx->fmt.IsJsonMode()) {
        nlohmann::json j;
        j["workspace"] = ws.name;
        j["sql"] = sql.Value();
        ctx->fmt.PrintJson(j);
        return 0;
    }
    ctx->fmt.PrintText(sql.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// workspace list
// ---------------------------------------------------------------------------
int HandleWorkspaceList(const CommandArgs& args, std::ostream& out, std::ostream& err) {
    int exit_code = 0;
    auto ctx = Prepare(args, out, err, exit_code);
    if (!ctx) return exit_code;

    std::vector<std::vector<std::string>> rows;
    for (const auto& cte : ctx->workspace.ctes) {
        rows.push_back({cte.name,
                        cte.dependencies.empty() ? "-" : Join(cte.dependencies),
                        cte.description.value_or("")});
    }
    ctx->fmt.PrintTable({"Name", "Dependencies", "Description"}, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// workspace export [--out <file>]
// ---------------------------------------------------------------------------
int HandleWorkspaceExport(const CommandArgs& args, std::ostream& out, std::ostream& err) {
    int exit_code = 0;
    auto ctx = Prepare(args, out, err, exit_code);
    if (!ctx) return exit_code;

    auto doc = WorkspaceToJson(ctx->workspace);
    auto out_path = GetFlag(args, "out");
    if (out_path.empty()) {
        out << doc.dump(2) << "\n";
        return 0;
    }

    std::ofstream ofs(out_path);
    if (!ofs) {
        return Fail(ctx->fmt, Error{"ctekit workspace export", out_path,
                                    "Cannot open file for writing",
                                    ErrorCategory::Io, {}});
    }
    ofs << doc.dump(2) << "\n";
    LogInfo(kComponent, "wrote " + out_path);
    ctx->fmt.PrintSuccess("Exported " + std::to_string(ctx->workspace.ctes.Size()) +
                          " CTE(s) to " + out_path);
    return 0;
}

// ---------------------------------------------------------------------------
// workspace unpack --out <dir>
// ---------------------------------------------------------------------------
int HandleWorkspaceUnpack(const CommandArgs& args, std::ostream& out, std::ostream& err) {
    auto out_dir = GetFlag(args, "out");
    if (out_dir.empty()) {
        OutputFormatter fmt(HasFlag(args, "json"), false, out, err);
        return Fail(fmt, MakeUsageError(
            args, "Missing output directory. Usage: ctekit workspace unpack --out <dir>"));
    }

    int exit_code = 0;
    auto ctx = Prepare(args, out, err, exit_code);
    if (!ctx) return exit_code;
    const auto& ws = ctx->workspace;

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        return Fail(ctx->fmt, Error{"ctekit workspace unpack", out_dir,
                                    "Cannot create directory: " + ec.message(),
                                    ErrorCategory::Io, {}});
    }

    auto write_file = [&](const fs::path& path, const Cte& cte) -> bool {
        std::ofstream ofs(path);
        if (!ofs) return false;
        ofs << FormatCteFile(cte);
        LogDebug(kComponent, "wrote " + path.string());
        return true;
    };

    size_t written = 0;
    for (const auto& cte : ws.ctes) {
        auto path = fs::path(out_dir) / (cte.name + ".cte.sql");
        if (!write_file(path, cte)) {
            return Fail(ctx->fmt, Error{"ctekit workspace unpack", path.string(),
                                        "Cannot open file for writing",
                                        ErrorCategory::Io, {}});
        }
        ++written;
    }
    if (ws.HasMainQuery()) {
        Cte main{"main", ws.main_query, ws.main_dependencies, std::nullopt, {}};
        auto path = fs::path(out_dir) / "main.sql";
        if (!write_file(path, main)) {
            return Fail(ctx->fmt, Error{"ctekit workspace unpack", path.string(),
                                        "Cannot open file for writing",
                                        ErrorCategory::Io, {}});
        }
    }

    ctx->fmt.PrintSuccess("Wrote " + std::to_string(written) + " CTE file(s) to " + out_dir);
    return 0;
}

// ---------------------------------------------------------------------------
// PrintTopLevelHelp
// ---------------------------------------------------------------------------
namespace {

struct Ansi {
    std::ostream& out;
    bool color;

    Ansi& Bold(const std::string& s) {
        if (color) out << ansi::kBold;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Dim(const std::string& s) {
        if (color) out << ansi::kDim;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Normal(const std::string& s) {
        out << s;
        return *this;
    }

    Ansi& Nl() {
        out << "\n";
        return *this;
    }
};

} // anonymous namespace (Ansi helper)

void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color) {
    Ansi a{out, color};

    a.Bold("ctekit").Normal(" - resolve dependencies between SQL common table expressions").Nl().Nl();
    a.Dim("  Orders CTE definitions, detects cycles and recomposes executable SQL.").Nl();
    a.Dim("  All commands accept --json for machine-readable output.").Nl();

    out << "\n";
    a.Bold("USAGE").Nl();
    out << "  ctekit [global-flags] <group> <action> [args] [flags]\n";

    constexpr size_t kLeft = 34;
    for (const auto& group : router.Groups()) {
        out << "\n";
        std::string label = group;
        std::transform(label.begin(), label.end(), label.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        a.Bold(label);
        auto desc = router.GroupDescription(group);
        if (!desc.empty()) {
            a.Dim(" - " + desc);
        }
        a.Nl();

        for (const auto& cmd : router.CommandsForGroup(group)) {
            std::string left = "  " + group + " " + cmd.action;
            if (cmd.help.has_value() && !cmd.help->args_description.empty()) {
                auto arg = cmd.help->args_description.substr(
                    0, cmd.help->args_description.find(' '));
                left += " " + arg;
            }
            size_t pad = (kLeft > left.size()) ? (kLeft - left.size()) : 2;
            out << left << std::string(pad, ' ') << cmd.description << "\n";
        }
    }

    out << "\n";
    a.Bold("GLOBAL FLAGS").Nl();

    struct GlobalFlag {
        const char* flag;
        const char* desc;
    };
    const GlobalFlag global_flags[] = {
        {"--workspace <path>",  "Workspace file (.yaml, .json) or CTE directory"},
        {"--config <path>",     "Settings file (default: ./.ctekit.yaml if present)"},
        {"--indent <n>",        "Indent width of CTE bodies (default: 4)"},
        {"--json",              "JSON output"},
        {"--color",             "Force colored output"},
        {"--no-color",          "Disable colored output"},
        {"-v",                  "Verbose logging (INFO level)"},
        {"-vv",                 "Debug logging (DEBUG level)"},
        {"-q, --quiet",         "Only log errors"},
        {"--log-file <path>",   "Write log lines to a file"},
        {"--version",           "Print version"},
    };
    for (const auto& gf : global_flags) {
        std::string left = std::string("  ") + gf.flag;
        size_t pad = (kLeft > left.size()) ? (kLeft - left.size()) : 2;
        out << left << std::string(pad, ' ') << gf.desc << "\n";
    }

    out << "\n";
    a.Bold("EXIT CODES").Nl();
    out << "  0  Success          2  Not found          3  Circular dependency\n";
    out << "  4  Invalid name     5  Parse error        6  I/O error\n";
    out << "  7  Config/usage     99 Internal error\n";

    out << "\n";
    a.Dim("  Use \"ctekit <group> --help\" for actions and examples.").Nl();
}

// ---------------------------------------------------------------------------
// RegisterAllCommands
// ---------------------------------------------------------------------------
void RegisterAllCommands(CommandRouter& router) {
    auto bind = [](int (*handler)(const CommandArgs&, std::ostream&, std::ostream&)) {
        return [handler](const CommandArgs& args) {
            return handler(args, std::cout, std::cerr);
        };
    };

    router.SetGroupDescription("graph", "Inspect and validate the CTE dependency graph");
    router.SetGroupExamples("graph", {
        "$ ctekit graph validate --workspace analytics.yaml",
        "$ ctekit graph order funnel_analysis --workspace ctes/",
        "$ ctekit --json graph adjacency --workspace analytics.yaml",
    });

    router.SetGroupDescription("sql", "Recompose executable SQL from CTE definitions");
    router.SetGroupExamples("sql", {
        "$ ctekit sql resolve channel_performance --workspace analytics.yaml",
        "$ ctekit sql compose --workspace ctes/ --indent 2",
    });

    router.SetGroupDescription("workspace", "List, export and unpack CTE workspaces");
    router.SetGroupExamples("workspace", {
        "$ ctekit workspace list --workspace ctes/",
        "$ ctekit workspace export --workspace ctes/ --out analytics.json",
        "$ ctekit workspace unpack --workspace analytics.yaml --out ctes/",
    });

    // -----------------------------------------------------------------------
    // graph
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "ctekit graph validate [flags]";
        help.long_description =
            "Fails with exit code 3 when any cycle exists. Dependency names that "
            "are not CTEs of the workspace are reported as warnings.";
        help.examples = {"ctekit graph validate --workspace analytics.yaml"};
        router.Register("graph", "validate", "Check the graph for circular dependencies",
                        bind(HandleGraphValidate), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "ctekit graph order [<target>] [flags]";
        help.args_description = "<target>    CTE to order for (default: every CTE)";
        help.long_description =
            "Prints one name per line, every dependency before its dependents.";
        help.examples = {"ctekit graph order funnel_analysis --workspace ctes/"};
        router.Register("graph", "order", "Print the definition order",
                        bind(HandleGraphOrder), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "ctekit graph dependents <name> [flags]";
        help.args_description = "<name>    CTE or table name";
        help.examples = {"ctekit graph dependents user_stats --workspace ctes/"};
        router.Register("graph", "dependents", "List CTEs that directly depend on a name",
                        bind(HandleGraphDependents), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "ctekit graph adjacency [flags]";
        help.examples = {"ctekit --json graph adjacency --workspace analytics.yaml"};
        router.Register("graph", "adjacency", "Print each CTE with its declared dependencies",
                        bind(HandleGraphAdjacency), std::move(help));
    }

    // -----------------------------------------------------------------------
    // sql
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "ctekit sql resolve <target> [flags]";
        help.args_description = "<target>    CTE to resolve";
        help.flags = {{"indent", "<n>", "Indent width of CTE bodies", false}};
        help.long_description =
            "Emits WITH <dependencies>, <target> SELECT * FROM <target>. A CTE "
            "without dependencies is printed as-is.";
        help.examples = {
            "ctekit sql resolve channel_performance --workspace analytics.yaml",
        };
        router.Register("sql", "resolve", "Build an executable query for one CTE",
                        bind(HandleSqlResolve), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "ctekit sql compose [flags]";
        help.flags = {{"indent", "<n>", "Indent width of CTE bodies", false}};
        help.long_description =
            "Prepends the CTEs reachable from the main query's dependencies to "
            "the main query.";
        help.examples = {"ctekit sql compose --workspace ctes/"};
        router.Register("sql", "compose", "Recompose the workspace main query",
                        bind(HandleSqlCompose), std::move(help));
    }

    // -----------------------------------------------------------------------
    // workspace
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "ctekit workspace list [flags]";
        help.examples = {"ctekit workspace list --workspace ctes/"};
        router.Register("workspace", "list", "List the CTEs of a workspace",
                        bind(HandleWorkspaceList), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "ctekit workspace export [--out <file>] [flags]";
        help.flags = {{"out", "<file>", "Write the JSON document to a file", false}};
        help.examples = {"ctekit workspace export --workspace ctes/ --out analytics.json"};
        router.Register("workspace", "export", "Export a workspace as JSON",
                        bind(HandleWorkspaceExport), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "ctekit workspace unpack --out <dir> [flags]";
        help.flags = {{"out", "<dir>", "Directory for the .cte.sql files", true}};
        help.long_description =
            "Writes one <name>.cte.sql file per CTE, plus main.sql when the "
            "workspace has a main query. The directory can be loaded back with "
            "--workspace <dir>.";
        help.examples = {"ctekit workspace unpack --workspace analytics.yaml --out ctes/"};
        router.Register("workspace", "unpack", "Write a workspace as a CTE directory",
                        bind(HandleWorkspaceUnpack), std::move(help));
    }
}

} // namespace ctekit
