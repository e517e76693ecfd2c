#include <ctekit/cli/command_router.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <set>

namespace ctekit {

namespace {

bool HasJsonFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

void PrintJsonError(const std::string& message, std::ostream& out) {
    nlohmann::json j;
    j["error"]["category"] = "usage";
    j["error"]["message"] = message;
    out << j.dump() << "\n";
}

// Consume the flag at argv[i] into `flags`; returns the index of the next
// unconsumed token.
int ConsumeFlag(int argc, const char* const* argv, int i,
                std::map<std::string, std::string>& flags) {
    std::string_view arg{argv[i]};
    if (arg == "-v") {
        flags["verbose"] = "1";
        return i + 1;
    }
    if (arg == "-vv") {
        flags["verbose"] = "2";
        return i + 1;
    }
    if (arg == "-q") {
        flags["quiet"] = "true";
        return i + 1;
    }
    if (arg == "-h") {
        flags["help"] = "true";
        return i + 1;
    }

    auto eq = arg.find('=');
    if (eq != std::string_view::npos) {
        flags[std::string(arg.substr(2, eq - 2))] = std::string(arg.substr(eq + 1));
        return i + 1;
    }
    auto key = std::string(arg.substr(2));
    if (CommandRouter::IsBooleanFlag(arg)) {
        flags[key] = "true";
        return i + 1;
    }
    if (i + 1 < argc && std::string_view{argv[i + 1]}.substr(0, 1) != "-") {
        flags[key] = argv[i + 1];
        return i + 2;
    }
    flags[key] = "true";
    return i + 1;
}

bool IsFlagToken(std::string_view arg) {
    return arg.substr(0, 2) == "--" || arg == "-v" || arg == "-vv" ||
           arg == "-q" || arg == "-h";
}

} // namespace

bool CommandRouter::IsBooleanFlag(std::string_view arg) {
    return arg == "--color" || arg == "--no-color" || arg == "--json" ||
           arg == "--help" || arg == "--quiet" || arg == "--version" ||
           arg == "--all";
}

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler) {
    CommandInfo info;
    info.group = group;
    info.action = action;
    info.description = description;
    info.handler = std::move(handler);
    commands_[group + ":" + action] = std::move(info);
}

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler,
                             CommandHelp help) {
    CommandInfo info;
    info.group = group;
    info.action = action;
    info.description = description;
    info.handler = std::move(handler);
    info.help = std::move(help);
    commands_[group + ":" + action] = std::move(info);
}

void CommandRouter::SetGroupDescription(const std::string& group,
                                        const std::string& description) {
    group_descriptions_[group] = description;
}

void CommandRouter::SetGroupExamples(const std::string& group,
                                     std::vector<std::string> examples) {
    group_examples_[group] = std::move(examples);
}

int CommandRouter::Dispatch(int argc, const char* const* argv) const {
    const bool json_mode = HasJsonFlag(argc, argv);
    auto parse_result = Parse(argc, argv);
    if (parse_result.IsErr()) {
        if (json_mode) {
            PrintJsonError(parse_result.Error(), std::cerr);
        } else {
            std::cerr << "Error: " << parse_result.Error() << "\n";
            PrintHelp(std::cerr);
        }
        return 1;
    }
    const auto args = std::move(parse_result).Value();

    if (!HasGroup(args.group)) {
        if (json_mode) {
            PrintJsonError("Unknown command group '" + args.group + "'", std::cerr);
        } else {
            std::cerr << "Error: unknown command group '" << args.group << "'\n";
            PrintHelp(std::cerr);
        }
        return 1;
    }

    // "ctekit graph", "ctekit graph --help", "ctekit graph help"
    if (args.action.empty() || args.action == "help") {
        PrintGroupHelp(args.group, std::cout);
        return 0;
    }

    auto it = commands_.find(args.group + ":" + args.action);
    if (it == commands_.end()) {
        if (json_mode) {
            PrintJsonError("Unknown command '" + args.group + " " + args.action + "'",
                           std::cerr);
        } else {
            std::cerr << "Error: unknown command '" << args.group << " "
                      << args.action << "'\n";
            PrintGroupHelp(args.group, std::cerr);
        }
        return 1;
    }

    if (args.flags.count("help") > 0) {
        PrintCommandHelp(args.group, args.action, std::cout);
        return 0;
    }

    return it->second.handler(args);
}

Result<CommandArgs, std::string> CommandRouter::Parse(
    int argc, const char* const* argv) {
    CommandArgs args;

    // Skip argv[0] (program name). The first two non-flag tokens are the
    // group and the action; flags may be interleaved anywhere.
    int i = 1;
    while (i < argc) {
        std::string_view arg{argv[i]};
        if (IsFlagToken(arg)) {
            i = ConsumeFlag(argc, argv, i, args.flags);
            continue;
        }
        if (args.group.empty()) {
            args.group = std::string(arg);
        } else if (args.action.empty()) {
            args.action = std::string(arg);
        } else {
            args.positional.emplace_back(arg);
        }
        ++i;
    }

    if (args.group.empty()) {
        return Result<CommandArgs, std::string>::Err(
            "Missing command group. Usage: ctekit <group> <action> [args]");
    }
    return Result<CommandArgs, std::string>::Ok(std::move(args));
}

std::vector<std::string> CommandRouter::Groups() const {
    std::set<std::string> groups;
    for (const auto& [key, info] : commands_) {
        groups.insert(info.group);
    }
    return {groups.begin(), groups.end()};
}

bool CommandRouter::HasGroup(const std::string& group) const {
    return std::any_of(commands_.begin(), commands_.end(),
                       [&](const auto& entry) { return entry.second.group == group; });
}

std::vector<CommandInfo> CommandRouter::CommandsForGroup(
    const std::string& group) const {
    // commands_ is keyed "group:action", so actions come out sorted.
    std::vector<CommandInfo> result;
    for (const auto& [key, info] : commands_) {
        if (info.group == group) {
            result.push_back(info);
        }
    }
    return result;
}

std::string CommandRouter::GroupDescription(const std::string& group) const {
    auto it = group_descriptions_.find(group);
    return (it != group_descriptions_.end()) ? it->second : "";
}

std::vector<std::string> CommandRouter::GroupExamples(const std::string& group) const {
    auto it = group_examples_.find(group);
    return (it != group_examples_.end()) ? it->second : std::vector<std::string>{};
}

void CommandRouter::PrintHelp(std::ostream& out) const {
    out << "\nUsage: ctekit <group> <action> [options]\n\n";
    out << "Available commands:\n";

    for (const auto& group : Groups()) {
        out << "\n  " << group << ":\n";
        for (const auto& cmd : CommandsForGroup(group)) {
            out << "    " << cmd.action;
            if (!cmd.description.empty()) {
                out << " - " << cmd.description;
            }
            out << "\n";
        }
    }
    out << "\n";
}

void CommandRouter::PrintGroupHelp(const std::string& group,
                                   std::ostream& out) const {
    auto desc = GroupDescription(group);
    if (desc.empty()) {
        desc = group;
    }
    out << "ctekit " << group << " - " << desc << "\n";

    out << "\nActions:\n";
    auto cmds = CommandsForGroup(group);
    size_t max_len = 0;
    for (const auto& cmd : cmds) {
        max_len = std::max(max_len, cmd.action.size());
    }
    for (const auto& cmd : cmds) {
        out << "  " << cmd.action;
        out << std::string(max_len - cmd.action.size() + 6, ' ');
        out << cmd.description << "\n";
    }

    auto examples = GroupExamples(group);
    if (!examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : examples) {
            out << "  " << ex << "\n";
        }
    }

    out << "\nUse \"ctekit " << group
        << " <action> --help\" for details on a specific action.\n";
}

void CommandRouter::PrintCommandHelp(const std::string& group,
                                     const std::string& action,
                                     std::ostream& out) const {
    auto it = commands_.find(group + ":" + action);
    if (it == commands_.end()) {
        out << "Error: unknown command '" << group << " " << action << "'\n";
        return;
    }

    const auto& cmd = it->second;
    out << "ctekit " << group << " " << action << " - " << cmd.description << "\n";

    if (!cmd.help) {
        out << "\nNo detailed help available for this command.\n";
        return;
    }
    const auto& help = *cmd.help;

    if (!help.usage.empty()) {
        out << "\nUsage:\n  " << help.usage << "\n";
    }
    if (!help.args_description.empty()) {
        out << "\nArguments:\n  " << help.args_description << "\n";
    }

    if (!help.flags.empty()) {
        out << "\nFlags:\n";
        std::vector<std::string> flag_displays;
        size_t max_len = 0;
        for (const auto& f : help.flags) {
            std::string display = "--" + f.name;
            if (!f.placeholder.empty()) {
                display += " " + f.placeholder;
            }
            max_len = std::max(max_len, display.size());
            flag_displays.push_back(std::move(display));
        }
        for (size_t i = 0; i < help.flags.size(); ++i) {
            out << "  " << flag_displays[i];
            out << std::string(max_len - flag_displays[i].size() + 4, ' ');
            out << help.flags[i].description;
            if (help.flags[i].required) {
                out << " (required)";
            }
            out << "\n";
        }
    }

    if (!help.long_description.empty()) {
        out << "\n" << help.long_description << "\n";
    }

    if (!help.examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : help.examples) {
            out << "  " << ex << "\n";
        }
    }
}

} // namespace ctekit
