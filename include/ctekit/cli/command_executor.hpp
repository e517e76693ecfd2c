#pragma once

#include <ctekit/cli/command_router.hpp>

#include <iosfwd>

namespace ctekit {

// Register the graph, sql and workspace commands with the router.
void RegisterAllCommands(CommandRouter& router);

// ---------------------------------------------------------------------------
// Command handlers.
//
// Each handler resolves the configuration from `args`, loads the workspace
// and writes its result to `out`, diagnostics to `err`. Exposed here for
// unit-testing with string streams; RegisterAllCommands binds them to
// std::cout / std::cerr.
//
// Returns 0 on success, otherwise Error::ExitCode() of the failure.
// ---------------------------------------------------------------------------
int HandleGraphValidate(const CommandArgs& args, std::ostream& out, std::ostream& err);
int HandleGraphOrder(const CommandArgs& args, std::ostream& out, std::ostream& err);
int HandleGraphDependents(const CommandArgs& args, std::ostream& out, std::ostream& err);
int HandleGraphAdjacency(const CommandArgs& args, std::ostream& out, std::ostream& err);
int HandleSqlResolve(const CommandArgs& args, std::ostream& out, std::ostream& err);
int HandleSqlCompose(const CommandArgs& args, std::ostream& out, std::ostream& err);
int HandleWorkspaceList(const CommandArgs& args, std::ostream& out, std::ostream& err);
int HandleWorkspaceExport(const CommandArgs& args, std::ostream& out, std::ostream& err);
int HandleWorkspaceUnpack(const CommandArgs& args, std::ostream& out, std::ostream& err);

// Print top-level help (all groups, global flags, exit codes).
// When color=true, uses ANSI escape codes for bold/dim/yellow formatting.
void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color);

} // namespace ctekit
