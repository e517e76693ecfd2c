#pragma once

#include <ctekit/core/result.hpp>
#include <ctekit/graph/cte.hpp>
#include <ctekit/workspace/workspace.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace ctekit {

// ---------------------------------------------------------------------------
// Workspace sources.
//
// YAML / JSON document:
//   name: analytics
//   main:
//     query: SELECT ... FROM user_stats
//     dependencies: [user_stats]
//   ctes:
//     - name: user_stats
//       query: SELECT ...
//       dependencies: []
//       description: optional
//       columns: [{name: user_id, type: INTEGER, nullable: false}]
//
// CTE directory: one `<name>.sql` (or `<name>.cte.sql`) file per CTE in the
// header-comment format of ParseCteFile, plus an optional `main.sql`.
// Files are read in filename order.
//
// Every CTE name must satisfy CteName::Create and be unique.
// ---------------------------------------------------------------------------

[[nodiscard]] Result<Workspace, Error> LoadWorkspaceYaml(std::string_view path);
[[nodiscard]] Result<Workspace, Error> LoadWorkspaceJson(std::string_view path);
[[nodiscard]] Result<Workspace, Error> LoadCteDirectory(std::string_view path);

// Dispatch on `.yaml` / `.yml`, `.json`, or a directory.
[[nodiscard]] Result<Workspace, Error> LoadWorkspace(std::string_view path);

// Parse one CTE file:
//   /* name: user_stats */
//   /* description: orders per user */
//   /* dependencies: ["orders_clean"] */
//   SELECT ...
// Header comments are optional; the name falls back to `fallback_name`.
[[nodiscard]] Result<Cte, Error> ParseCteFile(std::string_view text,
                                              std::string_view fallback_name);

// Inverse of ParseCteFile.
[[nodiscard]] std::string FormatCteFile(const Cte& cte);

// Same document structure LoadWorkspaceJson reads.
[[nodiscard]] nlohmann::json WorkspaceToJson(const Workspace& workspace);

} // namespace ctekit
