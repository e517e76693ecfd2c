#pragma once

#include <ctekit/core/result.hpp>
#include <ctekit/graph/cte.hpp>

#include <string>
#include <string_view>

namespace ctekit {

struct ComposeOptions {
    // Spaces that indent each CTE body inside its `name AS (...)` block.
    int indent_width = 4;
};

// Prefix `body` with `indent` and insert `indent` after every newline.
// Blank lines are indented too, so output is byte-stable.
[[nodiscard]] std::string IndentBody(std::string_view body, std::string_view indent);

// `WITH a AS (\n    ...\n),\nb AS (\n    ...\n)` for the CTEs in `order`.
// Names in `order` that are not keys of `ctes` are skipped.
[[nodiscard]] std::string FormatWithClause(const NameList& order,
                                           const CteMap& ctes,
                                           const ComposeOptions& options = {});

// ---------------------------------------------------------------------------
// Resolve: an executable statement that evaluates `target`.
//
// With no in-map dependencies the target's query is returned verbatim.
// Otherwise the dependency closure is emitted in definition order, target
// last, followed by `SELECT * FROM <target>`. The SQL text itself is never
// inspected.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::string, Error> Resolve(std::string_view target,
                                                 const CteMap& ctes,
                                                 const ComposeOptions& options = {});

// Prepend the definitions reachable from `main_dependencies` to
// `main_query`. Returns `main_query` unchanged when none of them is a CTE
// of `ctes`.
[[nodiscard]] Result<std::string, Error> ComposeQuery(const std::string& main_query,
                                                      const NameList& main_dependencies,
                                                      const CteMap& ctes,
                                                      const ComposeOptions& options = {});

} // namespace ctekit
