#pragma once

#include <ctekit/graph/cte.hpp>

#include <string>

namespace ctekit {

// A decomposed query: the main query plus the CTEs it is built from.
// `main_dependencies` lists the names the main query reads; names that are
// not CTEs of `ctes` are ordinary tables.
struct Workspace {
    std::string name;
    std::string main_query;
    NameList main_dependencies;
    CteMap ctes;

    [[nodiscard]] bool HasMainQuery() const { return !main_query.empty(); }
};

} // namespace ctekit
