#pragma once

#include <ctekit/core/result.hpp>
#include <ctekit/graph/cte.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ctekit {

// (name, declared dependency list) pairs in mapping order, lists unfiltered.
using Adjacency = std::vector<std::pair<std::string, NameList>>;

// A CTE together with the dependency names it declares that are not keys
// of the map (tables or CTEs outside the resolvable universe).
struct ExternalReferences {
    std::string name;
    NameList references;
};

// ---------------------------------------------------------------------------
// Dependency graph operations.
//
// All functions are pure: the graph is derived from `ctes` on every call,
// traversal state lives on the call's stack, and nothing is retained.
// An edge A -> B exists iff B is listed in A.dependencies and B is a key of
// `ctes`; other dependency names are skipped without error.
// ---------------------------------------------------------------------------

// Definition order for `target`: every dependency before its dependents,
// `target` last. Fails with NotFound when `target` is not a key and with
// CircularDependency when a cycle is reachable from it.
[[nodiscard]] Result<NameList, Error> OrderForTarget(
    std::string_view target, const CteMap& ctes);

// One traversal seeded from each of `targets` in turn. Targets that are not
// keys of `ctes` are treated as external and skipped.
[[nodiscard]] Result<NameList, Error> OrderForTargets(
    const NameList& targets, const CteMap& ctes);

// Definition order covering every CTE, seeded in mapping order.
[[nodiscard]] Result<NameList, Error> OrderForAll(const CteMap& ctes);

// Visits every node; returns the CircularDependency error of the first
// cycle found, in mapping order.
[[nodiscard]] Result<void, Error> CheckNoCycles(const CteMap& ctes);

// true iff the whole map is acyclic.
[[nodiscard]] bool ValidateNoCycles(const CteMap& ctes);

// CTEs whose dependency list contains `name`, in mapping order.
// Direct dependents only.
[[nodiscard]] NameList FindDependents(std::string_view name, const CteMap& ctes);

[[nodiscard]] Adjacency AsAdjacency(const CteMap& ctes);

// CTEs with at least one dependency name that is not a key of `ctes`,
// in mapping order.
[[nodiscard]] std::vector<ExternalReferences> FindExternalReferences(
    const CteMap& ctes);

} // namespace ctekit
