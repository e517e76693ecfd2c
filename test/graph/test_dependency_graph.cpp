#include <catch2/catch_test_macros.hpp>

#include <ctekit/graph/dependency_graph.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace ctekit;

namespace {

struct Def {
    std::string name;
    NameList deps;
};

CteMap MakeMap(const std::vector<Def>& defs) {
    std::vector<Cte> ctes;
    for (const auto& def : defs) {
        Cte cte;
        cte.name = def.name;
        cte.query = "SELECT * FROM src_" + def.name;
        cte.dependencies = def.deps;
        ctes.push_back(std::move(cte));
    }
    return CteMap::FromList(std::move(ctes)).Value();
}

size_t IndexOf(const NameList& order, const std::string& name) {
    return static_cast<size_t>(
        std::find(order.begin(), order.end(), name) - order.begin());
}

// Every in-map dependency appears before its dependent, names are unique.
void RequireValidOrder(const NameList& order, const CteMap& ctes) {
    for (const auto& name : order) {
        CHECK(std::count(order.begin(), order.end(), name) == 1);
        const Cte* cte = ctes.Find(name);
        REQUIRE(cte != nullptr);
        for (const auto& dep : cte->dependencies) {
            if (ctes.Contains(dep)) {
                REQUIRE(IndexOf(order, dep) < order.size());
                CHECK(IndexOf(order, dep) < IndexOf(order, name));
            }
        }
    }
}

// The funnel example: channel_performance reads session_data and
// funnel_analysis, funnel_analysis reads conversion_events.
CteMap FunnelMap() {
    return MakeMap({
        {"session_data", {}},
        {"conversion_events", {}},
        {"funnel_analysis", {"conversion_events"}},
        {"channel_performance", {"session_data", "funnel_analysis"}},
    });
}

} // anonymous namespace

// ===========================================================================
// OrderForTarget
// ===========================================================================

TEST_CASE("OrderForTarget: single CTE without dependencies", "[graph][order]") {
    auto ctes = MakeMap({{"a", {}}});
    auto r = OrderForTarget("a", ctes);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == NameList{"a"});
}

TEST_CASE("OrderForTarget: dependencies precede the target", "[graph][order]") {
    auto ctes = FunnelMap();
    auto r = OrderForTarget("channel_performance", ctes);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == NameList{"session_data", "conversion_events",
                                "funnel_analysis", "channel_performance"});
    RequireValidOrder(r.Value(), ctes);
}

TEST_CASE("OrderForTarget: only the target's closure is included", "[graph][order]") {
    auto ctes = FunnelMap();
    auto r = OrderForTarget("funnel_analysis", ctes);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == NameList{"conversion_events", "funnel_analysis"});
}

TEST_CASE("OrderForTarget: diamond visits shared dependency once", "[graph][order]") {
    auto ctes = MakeMap({
        {"base", {}},
        {"left", {"base"}},
        {"right", {"base"}},
        {"top", {"left", "right"}},
    });
    auto r = OrderForTarget("top", ctes);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == NameList{"base", "left", "right", "top"});
}

TEST_CASE("OrderForTarget: follows declaration order of dependencies", "[graph][order]") {
    auto ctes = MakeMap({{"x", {}}, {"y", {}}, {"t", {"y", "x"}}});
    auto r = OrderForTarget("t", ctes);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == NameList{"y", "x", "t"});
}

TEST_CASE("OrderForTarget: dangling dependency names are skipped", "[graph][order]") {
    auto ctes = MakeMap({
        {"cte1", {"missing_cte"}},
        {"cte2", {"orders", "cte1", "customers"}},
    });

    auto r1 = OrderForTarget("cte1", ctes);
    REQUIRE(r1.IsOk());
    CHECK(r1.Value() == NameList{"cte1"});

    auto r2 = OrderForTarget("cte2", ctes);
    REQUIRE(r2.IsOk());
    CHECK(r2.Value() == NameList{"cte1", "cte2"});
}

TEST_CASE("OrderForTarget: unknown target fails with NotFound", "[graph][order]") {
    auto ctes = MakeMap({{"a", {}}});
    auto r = OrderForTarget("x", ctes);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NotFound);
    CHECK(r.Error().subject == "x");
    CHECK(r.Error().operation == "OrderForTarget");
    CHECK(r.Error().ExitCode() == 2);
}

TEST_CASE("OrderForTarget: empty map fails with NotFound", "[graph][order]") {
    CteMap ctes;
    auto r = OrderForTarget("a", ctes);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NotFound);
}

TEST_CASE("OrderForTarget: names are case-sensitive", "[graph][order]") {
    auto ctes = MakeMap({{"Orders", {}}, {"t", {"orders"}}});
    CHECK(OrderForTarget("orders", ctes).IsErr());

    auto r = OrderForTarget("t", ctes);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == NameList{"t"});
}

TEST_CASE("OrderForTarget: repeated calls give identical results", "[graph][order]") {
    auto ctes = FunnelMap();
    auto first = OrderForTarget("channel_performance", ctes);
    auto second = OrderForTarget("channel_performance", ctes);
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    CHECK(first.Value() == second.Value());
}

TEST_CASE("OrderForTarget: deep chain does not exhaust the stack", "[graph][order]") {
    constexpr int kDepth = 20000;
    std::vector<Def> defs;
    defs.push_back({"c0", {}});
    for (int i = 1; i < kDepth; ++i) {
        defs.push_back({"c" + std::to_string(i), {"c" + std::to_string(i - 1)}});
    }
    auto ctes = MakeMap(defs);

    auto r = OrderForTarget("c" + std::to_string(kDepth - 1), ctes);
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().size() == static_cast<size_t>(kDepth));
    CHECK(r.Value().front() == "c0");
    CHECK(r.Value().back() == "c" + std::to_string(kDepth - 1));
}

// ===========================================================================
// Cycles
// ===========================================================================

TEST_CASE("Cycles: two-node cycle", "[graph][cycle]") {
    auto ctes = MakeMap({{"a", {"b"}}, {"b", {"a"}}});

    CHECK_FALSE(ValidateNoCycles(ctes));

    auto r = OrderForTarget("a", ctes);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::CircularDependency);
    CHECK(r.Error().cycle == NameList{"a", "b", "a"});
    CHECK(r.Error().ExitCode() == 3);
}

TEST_CASE("Cycles: three-node cycle reports the full path", "[graph][cycle]") {
    auto ctes = MakeMap({{"a", {"b"}}, {"b", {"c"}}, {"c", {"a"}}});
    auto r = OrderForTarget("b", ctes);
    REQUIRE(r.IsErr());
    CHECK(r.Error().cycle == NameList{"b", "c", "a", "b"});
    CHECK(r.Error().message == "Circular dependency detected: b -> c -> a -> b");
}

TEST_CASE("Cycles: path starts at the re-entered node", "[graph][cycle]") {
    auto ctes = MakeMap({{"entry", {"a"}}, {"a", {"b"}}, {"b", {"a"}}});
    auto r = OrderForTarget("entry", ctes);
    REQUIRE(r.IsErr());
    CHECK(r.Error().cycle == NameList{"a", "b", "a"});
    CHECK(r.Error().subject == "a");
}

TEST_CASE("Cycles: self-loop", "[graph][cycle]") {
    auto ctes = MakeMap({{"x", {"x"}}});
    CHECK_FALSE(ValidateNoCycles(ctes));

    auto r = OrderForTarget("x", ctes);
    REQUIRE(r.IsErr());
    CHECK(r.Error().cycle == NameList{"x", "x"});
}

TEST_CASE("Cycles: disconnected cycle", "[graph][cycle]") {
    auto ctes = MakeMap({{"a", {}}, {"b", {"c"}}, {"c", {"b"}}});

    SECTION("does not affect unrelated targets") {
        auto r = OrderForTarget("a", ctes);
        REQUIRE(r.IsOk());
        CHECK(r.Value() == NameList{"a"});
    }
    SECTION("is found by whole-map validation") {
        CHECK_FALSE(ValidateNoCycles(ctes));
        auto check = CheckNoCycles(ctes);
        REQUIRE(check.IsErr());
        CHECK(check.Error().operation == "CheckNoCycles");
        CHECK(check.Error().cycle == NameList{"b", "c", "b"});
    }
    SECTION("fails OrderForAll") {
        auto r = OrderForAll(ctes);
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::CircularDependency);
    }
}

TEST_CASE("Cycles: acyclic maps validate", "[graph][cycle]") {
    CHECK(ValidateNoCycles(CteMap{}));
    CHECK(ValidateNoCycles(FunnelMap()));
    CHECK(CheckNoCycles(FunnelMap()).IsOk());
}

TEST_CASE("Cycles: an edge through a dangling name is not a cycle", "[graph][cycle]") {
    auto ctes = MakeMap({{"a", {"ghost"}}, {"b", {"a", "ghost"}}});
    CHECK(ValidateNoCycles(ctes));
}

// ===========================================================================
// OrderForTargets / OrderForAll
// ===========================================================================

TEST_CASE("OrderForTargets: merges closures without duplicates", "[graph][order]") {
    auto ctes = FunnelMap();
    auto r = OrderForTargets({"funnel_analysis", "channel_performance"}, ctes);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == NameList{"conversion_events", "funnel_analysis",
                                "session_data", "channel_performance"});
    RequireValidOrder(r.Value(), ctes);
}

TEST_CASE("OrderForTargets: external targets are skipped", "[graph][order]") {
    auto ctes = FunnelMap();
    auto r = OrderForTargets({"users", "session_data"}, ctes);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == NameList{"session_data"});

    auto none = OrderForTargets({"users", "events"}, ctes);
    REQUIRE(none.IsOk());
    CHECK(none.Value().empty());
}

TEST_CASE("OrderForAll: covers every CTE in a valid order", "[graph][order]") {
    auto ctes = MakeMap({
        {"report", {"daily", "weekly"}},
        {"weekly", {"daily"}},
        {"daily", {"raw_events"}},
        {"unused", {}},
    });
    auto r = OrderForAll(ctes);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == NameList{"daily", "weekly", "report", "unused"});
    RequireValidOrder(r.Value(), ctes);
}

// ===========================================================================
// Introspection
// ===========================================================================

TEST_CASE("FindDependents: direct dependents in mapping order", "[graph][dependents]") {
    auto ctes = MakeMap({{"a", {"b"}}, {"b", {}}, {"c", {}}});
    CHECK(FindDependents("b", ctes) == NameList{"a"});
    CHECK(FindDependents("a", ctes).empty());
}

TEST_CASE("FindDependents: not transitive, works for external names", "[graph][dependents]") {
    auto ctes = FunnelMap();
    CHECK(FindDependents("conversion_events", ctes) == NameList{"funnel_analysis"});

    auto with_tables = MakeMap({{"x", {"orders"}}, {"y", {"orders", "x"}}});
    CHECK(FindDependents("orders", with_tables) == NameList{"x", "y"});
    CHECK(FindDependents("nothing", with_tables).empty());
}

TEST_CASE("AsAdjacency: keeps declared lists unfiltered", "[graph][adjacency]") {
    auto ctes = MakeMap({{"b", {"a", "orders"}}, {"a", {}}});
    auto adjacency = AsAdjacency(ctes);
    REQUIRE(adjacency.size() == 2);
    CHECK(adjacency[0].first == "b");
    CHECK(adjacency[0].second == NameList{"a", "orders"});
    CHECK(adjacency[1].first == "a");
    CHECK(adjacency[1].second.empty());
}

TEST_CASE("AsAdjacency: follows mapping order, not name order", "[graph][adjacency]") {
    auto ctes = FunnelMap();
    auto adjacency = AsAdjacency(ctes);
    NameList names;
    for (const auto& entry : adjacency) {
        names.push_back(entry.first);
    }
    CHECK(names == ctes.Names());
}

TEST_CASE("FindExternalReferences: lists dangling names once", "[graph][adjacency]") {
    auto ctes = MakeMap({
        {"a", {"orders", "b", "orders"}},
        {"b", {}},
        {"c", {"customers"}},
    });
    auto refs = FindExternalReferences(ctes);
    REQUIRE(refs.size() == 2);
    CHECK(refs[0].name == "a");
    CHECK(refs[0].references == NameList{"orders"});
    CHECK(refs[1].name == "c");
    CHECK(refs[1].references == NameList{"customers"});
}
