#include <ctekit/graph/dependency_graph.hpp>

#include <ctekit/core/log.hpp>

#include <algorithm>
#include <unordered_map>

namespace ctekit {

namespace {

constexpr const char* kComponent = "graph";

enum class VisitState {
    InProgress,
    Done,
};

// One pending node on the explicit DFS stack.
struct Frame {
    const Cte* cte;
    size_t next_dependency;
};

// ---------------------------------------------------------------------------
// PostOrderTraversal: three-state DFS with an explicit stack.
//
// Nodes absent from `state_` are unvisited. A node is appended to `order_`
// once all of its in-map dependencies are Done, so `order_` is a valid
// definition order for everything visited so far. Each instance serves one
// call only.
// ---------------------------------------------------------------------------
class PostOrderTraversal {
public:
    PostOrderTraversal(const CteMap& ctes, std::string operation)
        : ctes_(ctes), operation_(std::move(operation)) {}

    Result<void, Error> Visit(const Cte& root);

    [[nodiscard]] NameList TakeOrder() { return std::move(order_); }

private:
    Error CycleError(const std::vector<Frame>& stack,
                     const std::string& reentered) const;

    const CteMap& ctes_;
    std::string operation_;
    std::unordered_map<std::string, VisitState> state_;
    NameList order_;
};

Result<void, Error> PostOrderTraversal::Visit(const Cte& root) {
    if (state_.count(root.name) > 0) {
        return Result<void, Error>::Ok();
    }

    std::vector<Frame> stack;
    state_[root.name] = VisitState::InProgress;
    stack.push_back({&root, 0});

    while (!stack.empty()) {
        Frame& top = stack.back();
        const auto& deps = top.cte->dependencies;

        if (top.next_dependency < deps.size()) {
            const std::string& dep_name = deps[top.next_dependency++];
            const Cte* dep = ctes_.Find(dep_name);
            if (dep == nullptr) {
                LogDebug(kComponent, "'" + top.cte->name +
                                         "' references external name '" +
                                         dep_name + "', skipped");
                continue;
            }

            auto it = state_.find(dep_name);
            if (it == state_.end()) {
                state_[dep_name] = VisitState::InProgress;
                stack.push_back({dep, 0});  // invalidates `top`
                continue;
            }
            if (it->second == VisitState::InProgress) {
                return Result<void, Error>::Err(CycleError(stack, dep_name));
            }
            continue;
        }

        state_[top.cte->name] = VisitState::Done;
        order_.push_back(top.cte->name);
        stack.pop_back();
    }
    return Result<void, Error>::Ok();
}

Error PostOrderTraversal::CycleError(const std::vector<Frame>& stack,
                                     const std::string& reentered) const {
    // The re-entered node is on the stack; the cycle runs from there to the
    // top and back to it.
    auto start = std::find_if(stack.begin(), stack.end(), [&](const Frame& f) {
        return f.cte->name == reentered;
    });
    NameList cycle;
    for (auto it = start; it != stack.end(); ++it) {
        cycle.push_back(it->cte->name);
    }
    cycle.push_back(reentered);

    auto error = Error::CircularDependency(operation_, std::move(cycle));
    LogDebug(kComponent, error.message);
    return error;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Ordering
// ---------------------------------------------------------------------------
Result<NameList, Error> OrderForTarget(std::string_view target,
                                       const CteMap& ctes) {
    const Cte* root = ctes.Find(target);
    if (root == nullptr) {
        return Result<NameList, Error>::Err(
            Error::NotFound("OrderForTarget", std::string(target)));
    }

    PostOrderTraversal traversal(ctes, "OrderForTarget");
    auto visited = traversal.Visit(*root);
    if (visited.IsErr()) {
        return Result<NameList, Error>::Err(std::move(visited).Error());
    }

    auto order = traversal.TakeOrder();
    LogDebug(kComponent, "ordered " + std::to_string(order.size()) +
                             " CTE(s) for '" + root->name + "'");
    return Result<NameList, Error>::Ok(std::move(order));
}

Result<NameList, Error> OrderForTargets(const NameList& targets,
                                        const CteMap& ctes) {
    PostOrderTraversal traversal(ctes, "OrderForTargets");
    for (const auto& target : targets) {
        const Cte* root = ctes.Find(target);
        if (root == nullptr) {
            LogDebug(kComponent, "target '" + target + "' is external, skipped");
            continue;
        }
        auto visited = traversal.Visit(*root);
        if (visited.IsErr()) {
            return Result<NameList, Error>::Err(std::move(visited).Error());
        }
    }
    return Result<NameList, Error>::Ok(traversal.TakeOrder());
}

Result<NameList, Error> OrderForAll(const CteMap& ctes) {
    PostOrderTraversal traversal(ctes, "OrderForAll");
    for (const auto& cte : ctes) {
        auto visited = traversal.Visit(cte);
        if (visited.IsErr()) {
            return Result<NameList, Error>::Err(std::move(visited).Error());
        }
    }
    return Result<NameList, Error>::Ok(traversal.TakeOrder());
}

// ---------------------------------------------------------------------------
// Cycle validation
// ---------------------------------------------------------------------------
Result<void, Error> CheckNoCycles(const CteMap& ctes) {
    PostOrderTraversal traversal(ctes, "CheckNoCycles");
    for (const auto& cte : ctes) {
        auto visited = traversal.Visit(cte);
        if (visited.IsErr()) {
            return visited;
        }
    }
    return Result<void, Error>::Ok();
}

bool ValidateNoCycles(const CteMap& ctes) {
    return CheckNoCycles(ctes).IsOk();
}

// ---------------------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------------------
NameList FindDependents(std::string_view name, const CteMap& ctes) {
    NameList dependents;
    for (const auto& cte : ctes) {
        const auto& deps = cte.dependencies;
        if (std::find(deps.begin(), deps.end(), name) != deps.end()) {
            dependents.push_back(cte.name);
        }
    }
    return dependents;
}

Adjacency AsAdjacency(const CteMap& ctes) {
    Adjacency adjacency;
    adjacency.reserve(ctes.Size());
    for (const auto& cte : ctes) {
        adjacency.emplace_back(cte.name, cte.dependencies);
    }
    return adjacency;
}

std::vector<ExternalReferences> FindExternalReferences(const CteMap& ctes) {
    std::vector<ExternalReferences> result;
    for (const auto& cte : ctes) {
        ExternalReferences refs{cte.name, {}};
        for (const auto& dep : cte.dependencies) {
            if (!ctes.Contains(dep) &&
                std::find(refs.references.begin(), refs.references.end(), dep) ==
                    refs.references.end()) {
                refs.references.push_back(dep);
            }
        }
        if (!refs.references.empty()) {
            result.push_back(std::move(refs));
        }
    }
    return result;
}

} // namespace ctekit
