#include <ctekit/compose/sql_composer.hpp>

#include <ctekit/core/log.hpp>
#include <ctekit/graph/dependency_graph.hpp>

#include <algorithm>

namespace ctekit {

namespace {

constexpr const char* kComponent = "compose";

std::string Indent(const ComposeOptions& options) {
    return std::string(static_cast<size_t>(std::max(options.indent_width, 0)), ' ');
}

} // anonymous namespace

std::string IndentBody(std::string_view body, std::string_view indent) {
    std::string out;
    out.reserve(body.size() + indent.size());
    out.append(indent);
    for (char c : body) {
        out.push_back(c);
        if (c == '\n') {
            out.append(indent);
        }
    }
    return out;
}

std::string FormatWithClause(const NameList& order, const CteMap& ctes,
                             const ComposeOptions& options) {
    const auto indent = Indent(options);
    std::string sql = "WITH ";
    bool first = true;
    for (const auto& name : order) {
        const Cte* cte = ctes.Find(name);
        if (cte == nullptr) {
            continue;
        }
        if (!first) {
            sql += ",\n";
        }
        first = false;
        sql += cte->name;
        sql += " AS (\n";
        sql += IndentBody(cte->query, indent);
        sql += "\n)";
    }
    return sql;
}

Result<std::string, Error> Resolve(std::string_view target, const CteMap& ctes,
                                   const ComposeOptions& options) {
    auto order = OrderForTarget(target, ctes);
    if (order.IsErr()) {
        auto error = std::move(order).Error();
        error.operation = "Resolve";
        return Result<std::string, Error>::Err(std::move(error));
    }

    const auto& names = order.Value();
    const Cte* root = ctes.Find(target);
    if (names.size() == 1) {
        LogDebug(kComponent, "'" + root->name + "' has no resolvable dependencies");
        return Result<std::string, Error>::Ok(root->query);
    }

    LogInfo(kComponent, "resolved '" + root->name + "' with " +
                            std::to_string(names.size() - 1) + " dependency CTE(s)");
    return Result<std::string, Error>::Ok(
        FormatWithClause(names, ctes, options) + "\nSELECT * FROM " + root->name);
}

Result<std::string, Error> ComposeQuery(const std::string& main_query,
                                        const NameList& main_dependencies,
                                        const CteMap& ctes,
                                        const ComposeOptions& options) {
    auto order = OrderForTargets(main_dependencies, ctes);
    if (order.IsErr()) {
        auto error = std::move(order).Error();
        error.operation = "ComposeQuery";
        return Result<std::string, Error>::Err(std::move(error));
    }
    if (order.Value().empty()) {
        return Result<std::string, Error>::Ok(main_query);
    }

    LogInfo(kComponent, "composed main query with " +
                            std::to_string(order.Value().size()) + " CTE(s)");
    return Result<std::string, Error>::Ok(
        FormatWithClause(order.Value(), ctes, options) + "\n" + main_query);
}

} // namespace ctekit
