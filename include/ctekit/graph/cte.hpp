#pragma once

#include <ctekit/core/result.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ctekit {

using NameList = std::vector<std::string>;

struct ColumnInfo {
    std::string name;
    std::string type;
    bool nullable = true;

    bool operator==(const ColumnInfo& other) const {
        return name == other.name && type == other.type &&
               nullable == other.nullable;
    }
};

// A named query fragment. Graph algorithms only read name, query and
// dependencies; description and columns are carried for callers.
struct Cte {
    std::string name;
    std::string query;
    NameList dependencies;
    std::optional<std::string> description;
    std::vector<ColumnInfo> columns;
};

// ---------------------------------------------------------------------------
// CteMap: name -> Cte with unique keys, iterated in insertion order.
//
// Insertion order is the "mapping order" every whole-map operation follows,
// so two maps built from the same sequence produce identical results.
// ---------------------------------------------------------------------------
class CteMap {
public:
    using const_iterator = std::vector<Cte>::const_iterator;

    CteMap() = default;

    // Build a map from a list; fails on an empty or duplicate name.
    static Result<CteMap, Error> FromList(std::vector<Cte> ctes);

    // Append a new CTE. Fails with InvalidName / DuplicateName.
    Result<void, Error> Add(Cte cte);

    // Insert or replace by name. A replaced entry keeps its position.
    Result<void, Error> Upsert(Cte cte);

    [[nodiscard]] const Cte* Find(std::string_view name) const;
    [[nodiscard]] bool Contains(std::string_view name) const;

    [[nodiscard]] size_t Size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] NameList Names() const;

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

private:
    std::vector<Cte> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace ctekit
