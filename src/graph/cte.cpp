#include <ctekit/graph/cte.hpp>

namespace ctekit {

namespace {

Error MakeEmptyNameError(const std::string& operation) {
    return Error{operation, "", "CTE name must not be empty",
                 ErrorCategory::InvalidName, {}};
}

} // anonymous namespace

Result<CteMap, Error> CteMap::FromList(std::vector<Cte> ctes) {
    CteMap map;
    for (auto& cte : ctes) {
        auto added = map.Add(std::move(cte));
        if (added.IsErr()) {
            return Result<CteMap, Error>::Err(std::move(added).Error());
        }
    }
    return Result<CteMap, Error>::Ok(std::move(map));
}

Result<void, Error> CteMap::Add(Cte cte) {
    if (cte.name.empty()) {
        return Result<void, Error>::Err(MakeEmptyNameError("CteMap::Add"));
    }
    if (index_.count(cte.name) > 0) {
        return Result<void, Error>::Err(Error{
            "CteMap::Add", cte.name, "Duplicate CTE name: " + cte.name,
            ErrorCategory::DuplicateName, {}});
    }
    index_.emplace(cte.name, entries_.size());
    entries_.push_back(std::move(cte));
    return Result<void, Error>::Ok();
}

Result<void, Error> CteMap::Upsert(Cte cte) {
    if (cte.name.empty()) {
        return Result<void, Error>::Err(MakeEmptyNameError("CteMap::Upsert"));
    }
    auto it = index_.find(cte.name);
    if (it != index_.end()) {
        entries_[it->second] = std::move(cte);
        return Result<void, Error>::Ok();
    }
    index_.emplace(cte.name, entries_.size());
    entries_.push_back(std::move(cte));
    return Result<void, Error>::Ok();
}

const Cte* CteMap::Find(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

bool CteMap::Contains(std::string_view name) const {
    return index_.count(std::string(name)) > 0;
}

NameList CteMap::Names() const {
    NameList names;
    names.reserve(entries_.size());
    for (const auto& cte : entries_) {
        names.push_back(cte.name);
    }
    return names;
}

} // namespace ctekit
