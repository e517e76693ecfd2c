#pragma once

#include <ctekit/core/result.hpp>

#include <string>
#include <string_view>

namespace ctekit {

// ---------------------------------------------------------------------------
// CteName: validated CTE identifier.
//
// Rules:
//   - Non-empty, max 63 characters (PostgreSQL NAMEDATALEN - 1)
//   - Starts with an ASCII letter or underscore
//   - Remaining characters are ASCII letters, digits or underscores
//   - Case is preserved; comparison is case-sensitive
// ---------------------------------------------------------------------------
class CteName {
public:
    static Result<CteName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const CteName& other) const { return value_ == other.value_; }
    bool operator!=(const CteName& other) const { return value_ != other.value_; }

    CteName(const CteName&) = default;
    CteName& operator=(const CteName&) = default;
    CteName(CteName&&) noexcept = default;
    CteName& operator=(CteName&&) noexcept = default;

private:
    explicit CteName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace ctekit
