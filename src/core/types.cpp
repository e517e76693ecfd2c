#include <ctekit/core/types.hpp>

#include <algorithm>

namespace ctekit {

namespace {

constexpr size_t kMaxCteNameLength = 63;

bool IsAsciiLetter(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool IsIdentifierChar(char c) {
    return IsAsciiLetter(c) || (c >= '0' && c <= '9') || c == '_';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// CteName
// ---------------------------------------------------------------------------
Result<CteName, std::string> CteName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<CteName, std::string>::Err("CTE name must not be empty");
    }
    if (name.size() > kMaxCteNameLength) {
        return Result<CteName, std::string>::Err(
            "CTE name must be at most " + std::to_string(kMaxCteNameLength) +
            " characters, got " + std::to_string(name.size()));
    }
    if (!IsAsciiLetter(name[0]) && name[0] != '_') {
        return Result<CteName, std::string>::Err(
            "Invalid CTE name: " + std::string(name) +
            ". Must start with a letter or underscore");
    }
    if (!std::all_of(name.begin(), name.end(), IsIdentifierChar)) {
        return Result<CteName, std::string>::Err(
            "Invalid CTE name: " + std::string(name) +
            ". Must contain only letters, digits, and underscores");
    }
    return Result<CteName, std::string>::Ok(CteName(std::string(name)));
}

} // namespace ctekit
