#include <ctekit/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace ctekit {

namespace {

std::string JoinCycle(const std::vector<std::string>& cycle) {
    std::string joined;
    for (const auto& name : cycle) {
        if (!joined.empty()) {
            joined += " -> ";
        }
        joined += name;
    }
    return joined;
}

} // anonymous namespace

Error Error::NotFound(const std::string& operation, const std::string& name) {
    return Error{operation, name, "CTE not found: " + name,
                 ErrorCategory::NotFound, {}};
}

Error Error::CircularDependency(const std::string& operation,
                                std::vector<std::string> cycle) {
    // The node that closed the cycle is the last entry on the path.
    std::string subject = cycle.empty() ? std::string{} : cycle.back();
    std::string message = "Circular dependency detected";
    if (!cycle.empty()) {
        message += ": " + JoinCycle(cycle);
    }
    return Error{operation, std::move(subject), std::move(message),
                 ErrorCategory::CircularDependency, std::move(cycle)};
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::NotFound:           return 2;
        case ErrorCategory::CircularDependency: return 3;
        case ErrorCategory::InvalidName:        return 4;
        case ErrorCategory::DuplicateName:      return 4;
        case ErrorCategory::Parse:              return 5;
        case ErrorCategory::Io:                 return 6;
        case ErrorCategory::Config:             return 7;
        case ErrorCategory::Internal:           return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::NotFound:           return "not_found";
        case ErrorCategory::CircularDependency: return "circular_dependency";
        case ErrorCategory::InvalidName:        return "invalid_name";
        case ErrorCategory::DuplicateName:      return "duplicate_name";
        case ErrorCategory::Parse:              return "parse";
        case ErrorCategory::Io:                 return "io";
        case ErrorCategory::Config:             return "config";
        case ErrorCategory::Internal:           return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!subject.empty()) {
        oss << " [" << subject << "]";
    }
    oss << ": " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!subject.empty()) {
        body["subject"] = subject;
    }
    body["message"] = message;
    if (!cycle.empty()) {
        body["cycle"] = cycle;
    }
    body["exit_code"] = ExitCode();

    nlohmann::json j;
    j["error"] = std::move(body);
    return j.dump();
}

} // namespace ctekit
