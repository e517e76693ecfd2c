#pragma once

#include <optional>
#include <string>

namespace ctekit {

inline constexpr int kDefaultIndentWidth = 4;

struct AppConfig {
    std::string workspace_path;          // YAML, JSON or CTE directory
    std::optional<int> indent_width;     // unset: kDefaultIndentWidth
    std::optional<std::string> log_file;
    bool json_output = false;
    int verbose = 0;                     // 0 = warn, 1 = info (-v), 2 = debug (-vv)
    bool quiet = false;
    std::optional<bool> color;           // unset: decided from the terminal
};

} // namespace ctekit
