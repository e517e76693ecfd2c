#pragma once

#include <ctekit/core/result.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace ctekit {

// ---------------------------------------------------------------------------
// OutputFormatter: human-readable and JSON output for CLI commands.
//
// All output methods write to the configured streams. When color_mode is
// true and json_mode is false, tables are rendered with FTXUI and messages
// carry ANSI escape codes.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // In JSON mode, outputs an array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // One item per line, or a JSON array of strings.
    void PrintList(const std::vector<std::string>& items) const;

    // Text printed as-is in both modes (generated SQL).
    void PrintText(const std::string& text) const;

    void PrintJson(const nlohmann::json& json) const;

    void PrintError(const Error& error) const;

    void PrintWarning(const std::string& message) const;

    void PrintSuccess(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace ctekit
