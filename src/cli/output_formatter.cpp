#include <ctekit/cli/output_formatter.hpp>
#include <ctekit/core/ansi.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace ctekit {

namespace {

using namespace ctekit::ansi;

std::string JoinCycle(const std::vector<std::string>& cycle) {
    std::string out;
    for (const auto& name : cycle) {
        if (!out.empty()) out += " -> ";
        out += name;
    }
    return out;
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto arr = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            arr.push_back(std::move(obj));
        }
        out_ << arr.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    // Plain table: compute column widths.
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::left << std::setw(static_cast<int>(widths[c])) << headers[c];
    }
    out_ << "\n";

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";

    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
        }
        out_ << "\n";
    }
}

void OutputFormatter::PrintList(const std::vector<std::string>& items) const {
    if (json_mode_) {
        out_ << nlohmann::json(items).dump() << "\n";
        return;
    }
    for (const auto& item : items) {
        out_ << item << "\n";
    }
}

void OutputFormatter::PrintText(const std::string& text) const {
    out_ << text << "\n";
}

void OutputFormatter::PrintJson(const nlohmann::json& json) const {
    out_ << json.dump(2) << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset << kBold << error.operation << kReset;
        if (!error.subject.empty()) {
            err_ << kDim << " [" << error.subject << "]" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        if (!error.cycle.empty()) {
            err_ << "  " << kYellow << "Cycle: " << kReset
                 << JoinCycle(error.cycle) << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.subject.empty()) {
        err_ << " [" << error.subject << "]";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (!error.cycle.empty()) {
        err_ << "  Cycle: " << JoinCycle(error.cycle) << "\n";
    }
}

void OutputFormatter::PrintWarning(const std::string& message) const {
    if (json_mode_) {
        return;
    }
    if (color_mode_) {
        err_ << kYellow << "Warning: " << kReset << message << "\n";
        return;
    }
    err_ << "Warning: " << message << "\n";
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        nlohmann::json j;
        j["success"] = true;
        j["message"] = message;
        out_ << j.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace ctekit
