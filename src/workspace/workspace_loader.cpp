#include <ctekit/workspace/workspace_loader.hpp>

#include <ctekit/core/log.hpp>
#include <ctekit/core/types.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

namespace ctekit {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "workspace";
constexpr std::string_view kMainFileName = "main.sql";

Error MakeError(const std::string& operation, const std::string& subject,
                const std::string& message, ErrorCategory category) {
    return Error{operation, subject, message, category, {}};
}

std::string_view Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string Lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

Result<std::string, Error> ReadFile(const std::string& operation,
                                    const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::string, Error>::Err(MakeError(
            operation, path.string(), "File not found", ErrorCategory::NotFound));
    }
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        return Result<std::string, Error>::Err(MakeError(
            operation, path.string(), "Cannot open file for reading",
            ErrorCategory::Io));
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return Result<std::string, Error>::Ok(oss.str());
}

// Validate the CTE identifier and append it to the workspace.
Result<void, Error> AddCte(const std::string& operation, Workspace& workspace,
                           Cte cte) {
    auto name = CteName::Create(cte.name);
    if (name.IsErr()) {
        return Result<void, Error>::Err(MakeError(
            operation, cte.name, name.Error(), ErrorCategory::InvalidName));
    }
    auto added = workspace.ctes.Add(std::move(cte));
    if (added.IsErr()) {
        auto error = std::move(added).Error();
        error.operation = operation;
        return Result<void, Error>::Err(std::move(error));
    }
    return Result<void, Error>::Ok();
}

std::string DefaultWorkspaceName(const fs::path& path) {
    auto stem = path.stem().string();
    return stem.empty() ? std::string("workspace") : stem;
}

// "user_stats.cte.sql" and "user_stats.sql" both name "user_stats".
std::string CteNameFromFile(const fs::path& path) {
    auto stem = path.stem().string();
    constexpr std::string_view kCteSuffix = ".cte";
    if (stem.size() > kCteSuffix.size() &&
        stem.compare(stem.size() - kCteSuffix.size(), kCteSuffix.size(),
                     kCteSuffix) == 0) {
        stem.erase(stem.size() - kCteSuffix.size());
    }
    return stem;
}

// -- YAML -------------------------------------------------------------------

NameList YamlNameList(const YAML::Node& node) {
    NameList names;
    if (!node) {
        return names;
    }
    for (const auto& item : node) {
        names.push_back(item.as<std::string>());
    }
    return names;
}

Result<Cte, Error> ParseYamlCte(const YAML::Node& node, size_t position) {
    const std::string op = "LoadWorkspaceYaml";
    const auto where = "ctes[" + std::to_string(position) + "]";
    if (!node.IsMap()) {
        return Result<Cte, Error>::Err(MakeError(
            op, where, "CTE entry must be a mapping", ErrorCategory::Parse));
    }
    if (!node["name"]) {
        return Result<Cte, Error>::Err(MakeError(
            op, where, "CTE entry missing 'name' field", ErrorCategory::Parse));
    }
    if (!node["query"]) {
        return Result<Cte, Error>::Err(MakeError(
            op, node["name"].as<std::string>(), "CTE entry missing 'query' field",
            ErrorCategory::Parse));
    }

    Cte cte;
    cte.name = node["name"].as<std::string>();
    cte.query = std::string(Trim(node["query"].as<std::string>()));
    cte.dependencies = YamlNameList(node["dependencies"]);
    if (node["description"]) {
        cte.description = node["description"].as<std::string>();
    }
    if (node["columns"]) {
        for (const auto& col : node["columns"]) {
            ColumnInfo info;
            info.name = col["name"].as<std::string>();
            if (col["type"]) {
                info.type = col["type"].as<std::string>();
            }
            if (col["nullable"]) {
                info.nullable = col["nullable"].as<bool>();
            }
            cte.columns.push_back(std::move(info));
        }
    }
    return Result<Cte, Error>::Ok(std::move(cte));
}

// -- JSON -------------------------------------------------------------------

Result<Cte, Error> ParseJsonCte(const nlohmann::json& j, size_t position) {
    const std::string op = "LoadWorkspaceJson";
    const auto where = "ctes[" + std::to_string(position) + "]";
    if (!j.is_object()) {
        return Result<Cte, Error>::Err(MakeError(
            op, where, "CTE entry must be an object", ErrorCategory::Parse));
    }
    if (!j.contains("name") || !j.contains("query")) {
        return Result<Cte, Error>::Err(MakeError(
            op, where, "CTE entry requires 'name' and 'query'", ErrorCategory::Parse));
    }

    Cte cte;
    cte.name = j.at("name").get<std::string>();
    cte.query = j.at("query").get<std::string>();
    if (j.contains("dependencies")) {
        cte.dependencies = j.at("dependencies").get<NameList>();
    }
    if (j.contains("description") && !j.at("description").is_null()) {
        cte.description = j.at("description").get<std::string>();
    }
    if (j.contains("columns")) {
        for (const auto& col : j.at("columns")) {
            ColumnInfo info;
            info.name = col.at("name").get<std::string>();
            info.type = col.value("type", "");
            info.nullable = col.value("nullable", true);
            cte.columns.push_back(std::move(info));
        }
    }
    return Result<Cte, Error>::Ok(std::move(cte));
}

// A parsed CTE file. `has_dependencies_header` tells an absent header apart
// from an explicit empty list.
struct CteFileContents {
    Cte cte;
    bool has_dependencies_header = false;
};

Result<CteFileContents, Error> ParseCteFileContents(std::string_view text,
                                                    std::string_view fallback_name) {
    const std::string op = "ParseCteFile";
    Cte cte;
    bool has_dependencies_header = false;
    std::optional<std::string> header_name;

    size_t pos = 0;
    while (true) {
        auto start = text.find_first_not_of(" \t\r\n", pos);
        if (start == std::string_view::npos || text.substr(start, 2) != "/*") {
            break;
        }
        auto close = text.find("*/", start + 2);
        if (close == std::string_view::npos) {
            break;
        }
        auto inner = Trim(text.substr(start + 2, close - start - 2));
        auto colon = inner.find(':');
        if (colon == std::string_view::npos) {
            break;
        }
        auto key = Trim(inner.substr(0, colon));
        auto value = Trim(inner.substr(colon + 1));

        if (key == "name") {
            header_name = std::string(value);
        } else if (key == "description") {
            cte.description = std::string(value);
        } else if (key == "dependencies") {
            try {
                auto deps = nlohmann::json::parse(value);
                cte.dependencies = deps.get<NameList>();
                has_dependencies_header = true;
            } catch (const nlohmann::json::exception& e) {
                return Result<CteFileContents, Error>::Err(MakeError(
                    op, header_name.value_or(std::string(fallback_name)),
                    "Invalid dependencies header (expected a JSON array of names): " +
                        std::string(e.what()),
                    ErrorCategory::Parse));
            }
        } else {
            // An ordinary comment: it belongs to the body.
            break;
        }
        pos = close + 2;
    }

    cte.name = header_name.value_or(std::string(fallback_name));
    cte.query = std::string(Trim(text.substr(std::min(pos, text.size()))));
    if (cte.name.empty()) {
        return Result<CteFileContents, Error>::Err(MakeError(
            op, "", "CTE file has no name header and no fallback name",
            ErrorCategory::InvalidName));
    }
    return Result<CteFileContents, Error>::Ok(
        CteFileContents{std::move(cte), has_dependencies_header});
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadWorkspaceYaml
// ---------------------------------------------------------------------------
Result<Workspace, Error> LoadWorkspaceYaml(std::string_view path) {
    const std::string op = "LoadWorkspaceYaml";
    auto text = ReadFile(op, fs::path(std::string(path)));
    if (text.IsErr()) {
        return Result<Workspace, Error>::Err(std::move(text).Error());
    }

    Workspace workspace;
    try {
        const YAML::Node root = YAML::Load(text.Value());
        if (!root.IsMap()) {
            return Result<Workspace, Error>::Err(MakeError(
                op, std::string(path), "Workspace document must be a mapping",
                ErrorCategory::Parse));
        }

        workspace.name = root["name"] ? root["name"].as<std::string>()
                                      : DefaultWorkspaceName(std::string(path));
        if (const auto main = root["main"]) {
            if (main["query"]) {
                workspace.main_query = std::string(Trim(main["query"].as<std::string>()));
            }
            workspace.main_dependencies = YamlNameList(main["dependencies"]);
        }

        if (const auto ctes = root["ctes"]) {
            if (!ctes.IsSequence()) {
                return Result<Workspace, Error>::Err(MakeError(
                    op, "ctes", "'ctes' must be a sequence", ErrorCategory::Parse));
            }
            size_t position = 0;
            for (const auto& node : ctes) {
                auto cte = ParseYamlCte(node, position++);
                if (cte.IsErr()) {
                    return Result<Workspace, Error>::Err(std::move(cte).Error());
                }
                auto added = AddCte(op, workspace, std::move(cte).Value());
                if (added.IsErr()) {
                    return Result<Workspace, Error>::Err(std::move(added).Error());
                }
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<Workspace, Error>::Err(MakeError(
            op, std::string(path), "Failed to parse YAML: " + std::string(e.what()),
            ErrorCategory::Parse));
    }

    LogInfo(kComponent, "loaded " + std::to_string(workspace.ctes.Size()) +
                            " CTE(s) from " + std::string(path));
    return Result<Workspace, Error>::Ok(std::move(workspace));
}

// ---------------------------------------------------------------------------
// LoadWorkspaceJson
// ---------------------------------------------------------------------------
Result<Workspace, Error> LoadWorkspaceJson(std::string_view path) {
    const std::string op = "LoadWorkspaceJson";
    auto text = ReadFile(op, fs::path(std::string(path)));
    if (text.IsErr()) {
        return Result<Workspace, Error>::Err(std::move(text).Error());
    }

    Workspace workspace;
    try {
        const auto root = nlohmann::json::parse(text.Value());
        if (!root.is_object()) {
            return Result<Workspace, Error>::Err(MakeError(
                op, std::string(path), "Workspace document must be an object",
                ErrorCategory::Parse));
        }

        workspace.name = root.value("name", DefaultWorkspaceName(std::string(path)));
        if (root.contains("main")) {
            const auto& main = root.at("main");
            workspace.main_query = main.value("query", "");
            if (main.contains("dependencies")) {
                workspace.main_dependencies = main.at("dependencies").get<NameList>();
            }
        }

        if (root.contains("ctes")) {
            const auto& ctes = root.at("ctes");
            if (!ctes.is_array()) {
                return Result<Workspace, Error>::Err(MakeError(
                    op, "ctes", "'ctes' must be an array", ErrorCategory::Parse));
            }
            for (size_t i = 0; i < ctes.size(); ++i) {
                auto cte = ParseJsonCte(ctes[i], i);
                if (cte.IsErr()) {
                    return Result<Workspace, Error>::Err(std::move(cte).Error());
                }
                auto added = AddCte(op, workspace, std::move(cte).Value());
                if (added.IsErr()) {
                    return Result<Workspace, Error>::Err(std::move(added).Error());
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<Workspace, Error>::Err(MakeError(
            op, std::string(path), "Failed to parse JSON: " + std::string(e.what()),
            ErrorCategory::Parse));
    }

    LogInfo(kComponent, "loaded " + std::to_string(workspace.ctes.Size()) +
                            " CTE(s) from " + std::string(path));
    return Result<Workspace, Error>::Ok(std::move(workspace));
}

// ---------------------------------------------------------------------------
// LoadCteDirectory
// ---------------------------------------------------------------------------
Result<Workspace, Error> LoadCteDirectory(std::string_view path) {
    const std::string op = "LoadCteDirectory";
    const fs::path dir{std::string(path)};

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return Result<Workspace, Error>::Err(MakeError(
            op, dir.string(), "Directory not found", ErrorCategory::NotFound));
    }
    if (!fs::is_directory(dir, ec)) {
        return Result<Workspace, Error>::Err(MakeError(
            op, dir.string(), "Not a directory", ErrorCategory::Io));
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && Lowercase(it->path().extension().string()) == ".sql") {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return Result<Workspace, Error>::Err(MakeError(
            op, dir.string(), "Cannot list directory: " + ec.message(),
            ErrorCategory::Io));
    }
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    Workspace workspace;
    workspace.name = dir.filename().empty() ? dir.parent_path().filename().string()
                                            : dir.filename().string();
    std::optional<CteFileContents> main;

    for (const auto& file : files) {
        auto text = ReadFile(op, file);
        if (text.IsErr()) {
            return Result<Workspace, Error>::Err(std::move(text).Error());
        }
        const bool is_main = file.filename().string() == kMainFileName;
        auto parsed = ParseCteFileContents(text.Value(),
                                           is_main ? "main" : CteNameFromFile(file));
        if (parsed.IsErr()) {
            auto error = std::move(parsed).Error();
            error.subject = file.string();
            return Result<Workspace, Error>::Err(std::move(error));
        }
        if (is_main) {
            main = std::move(parsed).Value();
            continue;
        }
        auto added = AddCte(op, workspace, std::move(parsed).Value().cte);
        if (added.IsErr()) {
            return Result<Workspace, Error>::Err(std::move(added).Error());
        }
        LogDebug(kComponent, "read " + file.filename().string());
    }

    if (main.has_value()) {
        workspace.main_query = std::move(main->cte.query);
        // Without a dependencies header the main query is assumed to use
        // every CTE of the directory. An explicit [] means none.
        workspace.main_dependencies = main->has_dependencies_header
                                          ? std::move(main->cte.dependencies)
                                          : workspace.ctes.Names();
    }

    LogInfo(kComponent, "loaded " + std::to_string(workspace.ctes.Size()) +
                            " CTE(s) from directory " + dir.string());
    return Result<Workspace, Error>::Ok(std::move(workspace));
}

// ---------------------------------------------------------------------------
// LoadWorkspace
// ---------------------------------------------------------------------------
Result<Workspace, Error> LoadWorkspace(std::string_view path) {
    const fs::path p{std::string(path)};
    std::error_code ec;
    if (fs::is_directory(p, ec)) {
        return LoadCteDirectory(path);
    }

    const auto ext = Lowercase(p.extension().string());
    if (ext == ".yaml" || ext == ".yml") {
        return LoadWorkspaceYaml(path);
    }
    if (ext == ".json") {
        return LoadWorkspaceJson(path);
    }
    return Result<Workspace, Error>::Err(MakeError(
        "LoadWorkspace", p.string(),
        "Unsupported workspace format (expected .yaml, .yml, .json or a directory)",
        ErrorCategory::Config));
}

// ---------------------------------------------------------------------------
// ParseCteFile / FormatCteFile
// ---------------------------------------------------------------------------
Result<Cte, Error> ParseCteFile(std::string_view text,
                                std::string_view fallback_name) {
    auto file = ParseCteFileContents(text, fallback_name);
    if (file.IsErr()) {
        return Result<Cte, Error>::Err(std::move(file).Error());
    }
    return Result<Cte, Error>::Ok(std::move(file).Value().cte);
}

std::string FormatCteFile(const Cte& cte) {
    std::string out;
    out += "/* name: " + cte.name + " */\n";
    if (cte.description.has_value()) {
        out += "/* description: " + *cte.description + " */\n";
    }
    out += "/* dependencies: " + nlohmann::json(cte.dependencies).dump() + " */\n";
    out += cte.query;
    out += "\n";
    return out;
}

// ---------------------------------------------------------------------------
// WorkspaceToJson
// ---------------------------------------------------------------------------
nlohmann::json WorkspaceToJson(const Workspace& workspace) {
    nlohmann::json j;
    j["name"] = workspace.name;
    j["main"] = {{"query", workspace.main_query},
                 {"dependencies", workspace.main_dependencies}};

    auto ctes = nlohmann::json::array();
    for (const auto& cte : workspace.ctes) {
        nlohmann::json item;
        item["name"] = cte.name;
        item["query"] = cte.query;
        item["dependencies"] = cte.dependencies;
        if (cte.description.has_value()) {
            item["description"] = *cte.description;
        }
        if (!cte.columns.empty()) {
            auto columns = nlohmann::json::array();
            for (const auto& col : cte.columns) {
                columns.push_back({{"name", col.name},
                                   {"type", col.type},
                                   {"nullable", col.nullable}});
            }
            item["columns"] = std::move(columns);
        }
        ctes.push_back(std::move(item));
    }
    j["ctes"] = std::move(ctes);
    return j;
}

} // namespace ctekit
