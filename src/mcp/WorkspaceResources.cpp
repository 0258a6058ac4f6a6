#include "mcp/WorkspaceResources.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

WorkspaceResources::WorkspaceResources(const std::string& workingDirectory)
    : workingDirectory(workingDirectory) {}

void WorkspaceResources::registerDefaults(std::function<nlohmann::json()> statusProvider) {
    add({"workspace:///", "Current Workspace", "Files in the current working directory",
         [this]() { return listWorkspaceFiles(); }});

    add({"workspace:///tasks.md", "Tasks File", "Current tasks.md file if it exists",
         [this]() { return readTasksFile(); }});

    add({"agent:///status", "Agent Status", "Current status of the coding agents and retry engine",
         [this, statusProvider]() {
             nlohmann::json status = {{"working_directory", workingDirectory}};
             if (statusProvider) {
                 nlohmann::json extra = statusProvider();
                 if (extra.is_object()) status.update(extra);
             }
             return status.dump(2);
         }});
}

void WorkspaceResources::add(Resource resource) {
    auto it = std::find_if(resources.begin(), resources.end(),
                           [&](const Resource& r) { return r.uri == resource.uri; });
    if (it != resources.end()) {
        *it = std::move(resource);
        return;
    }
    resources.push_back(std::move(resource));
}

nlohmann::json WorkspaceResources::list() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : resources) {
        out.push_back({{"uri", r.uri}, {"name", r.name}, {"description", r.description}});
    }
    return out;
}

std::optional<std::string> WorkspaceResources::read(const std::string& uri) const {
    for (const auto& r : resources) {
        if (r.uri == uri) {
            return r.reader ? r.reader() : std::string();
        }
    }
    return std::nullopt;
}

std::string WorkspaceResources::listWorkspaceFiles() const {
    fs::path root = fs::u8path(workingDirectory);
    std::vector<std::string> files;
    std::error_code ec;

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return "Error reading workspace: " + ec.message();
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) break;
        std::string name = it->path().filename().u8string();
        // Hidden entries, and everything under hidden directories, are skipped
        if (!name.empty() && name[0] == '.') {
            if (it->is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file(ec)) {
            files.push_back(fs::relative(it->path(), root, ec).generic_u8string());
        }
    }
    std::sort(files.begin(), files.end());

    std::ostringstream out;
    out << "Files in workspace:";
    for (const auto& f : files) out << "\n" << f;
    return out.str();
}

std::string WorkspaceResources::readTasksFile() const {
    fs::path taskPath = fs::u8path(workingDirectory) / "tasks.md";
    std::ifstream f(taskPath);
    if (!f.is_open()) {
        return "No tasks.md file found in the current directory";
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return content;
}
