#pragma once
#include <string>
#include <vector>
#include <functional>
#include <optional>
#include <nlohmann/json.hpp>

/**
 * @brief Read-only resources exposed through resources/list and resources/read.
 */
class WorkspaceResources {
public:
    struct Resource {
        std::string uri;
        std::string name;
        std::string description;
        std::function<std::string()> reader;
    };

    explicit WorkspaceResources(const std::string& workingDirectory);

    /**
     * @brief Adds workspace:///, workspace:///tasks.md and agent:///status.
     * @param statusProvider extra status lines (backend, retry statistics, ...)
     */
    void registerDefaults(std::function<nlohmann::json()> statusProvider = nullptr);

    void add(Resource resource);

    /**
     * @brief resources/list payload: [{"uri", "name", "description"}]
     */
    nlohmann::json list() const;

    /**
     * @brief Text contents of a resource, std::nullopt for unknown URIs.
     */
    std::optional<std::string> read(const std::string& uri) const;

    std::string listWorkspaceFiles() const;
    std::string readTasksFile() const;

private:
    std::string workingDirectory;
    std::vector<Resource> resources;
};
