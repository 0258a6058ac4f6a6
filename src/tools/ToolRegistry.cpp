#include "ToolRegistry.h"

namespace {
bool matchesType(const nlohmann::json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "array") return value.is_array();
    if (type == "object") return value.is_object();
    return true;
}
} // namespace

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) {
        throw std::invalid_argument("Cannot register a null tool");
    }
    if (frozen) {
        throw std::logic_error("Tool registry is frozen; cannot register " + tool->getName());
    }

    std::string name = tool->getName();
    if (tools.count(name)) {
        throw DuplicateToolError(name);
    }

    order.push_back(name);
    tools[name] = std::move(tool);
}

ITool* ToolRegistry::getTool(const std::string& name) const {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.get();
}

nlohmann::json ToolRegistry::listTools() const {
    nlohmann::json list = nlohmann::json::array();

    for (const auto& name : order) {
        const auto& tool = tools.at(name);
        list.push_back({
            {"name", tool->getName()},
            {"description", tool->getDescription()},
            {"inputSchema", tool->getSchema()}
        });
    }

    return list;
}

std::vector<std::string> ToolRegistry::missingRequiredArguments(const std::string& name,
                                                                const nlohmann::json& args) const {
    std::vector<std::string> missing;
    ITool* tool = getTool(name);
    if (!tool) return missing;

    nlohmann::json schema = tool->getSchema();
    if (!schema.contains("required") || !schema["required"].is_array()) {
        return missing;
    }

    nlohmann::json properties = schema.value("properties", nlohmann::json::object());
    for (const auto& field : schema["required"]) {
        if (!field.is_string()) continue;
        std::string key = field.get<std::string>();

        if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
            missing.push_back(key);
            continue;
        }
        if (properties.contains(key) && properties[key].contains("type") &&
            properties[key]["type"].is_string()) {
            std::string type = properties[key]["type"].get<std::string>();
            if (!matchesType(args[key], type)) {
                missing.push_back(key + " (expected " + type + ")");
            }
        }
    }
    return missing;
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
