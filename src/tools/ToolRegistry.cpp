#include "tools/ToolRegistry.h"
#include <algorithm>
#include <mutex>
#include <sstream>

void ToolRegistry::registerTool(std::shared_ptr<ITool> tool) {
    if (!tool) return;

    std::string id = tool->metadata().id;
    std::unique_lock<std::shared_mutex> lock(mtx);
    tools[id] = std::move(tool);
}

bool ToolRegistry::deregisterTool(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mtx);
    return tools.erase(id) > 0;
}

std::shared_ptr<ITool> ToolRegistry::getTool(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    auto it = tools.find(id);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second;
}

bool ToolRegistry::hasTool(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return tools.count(id) > 0;
}

size_t ToolRegistry::getToolCount() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return tools.size();
}

std::vector<ToolMetadata> ToolRegistry::listTools() const {
    std::vector<ToolMetadata> list;
    std::shared_lock<std::shared_mutex> lock(mtx);
    list.reserve(tools.size());
    // std::map 已按 id 排序
    for (const auto& [id, tool] : tools) {
        list.push_back(tool->metadata());
    }
    return list;
}

std::string ToolRegistry::generateToolDocumentation() const {
    std::ostringstream doc;
    doc << "Available tools:\n";

    for (const auto& meta : listTools()) {
        doc << "\n## " << meta.name << " (id: " << meta.id << ")\n";
        if (!meta.description.empty()) {
            doc << meta.description << "\n";
        }

        const auto& schema = meta.inputSchema;
        if (!schema.contains("properties") || !schema["properties"].is_object() || schema["properties"].empty()) {
            doc << "Parameters: none\n";
            continue;
        }

        std::vector<std::string> required;
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& r : schema["required"]) {
                if (r.is_string()) required.push_back(r.get<std::string>());
            }
        }

        doc << "Parameters:\n";
        for (const auto& [name, prop] : schema["properties"].items()) {
            std::string type = "any";
            std::string desc;
            if (prop.is_object()) {
                if (prop.contains("type") && prop["type"].is_string()) type = prop["type"].get<std::string>();
                if (prop.contains("description") && prop["description"].is_string()) desc = prop["description"].get<std::string>();
            }
            bool isRequired = std::find(required.begin(), required.end(), name) != required.end();

            doc << "- " << name << " (" << type;
            if (!isRequired) doc << ", optional";
            doc << ")";
            if (!desc.empty()) doc << ": " << desc;
            doc << "\n";
        }
    }
    return doc.str();
}
