#include "tools/MemoryTools.h"
#include "resources/ResourceManager.h"

namespace {
std::string memoryUri(const std::string& key) {
    return std::string(ResourceManager::MEMORY_SCHEME) + key;
}
} // namespace

ToolMetadata MemoryWriteTool::metadata() const {
    ToolMetadata meta;
    meta.id = "memory_write";
    meta.name = "memory_write";
    meta.description = "Store text under a key in session memory. Set append=true to add to existing content.";
    meta.category = ToolCategory::Memory;
    meta.inputSchema = {
        {"type", "object"},
        {"properties", {
            {"key", {{"type", "string"}, {"description", "Memory key"}}},
            {"content", {{"type", "string"}, {"description", "Text to store"}}},
            {"append", {{"type", "boolean"}, {"description", "Append instead of overwrite"}}}
        }},
        {"required", nlohmann::json::array({"key", "content"})}
    };
    meta.outputSchema = {
        {"type", "object"},
        {"properties", {
            {"uri", {{"type", "string"}}},
            {"bytes", {{"type", "integer"}}}
        }}
    };
    return meta;
}

ToolResult MemoryWriteTool::execute(const nlohmann::json& params, ResourceManager& resources) {
    const std::string id = "memory_write";
    if (!params.contains("key") || !params["key"].is_string()) {
        return ToolResult::failure(id, "Missing required parameter: key");
    }
    if (!params.contains("content") || !params["content"].is_string()) {
        return ToolResult::failure(id, "Missing required parameter: content");
    }

    std::string uri = memoryUri(params["key"].get<std::string>());
    std::string content = params["content"].get<std::string>();
    bool append = params.contains("append") && params["append"].is_boolean() && params["append"].get<bool>();

    try {
        if (append) {
            resources.append(uri, content);
        } else {
            resources.write(uri, content);
        }
        size_t bytes = resources.read(uri).size();
        return ToolResult::success(id, {{"uri", uri}, {"bytes", bytes}});
    } catch (const ResourceError& e) {
        return ToolResult::failure(id, e.what());
    }
}

ToolMetadata MemoryReadTool::metadata() const {
    ToolMetadata meta;
    meta.id = "memory_read";
    meta.name = "memory_read";
    meta.description = "Read text previously stored with memory_write.";
    meta.category = ToolCategory::Memory;
    meta.inputSchema = {
        {"type", "object"},
        {"properties", {
            {"key", {{"type", "string"}, {"description", "Memory key"}}}
        }},
        {"required", nlohmann::json::array({"key"})}
    };
    meta.outputSchema = {
        {"type", "object"},
        {"properties", {
            {"uri", {{"type", "string"}}},
            {"content", {{"type", "string"}}}
        }}
    };
    return meta;
}

ToolResult MemoryReadTool::execute(const nlohmann::json& params, ResourceManager& resources) {
    const std::string id = "memory_read";
    if (!params.contains("key") || !params["key"].is_string()) {
        return ToolResult::failure(id, "Missing required parameter: key");
    }

    std::string uri = memoryUri(params["key"].get<std::string>());
    try {
        return ToolResult::success(id, {{"uri", uri}, {"content", resources.read(uri)}});
    } catch (const ResourceError& e) {
        return ToolResult::failure(id, e.what());
    }
}
