#include "tools/ITool.h"

void to_json(nlohmann::json& j, const ToolMetadata& m) {
    j = nlohmann::json{
        {"id", m.id},
        {"name", m.name},
        {"description", m.description},
        {"category", m.category},
        {"input_schema", m.inputSchema},
        {"output_schema", m.outputSchema}
    };
}

void from_json(const nlohmann::json& j, ToolMetadata& m) {
    j.at("id").get_to(m.id);
    m.name = j.value("name", m.id);
    m.description = j.value("description", "");
    m.category = j.value("category", ToolCategory::Other);
    m.inputSchema = j.value("input_schema", nlohmann::json::object());
    m.outputSchema = j.value("output_schema", nlohmann::json::object());
}

void to_json(nlohmann::json& j, const ToolResult& r) {
    j = nlohmann::json{
        {"tool_id", r.toolId},
        {"status", r.status},
        {"output", r.output}
    };
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["error"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, ToolResult& r) {
    j.at("tool_id").get_to(r.toolId);
    j.at("status").get_to(r.status);
    r.output = j.value("output", nlohmann::json());
    if (j.contains("error") && j["error"].is_string()) {
        r.error = j["error"].get<std::string>();
    } else {
        r.error.reset();
    }
}
