#include "mcp/ToolMethods.h"
#include "protocol/Validation.h"

void registerToolMethods(MethodDispatcher& dispatcher, std::shared_ptr<ToolCoordinator> coordinator) {
    dispatcher.registerMethod(TOOLS_LIST_METHOD, [coordinator](const Request& request) {
        return handleListTools(request, *coordinator->getRegistry());
    });
    dispatcher.registerMethod(TOOLS_EXECUTE_METHOD, [coordinator](const Request& request) {
        return handleExecuteTool(request, *coordinator);
    });
}

Response handleListTools(const Request& request, ToolRegistry& registry) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& meta : registry.listTools()) {
        tools.push_back(meta);
    }
    return Response::success(std::move(tools), request.responseId());
}

Response handleExecuteTool(const Request& request, ToolCoordinator& coordinator) {
    JsonRpcId id = request.responseId();

    if (!request.params || !request.params->is_object()) {
        return Response::invalidParams(id);
    }
    const auto& params = *request.params;

    if (!params.contains("tool_id") || !params["tool_id"].is_string()) {
        return Response::invalidParams(id);
    }
    if (!params.contains("params") || !params["params"].is_object()) {
        return Response::invalidParams(id);
    }

    std::string toolId = params["tool_id"].get<std::string>();
    const auto& toolParams = params["params"];

    auto tool = coordinator.getRegistry()->getTool(toolId);
    if (!tool) {
        RpcError err{TOOL_LAYER_FAILURE_CODE, "Tool execution failed: Tool '" + toolId + "' not found", std::nullopt};
        return Response::error(std::move(err), id);
    }

    if (auto schemaError = validateAgainstSchema(toolParams, tool->metadata().inputSchema)) {
        return Response::error(*schemaError, id);
    }

    ToolResult result = coordinator.execute(toolId, toolParams);
    return Response::success(nlohmann::json(result), id);
}
