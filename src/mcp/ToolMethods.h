#pragma once
#include <memory>
#include "mcp/MethodDispatcher.h"
#include "tools/ToolCoordinator.h"

constexpr const char* TOOLS_LIST_METHOD = "tools.list";
constexpr const char* TOOLS_EXECUTE_METHOD = "tools.execute";

/**
 * @brief 在分发器上注册 tools.list 与 tools.execute
 *
 * tools.list    -> 全部 ToolMetadata 数组 (按 id 排序)
 * tools.execute -> params {tool_id, params}; 返回 ToolResult。
 *                  参数缺失或不符合工具的 input_schema 返回 InvalidParams;
 *                  工具不存在返回错误码 1000 "Tool execution failed: <reason>"。
 *                  工具自身的失败与超时仍是成功响应, 体现在 ToolResult.status 里。
 */
void registerToolMethods(MethodDispatcher& dispatcher, std::shared_ptr<ToolCoordinator> coordinator);

Response handleListTools(const Request& request, ToolRegistry& registry);
Response handleExecuteTool(const Request& request, ToolCoordinator& coordinator);
