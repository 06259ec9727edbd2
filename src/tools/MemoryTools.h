#pragma once
#include "tools/ITool.h"

/**
 * @brief 写入进程内资源 memory://<key>
 *
 * 参数: key (必填), content (必填), append (可选, 默认覆盖)
 */
class MemoryWriteTool : public ITool {
public:
    ToolMetadata metadata() const override;
    ToolResult execute(const nlohmann::json& params, ResourceManager& resources) override;
};

/**
 * @brief 读取进程内资源 memory://<key>
 */
class MemoryReadTool : public ITool {
public:
    ToolMetadata metadata() const override;
    ToolResult execute(const nlohmann::json& params, ResourceManager& resources) override;
};
