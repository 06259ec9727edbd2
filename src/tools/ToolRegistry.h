#pragma once
#include <string>
#include <memory>
#include <map>
#include <shared_mutex>
#include <vector>
#include "tools/ITool.h"

/**
 * @brief 工具注册中心
 *
 * 按 metadata().id 管理全部工具。协调器与 tools.* 方法共享同一个实例,
 * 读多写少, 用读写锁保护。
 */
class ToolRegistry {
public:
    ToolRegistry() = default;

    /**
     * @brief 注册一个工具, id 相同则替换
     */
    void registerTool(std::shared_ptr<ITool> tool);

    /**
     * @return 工具原本是否存在
     */
    bool deregisterTool(const std::string& id);

    /**
     * @return 不存在时返回 nullptr
     */
    std::shared_ptr<ITool> getTool(const std::string& id) const;

    bool hasTool(const std::string& id) const;

    size_t getToolCount() const;

    /**
     * @brief 全部工具的元数据, 按 id 排序
     */
    std::vector<ToolMetadata> listTools() const;

    /**
     * @brief 生成给模型看的工具说明
     *
     * 每个工具一段: 名称、描述、参数 (类型、说明, 非必填的标注 optional)。
     */
    std::string generateToolDocumentation() const;

private:
    std::map<std::string, std::shared_ptr<ITool>> tools;
    mutable std::shared_mutex mtx;
};
