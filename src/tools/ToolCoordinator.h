#pragma once
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include "tools/ITool.h"
#include "tools/ToolRegistry.h"
#include "resources/ResourceManager.h"
#include "utils/Logger.h"
#include "utils/Metrics.h"

/**
 * @brief 工具执行协调器
 *
 * 1. 指纹去重: 同一轮对话内, (tool_id, 规范化参数) 相同的调用只放行一次。
 *    新一轮开始时由调用方 clear()。
 * 2. 执行: 工具体在工作线程上运行, 超时返回 Timeout, 但不会中断正在运行的工具。
 *
 * 注册表与资源存储是共享的, 协调器只持有引用计数。
 *
 * 每次 execute 更新指标: tool.executions.total / tool.executions.<id>,
 * 结果计入 tool.executions.success 或 tool.executions.failure (+ tool.failures.<id>),
 * 耗时写入 tool.execution_time.<id>。
 */
class ToolCoordinator {
public:
    using Clock = std::chrono::steady_clock;

    ToolCoordinator(std::shared_ptr<ToolRegistry> registry,
                    std::shared_ptr<ResourceManager> resources,
                    std::shared_ptr<Logger> logger = nullptr,
                    std::chrono::milliseconds defaultTimeout = std::chrono::seconds(180),
                    std::shared_ptr<MetricsRegistry> metrics = nullptr);

    /**
     * @brief 指纹 = fnv1a64(toolId + '\0' + params.dump())
     *
     * nlohmann::json 的对象键有序, dump() 即规范化序列化。
     */
    static std::uint64_t fingerprint(const std::string& toolId, const nlohmann::json& params);

    /**
     * @return 首次出现返回 true 并记录指纹; 重复返回 false, 不改变状态
     */
    bool shouldExecute(const std::string& toolId, const nlohmann::json& params);

    void clear();

    size_t fingerprintCount() const;

    /**
     * @brief 同步执行工具, 不抛异常
     *
     * - 未注册: Failure "Tool '<id>' not found"
     * - 工具抛出任何其他异常: Failure
     * - 工具抛 ToolTimeoutError 或超过 timeout: Timeout
     */
    ToolResult execute(const std::string& toolId,
                       const nlohmann::json& params,
                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief 在独立线程上执行, 用于事件循环线程; 协调器需活到 future 就绪
     */
    std::future<ToolResult> executeAsync(const std::string& toolId,
                                         const nlohmann::json& params,
                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::shared_ptr<ToolRegistry> getRegistry() const { return registry; }
    std::shared_ptr<ResourceManager> getResources() const { return resources; }
    std::shared_ptr<MetricsRegistry> getMetrics() const { return metrics; }

private:
    std::shared_ptr<ToolRegistry> registry;
    std::shared_ptr<ResourceManager> resources;
    std::shared_ptr<Logger> logger;
    std::chrono::milliseconds defaultTimeout;
    std::shared_ptr<MetricsRegistry> metrics;

    std::unordered_set<std::uint64_t> fingerprints;
    mutable std::mutex mtx;

    static ToolResult runTool(const std::shared_ptr<ITool>& tool,
                              const std::string& toolId,
                              const nlohmann::json& params,
                              ResourceManager& resources);

    void recordOutcome(const std::string& toolId, const ToolResult& result, std::chrono::milliseconds elapsed);
};
